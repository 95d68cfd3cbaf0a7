#ifndef SOLVE_STATS_H
#define SOLVE_STATS_H

#include <cstdint>
#include "Event.hpp"

// Counters collected during one solve() call.
struct SolveStats {
  uint64_t nodes;           // search nodes entered (the root counts as one)
  uint64_t guesses;         // branch assignments tried
  uint64_t contradictions;  // dead ends met by propagation or search
  int maxDepth;
  uint64_t applied[REASON_COUNT];  // deductions applied, per rule

  SolveStats() : nodes(0), guesses(0), contradictions(0), maxDepth(0) {
    for (int i = 0; i < REASON_COUNT; i++) {
      applied[i] = 0;
    }
  }

  uint64_t count(ReasonId reason) const {
    return applied[static_cast<int>(reason)];
  }
};

#endif // SOLVE_STATS_H
