#ifndef OUTCOME_H
#define OUTCOME_H

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include "SolveStats.hpp"

// 81 digits, row-major, 0 = empty
typedef std::array<uint8_t, 81> Grid;

enum class OutcomeStatus : int {
  Solved = 0,
  Unsolvable = 1,
  MultipleSolutions = 2,
  InvalidInput = 3,
  SearchAborted = 4
};

const char *outcomeName(OutcomeStatus status);

struct Outcome {
  OutcomeStatus status;

  // Solved: the solution. MultipleSolutions: the first completions found, in
  // search order (at least two). SearchAborted: whatever was found before the
  // budget ran out. Empty otherwise.
  std::vector<Grid> solutions;

  // InvalidInput / SearchAborted: what went wrong
  std::string reason;

  SolveStats stats;

  Outcome() : status(OutcomeStatus::Unsolvable) { }

  bool isSolved() const;

  // first solution; throws std::logic_error if there is none
  const Grid &solution() const;
};

std::ostream &operator<<(std::ostream &os, const Outcome &outcome);

#endif // OUTCOME_H
