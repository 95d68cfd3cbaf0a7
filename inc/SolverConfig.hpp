#ifndef SOLVER_CONFIG_H
#define SOLVER_CONFIG_H

#include <cstdint>

// Propagation rules; naked and hidden single are always enabled.
enum TechniqueFlags : uint32_t {
  TECH_FULL_HOUSE    = 1u << 0,
  TECH_NAKED_SINGLE  = 1u << 1,
  TECH_HIDDEN_SINGLE = 1u << 2,
  TECH_POINTING      = 1u << 3,
  TECH_BOX_LINE      = 1u << 4,
  TECH_NAKED_PAIR    = 1u << 5,

  TECH_SINGLES       = TECH_NAKED_SINGLE | TECH_HIDDEN_SINGLE,
  TECH_ALL           = 0x3Fu
};

static constexpr uint64_t DEFAULT_MAX_NODES = 2000000;

struct SolverConfig {
  int maxSolutions;      // stop the search after this many solutions
  uint64_t maxNodes;     // node budget, 0 = unlimited
  uint32_t techniques;   // TechniqueFlags
  bool verifySolutions;  // re-check every solved grid before returning it

  SolverConfig()
    : maxSolutions(2),
      maxNodes(DEFAULT_MAX_NODES),
      techniques(TECH_ALL),
      verifySolutions(true) { }
};

#endif // SOLVER_CONFIG_H
