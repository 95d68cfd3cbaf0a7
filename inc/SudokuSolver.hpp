#ifndef SUDOKU_SOLVER_H
#define SUDOKU_SOLVER_H

#include <cstdint>
#include <string>
#include "Outcome.hpp"
#include "SolverConfig.hpp"

// Propagation + search in one call. Holds only configuration, so one
// instance may serve concurrent solve() calls.
class SudokuSolver
{
public:
  SudokuSolver();

  explicit SudokuSolver(const SolverConfig &config);

  const SolverConfig &getConfig() const;

  // values[81]: 0 = empty, 1..9 = given
  Outcome solve(const uint8_t *values) const;

  Outcome solve(const uint8_t rows[9][9]) const;

  // Number of completions, stopping at limit. Returns -1 for invalid input
  // or when the node budget runs out first.
  int countSolutions(const uint8_t *values, int limit) const;

private:
  SolverConfig config;
};

// Complete grid, every unit a permutation of 1..9, givens preserved.
bool isValidSolution(const uint8_t *givens, const uint8_t *grid, std::string *why = nullptr);

#endif // SUDOKU_SOLVER_H
