#ifndef PROPAGATOR_H
#define PROPAGATOR_H

#include <cstdint>
#include "EventQueue.hpp"
#include "SolveStats.hpp"
#include "SolverConfig.hpp"
#include "SudokuBoard.hpp"

enum class PropagationResult : uint8_t {
  Quiescent = 0,     // no rule applies any more (possibly complete)
  Contradiction = 1  // the current assignment cannot be completed
};

// Applies the enabled deduction rules until a fixed point or a contradiction.
// Not re-entrant: one instance serves one search at a time.
class Propagator
{
public:
  explicit Propagator(uint32_t techniques = TECH_ALL);

  uint32_t getTechniques() const;

  PropagationResult propagate(SudokuBoard &board, SolveStats *stats = nullptr);

  // assign idx := digit, then propagate
  PropagationResult assignAndPropagate(SudokuBoard &board, Index idx, Digit digit,
                                       ReasonId reason, SolveStats *stats = nullptr);

private:
  uint32_t techniques;
  EventQueue queue;

  PropagationResult _run(SudokuBoard &board, SolveStats *stats);

  bool _apply(SudokuBoard &board, const Event &ev, SolveStats *stats);
};

#endif // PROPAGATOR_H
