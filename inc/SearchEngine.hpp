#ifndef SEARCH_ENGINE_H
#define SEARCH_ENGINE_H

#include <cstdint>
#include <vector>
#include "Propagator.hpp"
#include "SolveStats.hpp"
#include "SudokuBoard.hpp"

enum class SearchStatus : uint8_t {
  Exhausted = 0,     // every branch explored
  LimitReached = 1,  // stopped at the solution cap
  Aborted = 2        // node budget exceeded
};

// Depth-first backtracking over propagated boards. Branches on the unknown
// cell with the fewest candidates (lowest index on ties), digits ascending.
// Every child works on its own copy of the board.
class SearchEngine
{
public:
  SearchEngine(Propagator &propagator, int maxSolutions, uint64_t maxNodes);

  // root is expected to be propagated already; solutions is cleared first
  SearchStatus search(const SudokuBoard &root, std::vector<SudokuBoard> &solutions,
                      SolveStats *stats = nullptr);

  // Cell to branch on, -1 if the board is complete. Sets *deadEnd when some
  // unknown cell has no candidates left.
  static Index selectBranchCell(const SudokuBoard &board, bool *deadEnd);

private:
  Propagator &propagator;
  int maxSolutions;
  uint64_t maxNodes;

  // per-search state
  std::vector<SudokuBoard> *found;
  SolveStats *stats;
  bool aborted;

  // returns false once the search must stop
  bool _searchNode(const SudokuBoard &board, int depth);
};

#endif // SEARCH_ENGINE_H
