#include "SearchEngine.hpp"
#include "log.hpp"

// =========================================================
// SearchEngine
// =========================================================

SearchEngine::SearchEngine(Propagator &propagator, int maxSolutions, uint64_t maxNodes)
  : propagator(propagator),
    maxSolutions(maxSolutions < 1 ? 1 : maxSolutions),
    maxNodes(maxNodes),
    found(nullptr),
    stats(nullptr),
    aborted(false) { }

SearchStatus SearchEngine::search(const SudokuBoard &root, std::vector<SudokuBoard> &solutions,
                                  SolveStats *stats) {
  SolveStats local;
  this->found = &solutions;
  this->stats = stats ? stats : &local;
  this->aborted = false;

  solutions.clear();
  const bool finished = _searchNode(root, 0);

  this->found = nullptr;
  this->stats = nullptr;

  if (aborted) {
    SUDOCORE_LOG(LogLevel::Info, "search aborted after %llu nodes",
                 (unsigned long long)maxNodes);
    return SearchStatus::Aborted;
  }
  if (!finished) {
    return SearchStatus::LimitReached;
  }
  return SearchStatus::Exhausted;
}

Index SearchEngine::selectBranchCell(const SudokuBoard &board, bool *deadEnd) {
  Index best = -1;
  size_t bestCount = 10;
  if (deadEnd) {
    *deadEnd = false;
  }

  for (Index idx = 0; idx < 81; idx++) {
    if (board.isSolved(idx)) {
      continue;
    }
    const size_t n = board.countCandidates(idx);
    if (n == 0) {
      if (deadEnd) {
        *deadEnd = true;
      }
      return idx;
    }
    // strict comparison keeps the lowest index on ties
    if (n < bestCount) {
      best = idx;
      bestCount = n;
      if (n == 1) {
        break;
      }
    }
  }
  return best;
}

bool SearchEngine::_searchNode(const SudokuBoard &board, int depth) {
  if (maxNodes != 0 && stats->nodes >= maxNodes) {
    aborted = true;
    return false;
  }
  stats->nodes++;
  if (depth > stats->maxDepth) {
    stats->maxDepth = depth;
  }

  // accept
  if (board.isComplete()) {
    found->push_back(board);
    SUDOCORE_LOG(LogLevel::Debug, "solution %zu found at depth %d", found->size(), depth);
    return found->size() < (size_t)maxSolutions;
  }

  bool deadEnd = false;
  const Index idx = selectBranchCell(board, &deadEnd);
  if (deadEnd || idx < 0) {
    stats->contradictions++;
    return true;
  }

  // branch
  const CandidateSet cands = board.getCandidates(idx);
  for (Digit digit = cands.next(0); digit != 0; digit = cands.next(digit)) {
    SudokuBoard child = board;
    stats->guesses++;

    if (propagator.assignAndPropagate(child, idx, digit, ReasonId::Search, stats) ==
        PropagationResult::Contradiction) {
      // reject
      stats->contradictions++;
      continue;
    }

    if (!_searchNode(child, depth + 1)) {
      return false;
    }
  }

  return true;
}
