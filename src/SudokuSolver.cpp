#include "SudokuSolver.hpp"
#include "Propagator.hpp"
#include "SearchEngine.hpp"
#include "SudokuBoard.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

// =========================================================
// Helpers
// =========================================================

namespace {

Grid toGrid(const SudokuBoard &board) {
  Grid grid;
  board.exportValues(grid.data());
  return grid;
}

bool checkUnit(const int *cells, const uint8_t *grid, std::string *why) {
  Mask seen = 0;
  for (int k = 0; k < 9; k++) {
    const int idx = cells[k];
    const uint8_t d = grid[idx];
    if (d < 1 || d > 9) {
      if (why) {
        std::ostringstream oss;
        oss << "Non-digit in solution at idx=" << idx;
        *why = oss.str();
      }
      return false;
    }
    const Mask b = digitToBit(d);
    if ((seen & b) != 0) {
      if (why) {
        std::ostringstream oss;
        oss << "Duplicate digit " << (int)d << " in unit";
        *why = oss.str();
      }
      return false;
    }
    seen = static_cast<Mask>(seen | b);
  }
  return true;
}

void verifyOrThrow(const uint8_t *givens, const Grid &grid) {
  std::string why;
  if (!isValidSolution(givens, grid.data(), &why)) {
    SUDOCORE_LOG(LogLevel::Error, "solver produced an invalid grid: %s", why.c_str());
    throw std::logic_error("solver produced an invalid grid: " + why);
  }
}

} // namespace

bool isValidSolution(const uint8_t *givens, const uint8_t *grid, std::string *why) {
  // Check givens are preserved
  if (givens != nullptr) {
    for (int i = 0; i < 81; i++) {
      if (givens[i] != 0 && givens[i] != grid[i]) {
        if (why) {
          std::ostringstream oss;
          oss << "Given mismatch at idx=" << i << " (in=" << (int)givens[i] << ", out=" << (int)grid[i] << ")";
          *why = oss.str();
        }
        return false;
      }
    }
  }

  // Check all rows/cols/boxes contain 1..9 exactly once.
  static const char *NAMES[3] = { "Row", "Col", "Box" };
  static const UnitKind KINDS[3] = { UnitKind::Row, UnitKind::Column, UnitKind::Box };
  for (int u = 0; u < 9; u++) {
    for (int k = 0; k < 3; k++) {
      std::string w;
      if (!checkUnit(unitCells(KINDS[k], u), grid, &w)) {
        if (why) {
          std::ostringstream oss;
          oss << NAMES[k] << " " << u << " invalid: " << w;
          *why = oss.str();
        }
        return false;
      }
    }
  }
  return true;
}

// =========================================================
// SudokuSolver
// =========================================================

SudokuSolver::SudokuSolver() = default;

SudokuSolver::SudokuSolver(const SolverConfig &config) : config(config) { }

const SolverConfig &SudokuSolver::getConfig() const {
  return config;
}

Outcome SudokuSolver::solve(const uint8_t *values) const {
  Outcome out;

  // 1) Validate and build the board; bad input never reaches the solver.
  SudokuBoard board;
  std::string why;
  if (!board.importFromValues(values, &why)) {
    out.status = OutcomeStatus::InvalidInput;
    out.reason = why;
    SUDOCORE_LOG(LogLevel::Info, "invalid input: %s", why.c_str());
    return out;
  }

  // 2) Deterministic deduction at the root.
  Propagator propagator(config.techniques);
  if (propagator.propagate(board, &out.stats) == PropagationResult::Contradiction) {
    out.stats.contradictions++;
    out.status = OutcomeStatus::Unsolvable;
    SUDOCORE_LOG(LogLevel::Info, "unsolvable: contradiction before search");
    return out;
  }

  // Every step so far was forced, so a complete board is the only solution.
  if (board.isComplete()) {
    out.status = OutcomeStatus::Solved;
    out.solutions.push_back(toGrid(board));
    if (config.verifySolutions) {
      verifyOrThrow(values, out.solutions.front());
    }
    SUDOCORE_LOG(LogLevel::Info, "solved by propagation alone");
    return out;
  }

  SUDOCORE_LOG(LogLevel::Debug, "propagation stuck with %d unknown cells, %d candidates",
               board.countUnknown(), board.countAllCandidates());

  // 3) Search for up to maxSolutions completions (at least two).
  const int cap = config.maxSolutions < 2 ? 2 : config.maxSolutions;
  SearchEngine engine(propagator, cap, config.maxNodes);
  std::vector<SudokuBoard> found;
  const SearchStatus st = engine.search(board, found, &out.stats);

  for (const SudokuBoard &b : found) {
    out.solutions.push_back(toGrid(b));
    if (config.verifySolutions) {
      verifyOrThrow(values, out.solutions.back());
    }
  }

  // 4) Map the count onto an outcome.
  if (st == SearchStatus::Aborted) {
    std::ostringstream oss;
    oss << "node budget of " << config.maxNodes << " exhausted after "
        << found.size() << " solution(s)";
    out.status = OutcomeStatus::SearchAborted;
    out.reason = oss.str();
  } else if (found.empty()) {
    out.status = OutcomeStatus::Unsolvable;
  } else if (found.size() == 1) {
    out.status = OutcomeStatus::Solved;
  } else {
    out.status = OutcomeStatus::MultipleSolutions;
  }

  SUDOCORE_LOG(LogLevel::Info, "%s after %llu nodes, %llu guesses",
               outcomeName(out.status),
               (unsigned long long)out.stats.nodes,
               (unsigned long long)out.stats.guesses);
  return out;
}

Outcome SudokuSolver::solve(const uint8_t rows[9][9]) const {
  uint8_t values[81];
  for (int r = 0; r < 9; r++) {
    for (int c = 0; c < 9; c++) {
      values[r * 9 + c] = rows[r][c];
    }
  }
  return solve(values);
}

int SudokuSolver::countSolutions(const uint8_t *values, int limit) const {
  if (limit < 1) {
    return 0;
  }

  SudokuBoard board;
  if (!board.importFromValues(values)) {
    return -1;
  }

  Propagator propagator(config.techniques);
  if (propagator.propagate(board) == PropagationResult::Contradiction) {
    return 0;
  }

  SearchEngine engine(propagator, limit, config.maxNodes);
  std::vector<SudokuBoard> found;
  if (engine.search(board, found) == SearchStatus::Aborted) {
    return -1;
  }
  return (int)found.size();
}
