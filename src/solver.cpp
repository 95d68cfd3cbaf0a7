// sudocore C export surface (native and WASM)
// The C++ engine lives in SudokuSolver; this file only adapts text buffers.
//
// Exported functions:
//   int  sudocore_solver_full(const char *in81, char *out81, char *alt81);
//   int  sudocore_solver_count(const char *in81, int limit);
//   void sudocore_set_log_level(int level);
//
// Input string (in81, NUL terminated):
//   digits 1..9 are givens, '0' or '.' are empty; whitespace and '|', '-', '+'
//   are skipped. Exactly 81 cells.
//
// Output strings (out81[82], alt81[82] as char):
//   out81 : the solution, the first solution when there are several, or the
//           input echoed back ('.' = empty) for any other outcome
//   alt81 : optional (may be NULL); the second solution, or "" if none
//
// Return value of sudocore_solver_full:
//   -1 = bad arguments / internal error
//    0 = solved, 1 = unsolvable, 2 = multiple solutions,
//    3 = invalid input, 4 = search aborted (node budget)
//
// sudocore_solver_count returns the number of solutions found up to
// limit (1..1000), or -1 for invalid input, aborted search or bad arguments.
//
// sudocore_set_log_level: 0 = error, 1 = warn, 2 = info, 3 = debug.

#include <cstdint>
#include <cstring>
#include <exception>
#include <string>

#include "solver.hpp"
#include "PuzzleFormat.hpp"
#include "SudokuSolver.hpp"
#include "log.hpp"

#ifdef __EMSCRIPTEN__
  // WASM
  #include <emscripten/emscripten.h>
#else
  // native
  #define EMSCRIPTEN_KEEPALIVE
#endif

static const int MAX_COUNT_LIMIT = 1000;

static void copyOut(const std::string &s, char *out) {
  std::memcpy(out, s.c_str(), s.size() + 1);
}

// =========================================================
// Public API exported to JS / C callers
// =========================================================

extern "C"
{
  // Solves an entire Sudoku given its text representation in one shot.
  EMSCRIPTEN_KEEPALIVE
  int sudocore_solver_full(const char *in81, char *out81, char *alt81) {
    if (in81 == nullptr || out81 == nullptr) {
      return -1;
    }
    if (alt81 != nullptr) {
      alt81[0] = '\0';
    }

    uint8_t values[81];
    std::string why;
    if (!parse81(in81, values, &why)) {
      SUDOCORE_LOG(LogLevel::Info, "cannot parse puzzle: %s", why.c_str());
      copyOut(std::string(81, '.'), out81);
      return static_cast<int>(OutcomeStatus::InvalidInput);
    }

    // No exception may cross the C boundary.
    try {
      const SudokuSolver solver;
      const Outcome outcome = solver.solve(values);

      if (outcome.solutions.empty()) {
        copyOut(format81(values), out81);
      } else {
        copyOut(format81(outcome.solutions[0].data()), out81);
      }
      if (alt81 != nullptr && outcome.solutions.size() > 1) {
        copyOut(format81(outcome.solutions[1].data()), alt81);
      }
      return static_cast<int>(outcome.status);
    } catch (const std::exception &e) {
      SUDOCORE_LOG(LogLevel::Error, "sudocore_solver_full: %s", e.what());
      copyOut(format81(values), out81);
      return -1;
    }
  }

  // Counts solutions up to limit.
  EMSCRIPTEN_KEEPALIVE
  int sudocore_solver_count(const char *in81, int limit) {
    if (in81 == nullptr || limit < 1 || limit > MAX_COUNT_LIMIT) {
      return -1;
    }

    uint8_t values[81];
    if (!parse81(in81, values)) {
      return -1;
    }

    try {
      const SudokuSolver solver;
      return solver.countSolutions(values, limit);
    } catch (const std::exception &e) {
      SUDOCORE_LOG(LogLevel::Error, "sudocore_solver_count: %s", e.what());
      return -1;
    }
  }

  EMSCRIPTEN_KEEPALIVE
  void sudocore_set_log_level(int level) {
    if (level < static_cast<int>(LogLevel::Error)) {
      level = static_cast<int>(LogLevel::Error);
    } else if (level > static_cast<int>(LogLevel::Debug)) {
      level = static_cast<int>(LogLevel::Debug);
    }
    setLogLevel(static_cast<LogLevel>(level));
  }
} // extern "C"
