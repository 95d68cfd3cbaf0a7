#include <cstdint>
#include <cstring>

#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "CandidateSet.hpp"
#include "EventQueue.hpp"
#include "Propagator.hpp"
#include "PuzzleFormat.hpp"
#include "SearchEngine.hpp"
#include "SudokuBoard.hpp"
#include "SudokuSolver.hpp"
#include "log.hpp"
#include "solver.hpp"
#include "utils.hpp"

// =========================================================
// Minimal check harness
// =========================================================

static int g_checks = 0;
static int g_failures = 0;

#define CHECK(cond)                                                              \
  do {                                                                           \
    g_checks++;                                                                  \
    if (!(cond)) {                                                               \
      g_failures++;                                                              \
      std::cout << __FILE__ << ":" << __LINE__ << ": CHECK failed: " #cond "\n"; \
    }                                                                            \
  } while (0)

static const char *CLASSIC =
    "53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79";
static const char *CLASSIC_SOLUTION =
    "534678912672195348198342567859761423426853791713924856961537284287419635345286179";

// Arto Inkala's puzzle, needs search
static const char *HARD =
    "8..........36......7..9.2...5...7.......457.....1...3...1....68..85...1..9....4..";
static const char *HARD_SOLUTION =
    "812753649943682175675491283154237896369845721287169534521974368438526917796318452";

// CLASSIC_SOLUTION with the 6/7 rectangle at r1c4 r1c5 r4c4 r4c5 blanked
static const char *RECTANGLE =
    "534..8912672195348198342567859..1423426853791713924856961537284287419635345286179";
static const char *RECTANGLE_SECOND =
    "534768912672195348198342567859671423426853791713924856961537284287419635345286179";

static const char *EMPTY =
    ".................................................................................";

static void load(const char *text, uint8_t *values) {
  std::string why;
  const bool ok = parse81(text, values, &why);
  if (!ok) {
    std::cout << "bad fixture: " << why << "\n";
  }
  CHECK(ok);
}

static SudokuBoard boardFrom(const char *text) {
  uint8_t values[81];
  load(text, values);
  SudokuBoard board;
  CHECK(board.importFromValues(values));
  return board;
}

static std::string gridText(const Grid &grid) {
  return format81(grid.data());
}

static std::string boardText(const SudokuBoard &board) {
  uint8_t values[81];
  board.exportValues(values);
  return format81(values);
}

// =========================================================
// CandidateSet / structure
// =========================================================

static void testCandidateSet() {
  CandidateSet s = CandidateSet::full();
  CHECK(s.count() == 9);
  CHECK(!s.isSingle());
  CHECK(s.getSingle() == 0);

  CHECK(s.remove(5));
  CHECK(!s.remove(5));
  CHECK(!s.contains(5));
  CHECK(s.contains(4));
  CHECK(s.count() == 8);

  std::vector<Digit> digits;
  for (Digit d = s.next(0); d != 0; d = s.next(d)) {
    digits.push_back(d);
  }
  CHECK(digits.size() == 8);
  CHECK(digits.front() == 1);
  CHECK(digits.back() == 9);
  CHECK(digits[4] == 6);

  CHECK(CandidateSet::single(7).getSingle() == 7);
  CHECK(CandidateSet().empty());
  CHECK(!CandidateSet().contains(0));
  CHECK(CandidateSet(0x0006).next(0) == 2);
  CHECK(CandidateSet(0x0006).next(2) == 3);
  CHECK(CandidateSet(0x0006).next(3) == 0);
  CHECK(CandidateSet(0xFFFF) == CandidateSet::full());
}

static void testUnitsOf() {
  const CellUnits u = SudokuBoard::unitsOf(4, 7);
  CHECK(u.row == 4);
  CHECK(u.col == 7);
  CHECK(u.box == 5);

  const CellUnits last = SudokuBoard::unitsOf(80);
  CHECK(last.row == 8 && last.col == 8 && last.box == 8);

  for (int idx = 0; idx < 81; idx++) {
    const int *peers = peersOf(idx);
    std::set<int> distinct(peers, peers + NUM_PEERS);
    CHECK(distinct.size() == (size_t)NUM_PEERS);
    CHECK(distinct.count(idx) == 0);
    for (int k = 0; k < NUM_PEERS; k++) {
      const int p = peers[k];
      CHECK(idxRow(p) == idxRow(idx) || idxCol(p) == idxCol(idx) || idxBox(p) == idxBox(idx));
    }
  }
}

// =========================================================
// Board
// =========================================================

static void testImportInitializesCandidates() {
  const SudokuBoard board = boardFrom(CLASSIC);
  CHECK(board.isValid());
  CHECK(!board.isComplete());
  CHECK(board.countUnknown() == 51);

  CHECK(board.getValue(0) == 5);
  CHECK(board.getCandidateMask(0) == digitToBit(5));

  // r1c3: row {3,5,7}, column {8}, box {3,5,6,8,9}
  CHECK(board.getCandidateMask(2) == (digitToBit(1) | digitToBit(2) | digitToBit(4)));
  CHECK(board.getPlacedMask(UnitKind::Row, 0) == (digitToBit(3) | digitToBit(5) | digitToBit(7)));
}

static void testImportRejectsMalformedGivens() {
  uint8_t values[81];
  std::string why;
  SudokuBoard board;

  std::memset(values, 0, sizeof(values));
  values[10] = 10;
  CHECK(!board.importFromValues(values, &why));
  CHECK(why.find("invalid digit") != std::string::npos);

  std::memset(values, 0, sizeof(values));
  values[0] = 4;
  values[8] = 4;
  CHECK(!board.importFromValues(values, &why));
  CHECK(why.find("row 1") != std::string::npos);

  std::memset(values, 0, sizeof(values));
  values[0] = 4;
  values[72] = 4;
  CHECK(!board.importFromValues(values, &why));
  CHECK(why.find("column 1") != std::string::npos);

  std::memset(values, 0, sizeof(values));
  values[0] = 4;
  values[20] = 4;
  CHECK(!board.importFromValues(values, &why));
  CHECK(why.find("box 1") != std::string::npos);

  CHECK(!board.importFromValues(nullptr, &why));

  // a failed import leaves an empty board behind
  CHECK(board.countUnknown() == 81);
  CHECK(board.isValid());
}

static void testEliminateIsIdempotent() {
  SudokuBoard board = boardFrom(EMPTY);

  CHECK(board.eliminate(0, 5) == ElimResult::Removed);
  const Mask once = board.getCandidateMask(0);
  CHECK(board.eliminate(0, 5) == ElimResult::Unchanged);
  CHECK(board.getCandidateMask(0) == once);

  for (Digit d = 1; d <= 7; d++) {
    if (d != 5) {
      CHECK(board.eliminate(0, d) == ElimResult::Removed);
    }
  }
  CHECK(board.eliminate(0, 8) == ElimResult::Single);
  CHECK(board.getSingleCandidate(0) == 9);
  CHECK(board.eliminate(0, 9) == ElimResult::Empty);
  CHECK(board.countCandidates(0) == 0);

  bool thrown = false;
  try {
    board.eliminate(81, 1);
  } catch (const std::out_of_range &) {
    thrown = true;
  }
  CHECK(thrown);
}

static void testAssign() {
  SudokuBoard board = boardFrom(EMPTY);

  // leave r1c2 with {5,6}
  for (Digit d = 1; d <= 9; d++) {
    if (d != 5 && d != 6) {
      board.eliminate(1, d);
    }
  }

  ForcedCells forced;
  CHECK(board.assign(0, 5, &forced));
  CHECK(board.isSolved(0));
  CHECK(board.getValue(0) == 5);
  CHECK(board.countUnknown() == 80);
  CHECK(forced.count == 1);
  CHECK(forced.idx[0] == 1);
  CHECK(board.getSingleCandidate(1) == 6);

  const int *peers = peersOf(0);
  for (int k = 0; k < NUM_PEERS; k++) {
    CHECK(!board.hasCandidate(peers[k], 5));
  }
  CHECK(board.hasCandidate(40, 5));

  // no longer a candidate of a peer
  CHECK(!board.assign(2, 5));
  // already fixed: only the same digit is accepted
  CHECK(board.assign(0, 5));
  CHECK(!board.assign(0, 6));
  CHECK(!board.assign(3, 0));
  CHECK(board.isValid());
}

// =========================================================
// Propagation
// =========================================================

static void testPropagationSolvesClassic() {
  SudokuBoard board = boardFrom(CLASSIC);
  Mask before[81];
  for (int i = 0; i < 81; i++) {
    before[i] = board.getCandidateMask(i);
  }

  Propagator propagator;
  SolveStats stats;
  CHECK(propagator.propagate(board, &stats) == PropagationResult::Quiescent);
  CHECK(board.isComplete());
  CHECK(board.isValid());
  CHECK(boardText(board) == CLASSIC_SOLUTION);

  // candidates only ever shrink
  for (int i = 0; i < 81; i++) {
    CHECK((board.getCandidateMask(i) & ~before[i]) == 0);
  }
  CHECK(stats.count(ReasonId::Search) == 0);
  CHECK(stats.count(ReasonId::NakedSingle) + stats.count(ReasonId::HiddenSingle) +
        stats.count(ReasonId::FullHouse) == 51);
}

static void testPropagationKeepsSolutionDigits() {
  SudokuBoard board = boardFrom(HARD);
  Mask before[81];
  for (int i = 0; i < 81; i++) {
    before[i] = board.getCandidateMask(i);
  }
  const int totalBefore = board.countAllCandidates();

  Propagator propagator;
  CHECK(propagator.propagate(board) == PropagationResult::Quiescent);
  CHECK(board.isValid());
  CHECK(board.countAllCandidates() <= totalBefore);

  for (int i = 0; i < 81; i++) {
    const Digit truth = (Digit)(HARD_SOLUTION[i] - '0');
    CHECK(board.hasCandidate(i, truth));
    CHECK((board.getCandidateMask(i) & ~before[i]) == 0);
  }
}

static void testFullHouseAndNakedSingle() {
  std::string text = CLASSIC_SOLUTION;
  text[36] = '.';

  SudokuBoard board = boardFrom(text.c_str());
  SolveStats stats;
  Propagator all;
  CHECK(all.propagate(board, &stats) == PropagationResult::Quiescent);
  CHECK(board.isComplete());
  CHECK(board.getValue(36) == 4);
  CHECK(stats.count(ReasonId::FullHouse) == 1);

  SudokuBoard board2 = boardFrom(text.c_str());
  SolveStats stats2;
  Propagator singles(TECH_SINGLES);
  CHECK(singles.getTechniques() == TECH_SINGLES);
  CHECK(singles.propagate(board2, &stats2) == PropagationResult::Quiescent);
  CHECK(board2.getValue(36) == 4);
  CHECK(stats2.count(ReasonId::FullHouse) == 0);
  CHECK(stats2.count(ReasonId::NakedSingle) == 1);
}

static void testHiddenSingle() {
  SudokuBoard board = boardFrom(EMPTY);
  // digit 3 fits nowhere in row 1 except r1c1
  for (int c = 1; c < 9; c++) {
    board.eliminate(ROW_CELLS[0][c], 3);
  }
  CHECK(board.countCandidates(0) == 9);

  SolveStats stats;
  Propagator propagator(TECH_SINGLES);
  CHECK(propagator.propagate(board, &stats) == PropagationResult::Quiescent);
  CHECK(board.getValue(0) == 3);
  CHECK(stats.count(ReasonId::HiddenSingle) == 1);
  CHECK(board.countUnknown() == 80);
  CHECK(!board.hasCandidate(9, 3));
}

static void testPointing() {
  SudokuBoard board = boardFrom(EMPTY);
  // in box 1, digit 1 is left only in r1c1 and r1c2
  for (int k = 2; k < 9; k++) {
    board.eliminate(BOX_CELLS[0][k], 1);
  }

  SolveStats stats;
  Propagator propagator(TECH_POINTING);
  CHECK(propagator.propagate(board, &stats) == PropagationResult::Quiescent);
  CHECK(stats.count(ReasonId::PointingPair) == 6);
  for (int c = 3; c < 9; c++) {
    CHECK(!board.hasCandidate(ROW_CELLS[0][c], 1));
  }
  CHECK(board.hasCandidate(0, 1));
  CHECK(board.hasCandidate(1, 1));
  CHECK(board.hasCandidate(ROW_CELLS[1][3], 1));
  CHECK(board.countUnknown() == 81);
}

static void testBoxLineReduction() {
  SudokuBoard board = boardFrom(EMPTY);
  // in row 1, digit 2 is left only inside box 1
  for (int c = 3; c < 9; c++) {
    board.eliminate(ROW_CELLS[0][c], 2);
  }

  SolveStats stats;
  Propagator propagator(TECH_BOX_LINE);
  CHECK(propagator.propagate(board, &stats) == PropagationResult::Quiescent);
  CHECK(stats.count(ReasonId::BoxLineReduction) == 6);
  for (int k = 3; k < 9; k++) {
    CHECK(!board.hasCandidate(BOX_CELLS[0][k], 2));
  }
  CHECK(board.hasCandidate(0, 2));
  CHECK(board.hasCandidate(ROW_CELLS[1][3], 2));
}

static void testNakedPair() {
  SudokuBoard board = boardFrom(EMPTY);
  // r1c1 and r1c2 both {1,2}
  for (Digit d = 3; d <= 9; d++) {
    board.eliminate(0, d);
    board.eliminate(1, d);
  }

  SolveStats stats;
  Propagator propagator(TECH_NAKED_PAIR);
  CHECK(propagator.propagate(board, &stats) == PropagationResult::Quiescent);
  // 7 other box cells + 6 more row cells, two digits each
  CHECK(stats.count(ReasonId::NakedPair) == 26);
  for (int c = 2; c < 9; c++) {
    CHECK(!board.hasCandidate(ROW_CELLS[0][c], 1));
    CHECK(!board.hasCandidate(ROW_CELLS[0][c], 2));
  }
  CHECK(!board.hasCandidate(BOX_CELLS[0][8], 1));
  CHECK(board.hasCandidate(ROW_CELLS[1][5], 1));
  CHECK(board.getCandidateMask(0) == (digitToBit(1) | digitToBit(2)));
}

static void testContradictions() {
  SudokuBoard board = boardFrom(EMPTY);
  for (int c = 0; c < 9; c++) {
    board.eliminate(ROW_CELLS[0][c], 5);
  }
  Propagator propagator;
  CHECK(propagator.propagate(board) == PropagationResult::Contradiction);

  // r1c9 has no candidate left
  SudokuBoard board2 = boardFrom(
      "12345678.........9...............................................................");
  CHECK(board2.countCandidates(8) == 0);
  CHECK(propagator.propagate(board2) == PropagationResult::Contradiction);

  // a guess that clashes with the forced completion
  SudokuBoard board3 = boardFrom(RECTANGLE);
  CHECK(propagator.assignAndPropagate(board3, 3, 6, ReasonId::Search) == PropagationResult::Quiescent);
  CHECK(board3.isComplete());
  SudokuBoard board4 = boardFrom(RECTANGLE);
  CHECK(propagator.assignAndPropagate(board4, 3, 5, ReasonId::Search) == PropagationResult::Contradiction);
}

// =========================================================
// Search
// =========================================================

static void testSelectBranchCell() {
  SudokuBoard board = boardFrom(EMPTY);
  bool deadEnd = true;
  CHECK(SearchEngine::selectBranchCell(board, &deadEnd) == 0);
  CHECK(!deadEnd);

  board.eliminate(50, 1);
  board.eliminate(30, 1);
  CHECK(SearchEngine::selectBranchCell(board, &deadEnd) == 30);

  board.eliminate(60, 1);
  board.eliminate(60, 2);
  CHECK(SearchEngine::selectBranchCell(board, &deadEnd) == 60);

  for (Digit d = 1; d <= 9; d++) {
    board.eliminate(70, d);
  }
  CHECK(SearchEngine::selectBranchCell(board, &deadEnd) == 70);
  CHECK(deadEnd);

  const SudokuBoard solved = boardFrom(CLASSIC_SOLUTION);
  CHECK(SearchEngine::selectBranchCell(solved, &deadEnd) == -1);
  CHECK(!deadEnd);
}

static void testSearchStopsAtCap() {
  SudokuBoard board = boardFrom(EMPTY);
  Propagator propagator;
  CHECK(propagator.propagate(board) == PropagationResult::Quiescent);

  SearchEngine engine(propagator, 3, 0);
  std::vector<SudokuBoard> found;
  SolveStats stats;
  CHECK(engine.search(board, found, &stats) == SearchStatus::LimitReached);
  CHECK(found.size() == 3);
  std::set<std::string> distinct;
  for (const SudokuBoard &b : found) {
    CHECK(b.isComplete());
    distinct.insert(boardText(b));
  }
  CHECK(distinct.size() == 3);
  CHECK(stats.guesses > 0);
  CHECK(stats.maxDepth > 0);
  CHECK(stats.maxDepth <= 81);

  SudokuBoard rect = boardFrom(RECTANGLE);
  SearchEngine wide(propagator, 10, 0);
  CHECK(wide.search(rect, found) == SearchStatus::Exhausted);
  CHECK(found.size() == 2);
}

// =========================================================
// Solver scenarios
// =========================================================

static void testSolvesClassic() {
  uint8_t values[81];
  load(CLASSIC, values);

  const SudokuSolver solver;
  const Outcome outcome = solver.solve(values);
  CHECK(outcome.status == OutcomeStatus::Solved);
  CHECK(outcome.isSolved());
  CHECK(outcome.solutions.size() == 1);
  CHECK(gridText(outcome.solution()) == CLASSIC_SOLUTION);
  CHECK(isValidSolution(values, outcome.solution().data()));
  // singles are enough, no search node
  CHECK(outcome.stats.nodes == 0);
  CHECK(outcome.stats.guesses == 0);
}

static void testSolvesClassicFromMatrix() {
  uint8_t rows[9][9];
  for (int r = 0; r < 9; r++) {
    for (int c = 0; c < 9; c++) {
      const char ch = CLASSIC[r * 9 + c];
      rows[r][c] = (ch == '.') ? 0 : (uint8_t)(ch - '0');
    }
  }
  const Outcome outcome = SudokuSolver().solve(rows);
  CHECK(outcome.status == OutcomeStatus::Solved);
  CHECK(gridText(outcome.solution()) == CLASSIC_SOLUTION);

  SudokuBoard board;
  CHECK(board.importFromMatrix(rows));
  CHECK(board.countUnknown() == 51);
}

static void testSolvesHard() {
  uint8_t values[81];
  load(HARD, values);

  const Outcome outcome = SudokuSolver().solve(values);
  CHECK(outcome.status == OutcomeStatus::Solved);
  CHECK(gridText(outcome.solution()) == HARD_SOLUTION);

  // the singles baseline plus search reaches the same answer
  SolverConfig config;
  config.techniques = TECH_SINGLES;
  const Outcome basic = SudokuSolver(config).solve(values);
  CHECK(basic.status == OutcomeStatus::Solved);
  CHECK(gridText(basic.solution()) == HARD_SOLUTION);
  CHECK(basic.stats.count(ReasonId::PointingPair) == 0);
  CHECK(basic.stats.count(ReasonId::NakedPair) == 0);
  CHECK(basic.stats.guesses > 0);
}

static void testEmptyGridHasMultipleSolutions() {
  uint8_t values[81];
  load(EMPTY, values);

  const Outcome outcome = SudokuSolver().solve(values);
  CHECK(outcome.status == OutcomeStatus::MultipleSolutions);
  CHECK(outcome.solutions.size() == 2);
  CHECK(outcome.solutions[0] != outcome.solutions[1]);
  CHECK(isValidSolution(values, outcome.solutions[0].data()));
  CHECK(isValidSolution(values, outcome.solutions[1].data()));

  // same input, same two grids
  const Outcome again = SudokuSolver().solve(values);
  CHECK(again.solutions == outcome.solutions);
}

static void testRectangleReportsBothCompletions() {
  uint8_t values[81];
  load(RECTANGLE, values);

  const Outcome outcome = SudokuSolver().solve(values);
  CHECK(outcome.status == OutcomeStatus::MultipleSolutions);
  CHECK(outcome.solutions.size() == 2);
  // r1c4 is branched on first, 6 before 7
  CHECK(gridText(outcome.solutions[0]) == CLASSIC_SOLUTION);
  CHECK(gridText(outcome.solutions[1]) == RECTANGLE_SECOND);

  SolverConfig config;
  config.maxSolutions = 5;
  const Outcome wide = SudokuSolver(config).solve(values);
  CHECK(wide.status == OutcomeStatus::MultipleSolutions);
  CHECK(wide.solutions.size() == 2);

  CHECK(SudokuSolver().countSolutions(values, 10) == 2);
  CHECK(SudokuSolver().countSolutions(values, 1) == 1);
}

static void testDuplicateGivensAreInvalid() {
  uint8_t values[81];
  load("1.......1........................................................................", values);

  const Outcome outcome = SudokuSolver().solve(values);
  CHECK(outcome.status == OutcomeStatus::InvalidInput);
  CHECK(outcome.solutions.empty());
  CHECK(!outcome.reason.empty());
  CHECK(SudokuSolver().countSolutions(values, 2) == -1);

  bool thrown = false;
  try {
    outcome.solution();
  } catch (const std::logic_error &) {
    thrown = true;
  }
  CHECK(thrown);
}

static void testSingleBlankIsRestored() {
  std::string text = CLASSIC_SOLUTION;
  text[40] = '.';
  uint8_t values[81];
  load(text.c_str(), values);

  const Outcome outcome = SudokuSolver().solve(values);
  CHECK(outcome.status == OutcomeStatus::Solved);
  CHECK(gridText(outcome.solution()) == CLASSIC_SOLUTION);
  CHECK(outcome.solution()[40] == 5);
}

static void testUnsolvable() {
  uint8_t values[81];
  load("12345678.........9...............................................................", values);
  Outcome outcome = SudokuSolver().solve(values);
  CHECK(outcome.status == OutcomeStatus::Unsolvable);
  CHECK(outcome.solutions.empty());
  CHECK(outcome.reason.empty());

  // givens are consistent, yet no completion exists
  load("82.........36......7..9.2...5...7.......457.....1...3...1....68..85...1..9....4..", values);
  outcome = SudokuSolver().solve(values);
  CHECK(outcome.status == OutcomeStatus::Unsolvable);
  CHECK(SudokuSolver().countSolutions(values, 2) == 0);
}

static void testNodeBudget() {
  uint8_t values[81];
  load(EMPTY, values);

  SolverConfig config;
  config.maxNodes = 1;
  const SudokuSolver solver(config);
  const Outcome outcome = solver.solve(values);
  CHECK(outcome.status == OutcomeStatus::SearchAborted);
  CHECK(outcome.solutions.empty());
  CHECK(outcome.reason.find("node budget") != std::string::npos);
  CHECK(outcome.stats.nodes == 1);
  CHECK(solver.countSolutions(values, 2) == -1);
}

static void testIsValidSolution() {
  uint8_t grid[81];
  uint8_t givens[81];
  load(CLASSIC_SOLUTION, grid);
  load(CLASSIC, givens);
  std::string why;

  CHECK(isValidSolution(givens, grid, &why));
  CHECK(isValidSolution(nullptr, grid));

  load(RECTANGLE_SECOND, grid);
  CHECK(isValidSolution(nullptr, grid));
  CHECK(!isValidSolution(givens, grid, &why));
  CHECK(why.find("Given mismatch") != std::string::npos);

  grid[0] = grid[1];
  CHECK(!isValidSolution(nullptr, grid, &why));

  grid[5] = 0;
  CHECK(!isValidSolution(nullptr, grid, &why));
}

// =========================================================
// Text format / C surface / queue
// =========================================================

static void testPuzzleFormat() {
  const char *boxed =
      "5 3 . | . 7 . | . . .\n"
      "6 . . | 1 9 5 | . . .\n"
      ". 9 8 | . . . | . 6 .\n"
      "------+-------+------\n"
      "8 . . | . 6 . | . . 3\n"
      "4 . . | 8 . 3 | . . 1\n"
      "7 . . | . 2 . | . . 6\n"
      "------+-------+------\n"
      ". 6 . | . . . | 2 8 .\n"
      ". . . | 4 1 9 | . . 5\n"
      ". . . | . 8 . | . 7 9\n";
  uint8_t values[81];
  CHECK(parse81(boxed, values));
  CHECK(format81(values) == CLASSIC);
  CHECK(format81(values, '0').substr(0, 9) == "530070000");

  const std::string grid = formatGrid(values);
  CHECK(grid.substr(0, 18) == "5 3 0 0 7 0 0 0 0\n");
  CHECK(grid.size() == 9 * 18);

  std::string why;
  CHECK(!parse81("123", values, &why));
  CHECK(why.find("Expected 81") != std::string::npos);
  CHECK(!parse81(std::string(80, '.') + "x", values, &why));
  CHECK(why.find("Invalid character") != std::string::npos);
  CHECK(!parse81(std::string(82, '.'), values, &why));
}

static void testCSurface() {
  char out[82];
  char alt[82];

  CHECK(sudocore_solver_full(nullptr, out, alt) == -1);
  CHECK(sudocore_solver_full(CLASSIC, out, alt) == 0);
  CHECK(std::string(out) == CLASSIC_SOLUTION);
  CHECK(alt[0] == '\0');

  CHECK(sudocore_solver_full(RECTANGLE, out, nullptr) == 2);
  CHECK(sudocore_solver_full(RECTANGLE, out, alt) == 2);
  CHECK(std::string(alt) == RECTANGLE_SECOND);

  CHECK(sudocore_solver_full("not a puzzle", out, alt) == 3);
  CHECK(sudocore_solver_full("11", out, alt) == 3);

  CHECK(sudocore_solver_count(CLASSIC, 2) == 1);
  CHECK(sudocore_solver_count(CLASSIC, 0) == -1);
  CHECK(sudocore_solver_count(EMPTY, 4) == 4);

  sudocore_set_log_level(99);
  CHECK(getLogLevel() == LogLevel::Debug);
  sudocore_set_log_level(1);
  CHECK(getLogLevel() == LogLevel::Warn);
}

static void testEventQueue() {
  const SudokuBoard board = boardFrom(CLASSIC);
  EventQueue q;

  q.enqueueSetValue(board, 2, 4, ReasonId::NakedSingle);
  q.enqueueSetValue(board, 2, 4, ReasonId::HiddenSingle);
  CHECK(q.size() == 1);
  CHECK(q.front().reason == ReasonId::NakedSingle);

  // solved cell / absent candidate: nothing to do
  q.enqueueSetValue(board, 0, 5, ReasonId::NakedSingle);
  q.enqueueRemoveCandidate(board, 2, 9, ReasonId::NakedPair);
  CHECK(q.size() == 1);

  q.enqueueRemoveCandidate(board, 2, 1, ReasonId::NakedPair);
  CHECK(q.size() == 2);
  CHECK(q.contains(Event(EventType::RemoveCandidate, 2, 1, ReasonId::Search)));

  q.clear();
  CHECK(q.empty());

  bool thrown = false;
  try {
    q.pop();
  } catch (const std::logic_error &) {
    thrown = true;
  }
  CHECK(thrown);
}

// =========================================================
// Runner
// =========================================================

struct TestCase {
  const char *name;
  void (*fn)();
};

static const TestCase TESTS[] = {
  { "candidate_set", &testCandidateSet },
  { "units_of", &testUnitsOf },
  { "import_initializes_candidates", &testImportInitializesCandidates },
  { "import_rejects_malformed_givens", &testImportRejectsMalformedGivens },
  { "eliminate_is_idempotent", &testEliminateIsIdempotent },
  { "assign", &testAssign },
  { "propagation_solves_classic", &testPropagationSolvesClassic },
  { "propagation_keeps_solution_digits", &testPropagationKeepsSolutionDigits },
  { "full_house_and_naked_single", &testFullHouseAndNakedSingle },
  { "hidden_single", &testHiddenSingle },
  { "pointing", &testPointing },
  { "box_line_reduction", &testBoxLineReduction },
  { "naked_pair", &testNakedPair },
  { "contradictions", &testContradictions },
  { "select_branch_cell", &testSelectBranchCell },
  { "search_stops_at_cap", &testSearchStopsAtCap },
  { "solves_classic", &testSolvesClassic },
  { "solves_classic_from_matrix", &testSolvesClassicFromMatrix },
  { "solves_hard", &testSolvesHard },
  { "empty_grid_has_multiple_solutions", &testEmptyGridHasMultipleSolutions },
  { "rectangle_reports_both_completions", &testRectangleReportsBothCompletions },
  { "duplicate_givens_are_invalid", &testDuplicateGivensAreInvalid },
  { "single_blank_is_restored", &testSingleBlankIsRestored },
  { "unsolvable", &testUnsolvable },
  { "node_budget", &testNodeBudget },
  { "is_valid_solution", &testIsValidSolution },
  { "puzzle_format", &testPuzzleFormat },
  { "c_surface", &testCSurface },
  { "event_queue", &testEventQueue }
};

int main() {
  size_t failedTests = 0;

  for (const TestCase &t : TESTS) {
    const int before = g_failures;
    try {
      t.fn();
    } catch (const std::exception &e) {
      g_failures++;
      std::cout << "unexpected exception: " << e.what() << "\n";
    }

    if (g_failures == before) {
      std::cout << "[PASSED] " << t.name << "\n";
    } else {
      failedTests++;
      std::cout << "[FAILED] " << t.name << "\n";
    }
  }

  std::cout << "SUMMARY: tests=" << (sizeof(TESTS) / sizeof(TESTS[0]))
            << " failed=" << failedTests << " checks=" << g_checks << "\n";

  return g_failures == 0 ? 0 : 1;
}
