#ifndef SUDOKU_BOARD_H
#define SUDOKU_BOARD_H

#include <cstdint>
#include <string>
#include "SudokuCell.hpp"

// the three units a cell belongs to
struct CellUnits {
  uint8_t row;
  uint8_t col;
  uint8_t box;
};

// outcome of removing one candidate from one cell
enum class ElimResult : uint8_t {
  Unchanged = 0,  // digit was not a candidate (or the cell is solved)
  Removed = 1,
  Single = 2,     // exactly one candidate left: a forced value
  Empty = 3       // no candidates left: contradiction
};

// peers left with a single candidate by an assignment
struct ForcedCells {
  Index idx[NUM_PEERS];
  int count;

  ForcedCells() : count(0) { }
};

class SudokuBoard
{
public:
  SudokuBoard();

  // values[81]: 0 = empty, 1..9 = given. Candidates are calculated automatically.
  bool importFromValues(const uint8_t *values, std::string *why = nullptr);

  bool importFromMatrix(const uint8_t rows[9][9], std::string *why = nullptr);

  void exportValues(uint8_t *values) const;

  // --- structure ---
  static CellUnits unitsOf(Index idx);

  static CellUnits unitsOf(int row, int col);

  // --- values API ---
  Digit getValue(Index idx) const;

  bool isSolved(Index idx) const;

  Mask getPlacedMask(UnitKind kind, int unit) const;

  // --- candidates API ---
  const CandidateSet &getCandidates(Index idx) const;

  Mask getCandidateMask(Index idx) const;

  bool hasCandidate(Index idx, Digit digit) const;

  size_t countCandidates(Index idx) const;

  Digit getSingleCandidate(Index idx) const;

  ElimResult eliminate(Index idx, Digit digit);

  // Fix idx to digit and remove digit from all 20 peers. Returns false on
  // contradiction, in which case the board must be discarded.
  bool assign(Index idx, Digit digit, ForcedCells *forced = nullptr);

  // --- global state ---
  bool isComplete() const;

  bool isValid() const;

  int countUnknown() const;

  int countAllCandidates() const;

private:
  // We keep a local copy (owned) so that search branches can mutate freely
  SudokuCell cells[81];

  // digits placed per unit
  Mask rowUsed[9];
  Mask colUsed[9];
  Mask boxUsed[9];

  int unknownCount;
  bool conflict;

  static inline bool isValidIndex(Index idx);

  void _reset();

  bool _placeValue(Index idx, Digit digit);

  void _recalcAllCandidatesFromValues();
};

#endif // SUDOKU_BOARD_H
