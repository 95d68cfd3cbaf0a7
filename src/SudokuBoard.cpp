#include "SudokuBoard.hpp"
#include "utils.hpp"

#include <sstream>
#include <stdexcept>

// =========================================================
// SudokuBoard
// =========================================================

namespace {

void setWhy(std::string *why, const std::string &msg) {
  if (why) {
    *why = msg;
  }
}

const char *unitName(UnitKind kind) {
  switch (kind) {
    case UnitKind::Row:
      return "row";
    case UnitKind::Column:
      return "column";
    default:
      return "box";
  }
}

} // namespace

// empty board
SudokuBoard::SudokuBoard() {
  _reset();
}

// only values, candidates are calculated automatically
bool SudokuBoard::importFromValues(const uint8_t *values, std::string *why) {
  if (values == nullptr) {
    setWhy(why, "no input values");
    return false;
  }

  _reset();

  // 1) Range check before touching any unit mask
  for (Index idx = 0; idx < 81; idx++) {
    if (values[idx] > 9) {
      std::ostringstream oss;
      oss << "invalid digit " << (int)values[idx] << " at r" << (idxRow(idx) + 1) << "c" << (idxCol(idx) + 1);
      setWhy(why, oss.str());
      _reset();
      return false;
    }
  }

  // 2) Place givens, rejecting any duplicate inside a unit
  for (Index idx = 0; idx < 81; idx++) {
    const Digit digit = values[idx];
    if (digit == 0) {
      continue;
    }

    const CellUnits u = unitsOf(idx);
    const Mask bit = digitToBit(digit);
    UnitKind clash = UnitKind::Row;
    int unit = -1;
    if ((rowUsed[u.row] & bit) != 0) {
      clash = UnitKind::Row;
      unit = u.row;
    } else if ((colUsed[u.col] & bit) != 0) {
      clash = UnitKind::Column;
      unit = u.col;
    } else if ((boxUsed[u.box] & bit) != 0) {
      clash = UnitKind::Box;
      unit = u.box;
    }

    if (unit >= 0) {
      std::ostringstream oss;
      oss << "duplicate digit " << (int)digit << " in " << unitName(clash) << " " << (unit + 1)
          << " (at r" << (idxRow(idx) + 1) << "c" << (idxCol(idx) + 1) << ")";
      setWhy(why, oss.str());
      _reset();
      return false;
    }

    _placeValue(idx, digit);
  }

  // 3) Empty cells: candidates = NOT(used in row/col/box)
  _recalcAllCandidatesFromValues();

  return true;
}

bool SudokuBoard::importFromMatrix(const uint8_t rows[9][9], std::string *why) {
  if (rows == nullptr) {
    setWhy(why, "no input values");
    return false;
  }

  uint8_t values[81];
  for (int r = 0; r < 9; r++) {
    for (int c = 0; c < 9; c++) {
      values[r * 9 + c] = rows[r][c];
    }
  }
  return importFromValues(values, why);
}

void SudokuBoard::exportValues(uint8_t *values) const {
  for (int i = 0; i < 81; i++) {
    values[i] = cells[i].getValue();
  }
}

// --- structure ---
CellUnits SudokuBoard::unitsOf(Index idx) {
  CellUnits u;
  u.row = idxRow(idx);
  u.col = idxCol(idx);
  u.box = idxBox(idx);
  return u;
}

CellUnits SudokuBoard::unitsOf(int row, int col) {
  return unitsOf(row * 9 + col);
}

// --- values API ---
Digit SudokuBoard::getValue(Index idx) const {
  return cells[idx].getValue();
}

bool SudokuBoard::isSolved(Index idx) const {
  return cells[idx].isSolved();
}

Mask SudokuBoard::getPlacedMask(UnitKind kind, int unit) const {
  switch (kind) {
    case UnitKind::Row:
      return rowUsed[unit];
    case UnitKind::Column:
      return colUsed[unit];
    default:
      return boxUsed[unit];
  }
}

// --- candidates API ---
const CandidateSet &SudokuBoard::getCandidates(Index idx) const {
  return cells[idx].getCandidates();
}

Mask SudokuBoard::getCandidateMask(Index idx) const {
  return cells[idx].getCandidateMask();
}

bool SudokuBoard::hasCandidate(Index idx, Digit digit) const {
  return cells[idx].hasCandidate(digit);
}

size_t SudokuBoard::countCandidates(Index idx) const {
  return cells[idx].countCandidates();
}

Digit SudokuBoard::getSingleCandidate(Index idx) const {
  return cells[idx].getSingleCandidate();
}

ElimResult SudokuBoard::eliminate(Index idx, Digit digit) {
  if (!isValidIndex(idx)) {
    throw std::out_of_range("SudokuBoard::eliminate() index out of range");
  }

  SudokuCell &cell = cells[idx];
  if (cell.isSolved()) {
    return ElimResult::Unchanged;
  }
  if (!cell.disableCandidate(digit)) {
    return ElimResult::Unchanged;
  }

  const size_t left = cell.countCandidates();
  if (left == 0) {
    return ElimResult::Empty;
  }
  if (left == 1) {
    return ElimResult::Single;
  }
  return ElimResult::Removed;
}

bool SudokuBoard::assign(Index idx, Digit digit, ForcedCells *forced) {
  if (!isValidIndex(idx)) {
    throw std::out_of_range("SudokuBoard::assign() index out of range");
  }
  if (digit < 1 || digit > 9) {
    return false;
  }

  if (cells[idx].isSolved()) {
    return cells[idx].getValue() == digit;
  }
  if (!cells[idx].hasCandidate(digit)) {
    return false;
  }
  if (!_placeValue(idx, digit)) {
    return false;
  }

  // Remove digit from the candidates of the unsolved peers.
  const int *peers = peersOf(idx);
  for (int k = 0; k < NUM_PEERS; k++) {
    const Index p = peers[k];
    switch (eliminate(p, digit)) {
      case ElimResult::Empty:
        return false;
      case ElimResult::Single:
        if (forced) {
          forced->idx[forced->count++] = p;
        }
        break;
      default:
        break;
    }
  }
  return true;
}

// --- global state ---
bool SudokuBoard::isComplete() const {
  return unknownCount == 0;
}

bool SudokuBoard::isValid() const {
  return !conflict;
}

int SudokuBoard::countUnknown() const {
  return unknownCount;
}

int SudokuBoard::countAllCandidates() const {
  int total = 0;
  for (const SudokuCell &cell : cells) {
    if (!cell.isSolved()) {
      total += (int)cell.countCandidates();
    }
  }
  return total;
}

inline bool SudokuBoard::isValidIndex(Index idx) {
  return idx >= 0 && idx < 81;
}

void SudokuBoard::_reset() {
  for (int i = 0; i < 81; i++) {
    cells[i] = SudokuCell();
  }
  for (int u = 0; u < 9; u++) {
    rowUsed[u] = 0;
    colUsed[u] = 0;
    boxUsed[u] = 0;
  }
  unknownCount = 81;
  conflict = false;
}

// Sets the value and records it in the unit masks. A digit already present
// in one of the three units flags the board as invalid.
bool SudokuBoard::_placeValue(Index idx, Digit digit) {
  const CellUnits u = unitsOf(idx);
  const Mask bit = digitToBit(digit);

  if (((rowUsed[u.row] | colUsed[u.col] | boxUsed[u.box]) & bit) != 0) {
    conflict = true;
  }

  rowUsed[u.row] = static_cast<Mask>(rowUsed[u.row] | bit);
  colUsed[u.col] = static_cast<Mask>(colUsed[u.col] | bit);
  boxUsed[u.box] = static_cast<Mask>(boxUsed[u.box] | bit);

  cells[idx].setValue(digit);
  unknownCount--;

  return !conflict;
}

void SudokuBoard::_recalcAllCandidatesFromValues() {
  for (Index idx = 0; idx < 81; idx++) {
    if (isSolved(idx)) {
      continue;
    }

    const CellUnits u = unitsOf(idx);
    const Mask used = static_cast<Mask>(rowUsed[u.row] | colUsed[u.col] | boxUsed[u.box]);

    // An empty cell may end up without candidates; that is a contradiction
    // for the propagator to report, not an input error.
    cells[idx].setCandidateMask(static_cast<Mask>(ALL_DIGITS & ~used));
  }
}
