#include "SudokuCell.hpp"

// =========================================================
// SudokuCell
// =========================================================

SudokuCell::SudokuCell() : value(0), cands() { }

// --- value ---
Digit SudokuCell::getValue() const {
  return value;
}

bool SudokuCell::isSolved() const {
  return value != 0;
}

void SudokuCell::setValue(Digit digit) {
  value = digit;
  if (digit != 0) {
    // When solved, keep only the digit bit as candidates.
    cands = CandidateSet::single(digit);
  }
}

// --- candidates ---
const CandidateSet &SudokuCell::getCandidates() const {
  return cands;
}

Mask SudokuCell::getCandidateMask() const {
  return cands.getMask();
}

void SudokuCell::setCandidateMask(Mask mask) {
  cands = CandidateSet(mask);
}

bool SudokuCell::hasCandidate(Digit digit) const {
  return cands.contains(digit);
}

size_t SudokuCell::countCandidates() const {
  return cands.count();
}

Digit SudokuCell::getSingleCandidate() const {
  return cands.getSingle();
}

bool SudokuCell::disableCandidate(Digit digit) {
  return cands.remove(digit);
}
