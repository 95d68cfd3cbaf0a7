#ifndef SUDOKU_CELL_H
#define SUDOKU_CELL_H

#include <cstdint>
#include "CandidateSet.hpp"

class SudokuCell
{
public:
  SudokuCell();

  // --- value ---
  Digit getValue() const;

  bool isSolved() const;

  void setValue(Digit digit);

  // --- candidates ---
  const CandidateSet &getCandidates() const;

  Mask getCandidateMask() const;

  void setCandidateMask(Mask mask);

  bool hasCandidate(Digit digit) const;

  size_t countCandidates() const;

  Digit getSingleCandidate() const;

  bool disableCandidate(Digit digit);

private:
  Digit        value;  // 0..9
  CandidateSet cands;  // 9-bit
};

#endif // SUDOKU_CELL_H
