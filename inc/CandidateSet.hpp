#ifndef CANDIDATE_SET_H
#define CANDIDATE_SET_H

#include <cstddef>
#include "utils.hpp"

// Set of digits 1..9 still possible for a cell, stored as a 9-bit mask.
class CandidateSet
{
public:
  CandidateSet();

  explicit CandidateSet(Mask mask);

  static CandidateSet full();

  static CandidateSet single(Digit digit);

  Mask getMask() const;

  bool empty() const;

  bool contains(Digit digit) const;

  size_t count() const;

  bool isSingle() const;

  // the only member, 0 unless count() == 1
  Digit getSingle() const;

  // smallest member greater than `after`, 0 if none
  Digit next(Digit after) const;

  void add(Digit digit);

  // returns true if the digit was present
  bool remove(Digit digit);

  bool operator==(const CandidateSet &other) const;

  bool operator!=(const CandidateSet &other) const;

private:
  Mask mask;
};

#endif // CANDIDATE_SET_H
