#include "CandidateSet.hpp"

// =========================================================
// CandidateSet
// =========================================================

CandidateSet::CandidateSet() : mask(0) { }

CandidateSet::CandidateSet(Mask mask) : mask((Mask)(mask & ALL_DIGITS)) { }

CandidateSet CandidateSet::full() {
  return CandidateSet(ALL_DIGITS);
}

CandidateSet CandidateSet::single(Digit digit) {
  return CandidateSet(digitToBit(digit));
}

Mask CandidateSet::getMask() const {
  return mask;
}

bool CandidateSet::empty() const {
  return mask == 0;
}

bool CandidateSet::contains(Digit digit) const {
  if (digit < 1 || digit > 9) {
    return false;
  }
  return (mask & digitToBit(digit)) != 0;
}

size_t CandidateSet::count() const {
  return countBits9(mask);
}

bool CandidateSet::isSingle() const {
  return mask != 0 && (mask & (mask - 1u)) == 0;
}

Digit CandidateSet::getSingle() const {
  if (isSingle()) {
    return bitToDigitSingle(mask);
  }
  return 0;
}

Digit CandidateSet::next(Digit after) const {
  if (after >= 9) {
    return 0;
  }
  // drop digits 1..after
  const Mask rest = (Mask)(mask & ~((1u << after) - 1u) & ALL_DIGITS);
  return lowestDigit(rest);
}

void CandidateSet::add(Digit digit) {
  mask = (Mask)(mask | digitToBit(digit));
}

bool CandidateSet::remove(Digit digit) {
  if (!contains(digit)) {
    return false;
  }
  mask = (Mask)(mask & ~digitToBit(digit));
  return true;
}

bool CandidateSet::operator==(const CandidateSet &other) const {
  return mask == other.mask;
}

bool CandidateSet::operator!=(const CandidateSet &other) const {
  return mask != other.mask;
}
