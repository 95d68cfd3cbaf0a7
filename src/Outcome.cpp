#include "Outcome.hpp"
#include "PuzzleFormat.hpp"

#include <ostream>
#include <stdexcept>

const char *outcomeName(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::Solved:
      return "solved";
    case OutcomeStatus::Unsolvable:
      return "unsolvable";
    case OutcomeStatus::MultipleSolutions:
      return "multiple";
    case OutcomeStatus::InvalidInput:
      return "invalid";
    case OutcomeStatus::SearchAborted:
      return "aborted";
  }
  return "unknown";
}

bool Outcome::isSolved() const {
  return status == OutcomeStatus::Solved;
}

const Grid &Outcome::solution() const {
  if (solutions.empty()) {
    throw std::logic_error("Outcome::solution() without a solution");
  }
  return solutions.front();
}

std::ostream &operator<<(std::ostream &os, const Outcome &outcome) {
  os << outcomeName(outcome.status);
  if (!outcome.reason.empty()) {
    os << " (" << outcome.reason << ")";
  }
  for (const Grid &grid : outcome.solutions) {
    os << "\n  " << format81(grid.data());
  }
  return os;
}
