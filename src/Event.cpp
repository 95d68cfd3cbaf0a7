#include "Event.hpp"

// =========================================================
// Events
// =========================================================

const char *reasonName(ReasonId reason) {
  switch (reason) {
    case ReasonId::Search:
      return "search";
    case ReasonId::FullHouse:
      return "full house";
    case ReasonId::NakedSingle:
      return "naked single";
    case ReasonId::HiddenSingle:
      return "hidden single";
    case ReasonId::PointingPair:
      return "pointing pair";
    case ReasonId::PointingTriple:
      return "pointing triple";
    case ReasonId::BoxLineReduction:
      return "box/line reduction";
    case ReasonId::NakedPair:
      return "naked pair";
  }
  return "unknown";
}

Event::Event() : type(EventType::None), idx(0), digit(0), reason(ReasonId::Search) { }

Event::Event(EventType type, Index idx, Digit digit, ReasonId reason)
  : type(type), idx(idx), digit(digit), reason(reason) { }

uint32_t Event::getEventId() const {
  // make the event comparable by mapping it to a unique integer
  return (static_cast<uint32_t>(this->type) & 0xFFu) |
        ((static_cast<uint32_t>(this->idx) & 0xFFu) << 8) |
        ((static_cast<uint32_t>(this->digit) & 0xFFu) << 16) ;
}
