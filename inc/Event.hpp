#ifndef EVENT_H
#define EVENT_H

#include <cstdint>
#include "utils.hpp"

enum class EventType : uint8_t {
  None = 0,
  SetValue = 1,
  RemoveCandidate = 2
};

enum class ReasonId : uint8_t {
  Search = 0,
  FullHouse = 1,
  NakedSingle = 2,
  HiddenSingle = 3,
  PointingPair = 4,
  PointingTriple = 5,
  BoxLineReduction = 6,
  NakedPair = 7
};

static constexpr int REASON_COUNT = 8;

const char *reasonName(ReasonId reason);

// one deduction = set a value or remove a candidate
class Event
{
public:
  Event();
  Event(EventType type, Index idx, Digit digit, ReasonId reason);

  EventType type;
  Index idx;
  Digit digit;
  ReasonId reason;

  uint32_t getEventId() const;
};

#endif // EVENT_H
