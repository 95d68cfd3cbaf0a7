#include "EventQueue.hpp"
#include <stdexcept>

// =========================================================
// Event queue (implementation avoids duplicates)
// =========================================================

EventQueue::EventQueue() = default;

// push only if the same deduction is not already pending
bool EventQueue::push(const Event &x) {
  if (s.find(x.getEventId()) != s.end()) {
    return false;
  }

  q.push(x);
  s.insert(x.getEventId());
  return true;
}

void EventQueue::pop() {
  if (q.empty()) {
    throw std::logic_error("EventQueue::pop() on empty queue");
  }

  const Event &front = q.front();
  s.erase(front.getEventId());
  q.pop();
}

const Event &EventQueue::front() const {
  if (q.empty()) {
    throw std::logic_error("EventQueue::front() on empty queue");
  }

  return q.front();
}

bool EventQueue::contains(const Event &x) const {
  return s.find(x.getEventId()) != s.end();
}

std::size_t EventQueue::size() const noexcept {
  return q.size();
}

bool EventQueue::empty() const noexcept {
  return q.empty();
}

void EventQueue::clear() {
  std::queue<Event>().swap(q);
  s.clear();
}

void EventQueue::enqueueSetValue(const SudokuBoard &board, Index idx, Digit digit, ReasonId reason) {
  if (digit == 0) {
    return;
  }
  if (board.isSolved(idx)) {
    return;
  }

  this->push(Event(EventType::SetValue, idx, digit, reason));
}

void EventQueue::enqueueRemoveCandidate(const SudokuBoard &board, Index idx, Digit digit, ReasonId reason) {
  if (digit == 0) {
    return;
  }
  if (board.isSolved(idx)) {
    return;
  }
  if (!board.hasCandidate(idx, digit)) {
    return;
  }

  this->push(Event(EventType::RemoveCandidate, idx, digit, reason));
}
