#include "Propagator.hpp"
#include "log.hpp"
#include "utils.hpp"

// =========================================================
// Techniques
// =========================================================
//
// Each technique scans the board and enqueues the deductions it finds. It
// returns false if the scan itself proves a contradiction.

static const UnitKind UNIT_ORDER[3] = { UnitKind::Box, UnitKind::Row, UnitKind::Column };

static bool techFullHouse(const SudokuBoard &board, EventQueue &queue) {
  for (int u = 0; u < 9; u++) {
    for (UnitKind kind : UNIT_ORDER) {
      const int *unit = unitCells(kind, u);
      int emptyIdx = -1;

      for (int k = 0; k < 9; k++) {
        const int idx = unit[k];
        if (board.isSolved(idx)) {
          continue;
        }
        if (emptyIdx != -1) {
          emptyIdx = -2; // more than one empty
          break;
        }
        emptyIdx = idx;
      }

      if (emptyIdx >= 0) {
        const Mask missing = (Mask)(ALL_DIGITS & ~board.getPlacedMask(kind, u));
        if (countBits9(missing) == 1) {
          queue.enqueueSetValue(board, emptyIdx, bitToDigitSingle(missing), ReasonId::FullHouse);
        }
      }
    }
  }
  return true;
}

static bool techNakedSingles(const SudokuBoard &board, EventQueue &queue) {
  for (int i = 0; i < 81; i++) {
    if (board.isSolved(i)) {
      continue;
    }
    const size_t n = board.countCandidates(i);
    if (n == 0) {
      return false;
    }
    if (n == 1) {
      queue.enqueueSetValue(board, i, board.getSingleCandidate(i), ReasonId::NakedSingle);
    }
  }
  return true;
}

static bool techHiddenSingles(const SudokuBoard &board, EventQueue &queue) {
  for (UnitKind kind : UNIT_ORDER) {
    for (int u = 0; u < 9; u++) {
      const int *unit = unitCells(kind, u);
      const Mask placed = board.getPlacedMask(kind, u);

      for (Digit digit = 1; digit <= 9; digit++) {
        if (placed & digitToBit(digit)) {
          continue;
        }

        int foundIdx = -1;
        for (int k = 0; k < 9; k++) {
          const int idx = unit[k];
          if (board.isSolved(idx)) {
            continue;
          }
          if (board.hasCandidate(idx, digit)) {
            if (foundIdx != -1) {
              foundIdx = -2; // multiple places
              break;
            }
            foundIdx = idx;
          }
        }

        if (foundIdx == -1) {
          // digit has nowhere to go in this unit
          return false;
        }
        if (foundIdx >= 0) {
          queue.enqueueSetValue(board, foundIdx, digit, ReasonId::HiddenSingle);
        }
      }
    }
  }
  return true;
}

static bool techPointing(const SudokuBoard &board, EventQueue &queue) {
  // For each box and digit:
  //  - if all candidates are confined to a single row within the box,
  //    remove the digit from that row outside the box
  //  - same for a single column
  for (int b = 0; b < 9; b++) {
    for (Digit digit = 1; digit <= 9; digit++) {
      int positions[9];
      int posCount = 0;

      for (int k = 0; k < 9; k++) {
        const int idx = BOX_CELLS[b][k];
        if (board.isSolved(idx)) {
          continue;
        }
        if (board.hasCandidate(idx, digit)) {
          positions[posCount++] = idx;
        }
      }

      if (posCount < 2 || posCount > 3) {
        continue; // a box line holds at most 3 cells
      }

      const ReasonId reasonId = (posCount == 2) ? ReasonId::PointingPair : ReasonId::PointingTriple;

      const uint8_t r0 = idxRow(positions[0]);
      bool sameRow = true;
      for (int i = 1; i < posCount; i++) {
        if (idxRow(positions[i]) != r0) {
          sameRow = false;
          break;
        }
      }

      if (sameRow) {
        for (int k = 0; k < 9; k++) {
          const int idx = ROW_CELLS[r0][k];
          if (idxBox(idx) == (uint8_t)b) {
            continue;
          }
          queue.enqueueRemoveCandidate(board, idx, digit, reasonId);
        }
      }

      const uint8_t c0 = idxCol(positions[0]);
      bool sameCol = true;
      for (int i = 1; i < posCount; i++) {
        if (idxCol(positions[i]) != c0) {
          sameCol = false;
          break;
        }
      }

      if (sameCol) {
        for (int k = 0; k < 9; k++) {
          const int idx = COL_CELLS[c0][k];
          if (idxBox(idx) == (uint8_t)b) {
            continue;
          }
          queue.enqueueRemoveCandidate(board, idx, digit, reasonId);
        }
      }
    }
  }
  return true;
}

static bool techBoxLineReduction(const SudokuBoard &board, EventQueue &queue) {
  // For each row/column and digit: if all candidates lie in one box, remove
  // the digit from the rest of that box.
  static const UnitKind LINES[2] = { UnitKind::Row, UnitKind::Column };

  for (UnitKind kind : LINES) {
    for (int u = 0; u < 9; u++) {
      const int *line = unitCells(kind, u);

      for (Digit digit = 1; digit <= 9; digit++) {
        int box = -1;
        int posCount = 0;
        bool sameBox = true;

        for (int k = 0; k < 9; k++) {
          const int idx = line[k];
          if (board.isSolved(idx) || !board.hasCandidate(idx, digit)) {
            continue;
          }
          posCount++;
          if (box == -1) {
            box = idxBox(idx);
          } else if (idxBox(idx) != box) {
            sameBox = false;
            break;
          }
        }

        if (!sameBox || posCount < 2) {
          continue;
        }

        for (int k = 0; k < 9; k++) {
          const int idx = BOX_CELLS[box][k];
          const bool onLine = (kind == UnitKind::Row) ? (idxRow(idx) == u) : (idxCol(idx) == u);
          if (onLine) {
            continue;
          }
          queue.enqueueRemoveCandidate(board, idx, digit, ReasonId::BoxLineReduction);
        }
      }
    }
  }
  return true;
}

static bool techNakedPairs(const SudokuBoard &board, EventQueue &queue) {
  for (UnitKind kind : UNIT_ORDER) {
    for (int u = 0; u < 9; u++) {
      const int *unit = unitCells(kind, u);

      for (int a = 0; a < 9; a++) {
        const int ia = unit[a];
        if (board.isSolved(ia) || board.countCandidates(ia) != 2) {
          continue;
        }
        const Mask pair = board.getCandidateMask(ia);

        for (int b = a + 1; b < 9; b++) {
          const int ib = unit[b];
          if (board.isSolved(ib) || board.getCandidateMask(ib) != pair) {
            continue;
          }

          const Digit d1 = lowestDigit(pair);
          const Digit d2 = CandidateSet(pair).next(d1);
          for (int k = 0; k < 9; k++) {
            const int idx = unit[k];
            if (idx == ia || idx == ib) {
              continue;
            }
            queue.enqueueRemoveCandidate(board, idx, d1, ReasonId::NakedPair);
            queue.enqueueRemoveCandidate(board, idx, d2, ReasonId::NakedPair);
          }
        }
      }
    }
  }
  return true;
}

typedef bool (*TechniqueFn)(const SudokuBoard &, EventQueue &);

struct Technique {
  uint32_t flag;
  TechniqueFn fn;
};

// cheapest first
static const Technique TECHNIQUES[] =
{
  { TECH_FULL_HOUSE,    &techFullHouse },
  { TECH_NAKED_SINGLE,  &techNakedSingles },
  { TECH_HIDDEN_SINGLE, &techHiddenSingles },
  { TECH_POINTING,      &techPointing },
  { TECH_BOX_LINE,      &techBoxLineReduction },
  { TECH_NAKED_PAIR,    &techNakedPairs }
};

// =========================================================
// Propagator
// =========================================================

Propagator::Propagator(uint32_t techniques)
  : techniques((techniques & TECH_ALL) | TECH_SINGLES) { }

uint32_t Propagator::getTechniques() const {
  return techniques;
}

PropagationResult Propagator::propagate(SudokuBoard &board, SolveStats *stats) {
  queue.clear();
  return _run(board, stats);
}

PropagationResult Propagator::assignAndPropagate(SudokuBoard &board, Index idx, Digit digit,
                                                 ReasonId reason, SolveStats *stats) {
  queue.clear();
  if (!_apply(board, Event(EventType::SetValue, idx, digit, reason), stats)) {
    queue.clear();
    return PropagationResult::Contradiction;
  }
  return _run(board, stats);
}

PropagationResult Propagator::_run(SudokuBoard &board, SolveStats *stats) {
  if (!board.isValid()) {
    return PropagationResult::Contradiction;
  }

  for (;;) {
    // 1) Nothing pending: run techniques in priority order and stop at the
    //    first one that enqueues events.
    if (queue.empty()) {
      for (size_t i = 0; i < (sizeof(TECHNIQUES) / sizeof(TECHNIQUES[0])); i++) {
        if ((techniques & TECHNIQUES[i].flag) == 0) {
          continue;
        }
        if (!TECHNIQUES[i].fn(board, queue)) {
          queue.clear();
          return PropagationResult::Contradiction;
        }
        if (!queue.empty()) {
          break;
        }
      }

      if (queue.empty()) {
        return PropagationResult::Quiescent;
      }
    }

    // 2) Apply everything that was produced, including naked singles
    //    uncovered along the way.
    while (!queue.empty()) {
      const Event ev = queue.front();
      queue.pop();

      if (!_apply(board, ev, stats)) {
        SUDOCORE_LOG(LogLevel::Debug, "contradiction applying %s r%dc%d=%d",
                     reasonName(ev.reason), idxRow(ev.idx) + 1, idxCol(ev.idx) + 1, (int)ev.digit);
        queue.clear();
        return PropagationResult::Contradiction;
      }
    }
  }
}

bool Propagator::_apply(SudokuBoard &board, const Event &ev, SolveStats *stats) {
  if (ev.type == EventType::SetValue) {
    if (board.isSolved(ev.idx)) {
      // stale event: fine if it agrees with what is already there
      return board.getValue(ev.idx) == ev.digit;
    }

    ForcedCells forced;
    if (!board.assign(ev.idx, ev.digit, &forced)) {
      return false;
    }
    if (stats) {
      stats->applied[static_cast<int>(ev.reason)]++;
    }
    for (int k = 0; k < forced.count; k++) {
      const Index p = forced.idx[k];
      queue.enqueueSetValue(board, p, board.getSingleCandidate(p), ReasonId::NakedSingle);
    }
    return true;
  }

  if (ev.type == EventType::RemoveCandidate) {
    if (board.isSolved(ev.idx)) {
      return board.getValue(ev.idx) != ev.digit;
    }

    switch (board.eliminate(ev.idx, ev.digit)) {
      case ElimResult::Empty:
        return false;
      case ElimResult::Single:
        queue.enqueueSetValue(board, ev.idx, board.getSingleCandidate(ev.idx), ReasonId::NakedSingle);
        break;
      case ElimResult::Unchanged:
        return true;
      case ElimResult::Removed:
        break;
    }
    if (stats) {
      stats->applied[static_cast<int>(ev.reason)]++;
    }
    return true;
  }

  return true;
}
