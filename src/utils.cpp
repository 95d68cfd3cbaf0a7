#include "utils.hpp"

// =========================================================
// Peer table
// =========================================================

namespace {

struct PeerTable {
  int peers[81][NUM_PEERS];

  PeerTable() {
    for (int idx = 0; idx < 81; idx++) {
      const int r = idxRow(idx);
      const int c = idxCol(idx);
      const int b = idxBox(idx);
      int n = 0;
      // row-major scan keeps every list ascending
      for (int other = 0; other < 81; other++) {
        if (other == idx) {
          continue;
        }
        if (idxRow(other) == r || idxCol(other) == c || idxBox(other) == b) {
          peers[idx][n++] = other;
        }
      }
    }
  }
};

} // namespace

const int *peersOf(int idx) {
  static const PeerTable table;
  return table.peers[idx];
}
