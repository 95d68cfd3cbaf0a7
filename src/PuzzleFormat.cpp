#include "PuzzleFormat.hpp"

#include <sstream>

static inline bool isSeparatorChar(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '|' || c == '-' || c == '+';
}

bool parse81(const std::string &text, uint8_t *values, std::string *why) {
  int tokens = 0;
  for (size_t i = 0; i < text.size(); i++) {
    const char ch = text[i];
    if (isSeparatorChar(ch)) {
      continue;
    }

    uint8_t v;
    if (ch >= '1' && ch <= '9') {
      v = (uint8_t)(ch - '0');
    } else if (ch == '0' || ch == '.') {
      v = 0;
    } else {
      if (why) {
        std::ostringstream oss;
        oss << "Invalid character '" << ch << "' at offset " << i << " (allowed: 0-9 or .)";
        *why = oss.str();
      }
      return false;
    }

    if (tokens == 81) {
      if (why) {
        *why = "More than 81 cells";
      }
      return false;
    }
    values[tokens++] = v;
  }

  if (tokens < 81) {
    if (why) {
      std::ostringstream oss;
      oss << "Expected 81 cells, got " << tokens;
      *why = oss.str();
    }
    return false;
  }
  return true;
}

std::string format81(const uint8_t *values, char blank) {
  std::string out(81, blank);
  for (int i = 0; i < 81; i++) {
    if (values[i] >= 1 && values[i] <= 9) {
      out[i] = (char)('0' + values[i]);
    }
  }
  return out;
}

std::string formatGrid(const uint8_t *values) {
  std::string out;
  out.reserve(9 * 18);
  for (int r = 0; r < 9; r++) {
    for (int c = 0; c < 9; c++) {
      const uint8_t v = values[r * 9 + c];
      if (c > 0) {
        out.push_back(' ');
      }
      out.push_back((v >= 1 && v <= 9) ? (char)('0' + v) : '0');
    }
    out.push_back('\n');
  }
  return out;
}
