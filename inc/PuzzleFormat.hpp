#ifndef PUZZLE_FORMAT_H
#define PUZZLE_FORMAT_H

#include <cstdint>
#include <string>

// Text <-> values[81] (0 = empty, 1..9 = digit), row-major.
//
// Accepted input: digits 1-9 are givens, '0' or '.' are empty cells.
// Whitespace and the box drawing characters '|', '-', '+' are skipped, so
// both the single 81-character line and a boxed 9-line layout parse.
bool parse81(const std::string &text, uint8_t *values, std::string *why = nullptr);

// single line, blank cells rendered as `blank`
std::string format81(const uint8_t *values, char blank = '.');

// nine lines of space separated digits, blanks as 0
std::string formatGrid(const uint8_t *values);

#endif // PUZZLE_FORMAT_H
