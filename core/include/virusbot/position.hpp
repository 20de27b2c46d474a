#pragma once
#include <ostream>

namespace virusbot {

struct Position {
  int row = 0;
  int col = 0;
};

inline bool operator==(const Position& a, const Position& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Position& a, const Position& b) {
  return !(a == b);
}

inline bool operator<(const Position& a, const Position& b) {
  return a.row != b.row ? a.row < b.row : a.col < b.col;
}

inline std::ostream& operator<<(std::ostream& os, const Position& p) {
  return os << "(" << p.row << "," << p.col << ")";
}

} // namespace virusbot
