#pragma once
#include "virusbot/types.hpp"
#include "virusbot/position.hpp"
#include <ostream>

namespace virusbot {

struct Move {
  MoveType type = MoveType::Grow;
  // cell being claimed
  Position target;
  // owned cell the move expands from (equal to target for an initial placement)
  Position origin;
};

inline bool operator==(const Move& a, const Move& b) {
  return a.type == b.type && a.target == b.target && a.origin == b.origin;
}

inline bool operator!=(const Move& a, const Move& b) {
  return !(a == b);
}

inline std::ostream& operator<<(std::ostream& os, const Move& m) {
  os << (m.type == MoveType::Attack ? "attack " : "grow ") << m.target
     << " from " << m.origin;
  return os;
}

} // namespace virusbot
