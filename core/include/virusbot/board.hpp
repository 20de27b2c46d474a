#pragma once
#include "virusbot/types.hpp"
#include "virusbot/position.hpp"
#include "virusbot/move.hpp"
#include <map>
#include <string>
#include <vector>

namespace virusbot {

struct Cell {
  PlayerId owner = kNoPlayer;
  CellFlag flag = CellFlag::Normal;

  bool is_empty() const { return owner == kNoPlayer; }
  // killed cells and neutral placements are out of play for everybody
  bool is_inert() const { return owner == kNeutralOwner || flag == CellFlag::Killed; }
  bool is_owned_by(PlayerId p) const { return p != kNoPlayer && owner == p && !is_inert(); }
  bool is_attackable_by(PlayerId p) const {
    return owner != kNoPlayer && owner != p && !is_inert() && flag == CellFlag::Normal;
  }

  // owner in the low nibble, flag in bits 0x30; neutral cells travel as the
  // bare neutral owner
  static Cell from_packed(int value);
  int packed() const {
    if (owner == kNeutralOwner) return kNeutralOwner;
    return owner | static_cast<int>(flag);
  }
};

inline bool operator==(const Cell& a, const Cell& b) {
  return a.owner == b.owner && a.flag == b.flag;
}

inline bool operator!=(const Cell& a, const Cell& b) {
  return !(a == b);
}

class Board {
public:
  Board();
  explicit Board(int size);

  // rows of packed cell values as delivered by the game server
  static Board from_packed(const std::vector<std::vector<int>>& rows,
                           const std::map<PlayerId, Position>& bases);

  int size() const { return size_; }

  bool in_bounds(const Position& p) const {
    return p.row >= 0 && p.row < size_ && p.col >= 0 && p.col < size_;
  }

  int index_of(const Position& p) const { return p.row * size_ + p.col; }

  // out-of-bounds reads yield an empty cell
  Cell cell(const Position& p) const;
  void set_cell(const Position& p, const Cell& c);

  bool is_empty(const Position& p) const { return in_bounds(p) && cell(p).is_empty(); }
  bool is_owned_by(const Position& p, PlayerId player) const { return cell(p).is_owned_by(player); }
  bool is_attackable_by(const Position& p, PlayerId player) const { return cell(p).is_attackable_by(player); }
  bool is_neutral(const Position& p) const { return in_bounds(p) && cell(p).is_inert(); }

  std::vector<Position> neighbors(const Position& p) const;
  bool is_adjacent(const Position& a, const Position& b) const;
  int empty_neighbor_count(const Position& p) const;

  bool is_edge(const Position& p) const;
  bool is_corner(const Position& p) const;

  void set_base(PlayerId player, const Position& p) { bases_[player] = p; }
  bool has_base(PlayerId player) const { return bases_.count(player) != 0; }
  // returns false when the player has no recorded base
  bool base_of(PlayerId player, Position& out) const;
  const std::map<PlayerId, Position>& bases() const { return bases_; }

  int count_cells(PlayerId player) const;
  std::vector<Position> player_cells(PlayerId player) const;
  std::vector<Position> empty_cells() const;

  // copy with the target claimed by `player`; the receiver is left untouched
  Board apply(const Move& m, PlayerId player) const;

  std::string to_string() const;

private:
  int size_;
  std::vector<Cell> cells_;
  std::map<PlayerId, Position> bases_;
};

} // namespace virusbot
