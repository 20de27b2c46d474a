#include "virusbot/board.hpp"
#include <cstdlib>
#include <sstream>

namespace virusbot {

Cell Cell::from_packed(int value) {
  Cell c;
  const int owner = value & kOwnerMask;
  const int flag = value & kFlagMask;
  if (owner == kNoPlayer || owner > kNeutralOwner) {
    // unowned cells never carry a flag
    return c;
  }
  c.owner = owner;
  c.flag = (owner == kNeutralOwner) ? CellFlag::Killed : static_cast<CellFlag>(flag);
  return c;
}

Board::Board() : Board(kDefaultBoardSize) {}

Board::Board(int size) : size_(size > 0 ? size : 0), cells_(static_cast<size_t>(size_ * size_)) {}

Board Board::from_packed(const std::vector<std::vector<int>>& rows,
                         const std::map<PlayerId, Position>& bases) {
  Board b(static_cast<int>(rows.size()));
  for (int r = 0; r < b.size_; ++r) {
    const auto& row = rows[r];
    for (int c = 0; c < b.size_ && c < static_cast<int>(row.size()); ++c) {
      b.cells_[b.index_of({r, c})] = Cell::from_packed(row[c]);
    }
  }
  b.bases_ = bases;
  return b;
}

Cell Board::cell(const Position& p) const {
  if (!in_bounds(p)) return Cell();
  return cells_[index_of(p)];
}

void Board::set_cell(const Position& p, const Cell& c) {
  if (!in_bounds(p)) return;
  Cell& dst = cells_[index_of(p)];
  dst = c;
  if (dst.owner == kNoPlayer) dst.flag = CellFlag::Normal;
}

std::vector<Position> Board::neighbors(const Position& p) const {
  std::vector<Position> out;
  out.reserve(kNeighborDirections);
  if (!in_bounds(p)) return out;
  for (int i = 0; i < kNeighborDirections; ++i) {
    Position n{p.row + DIRS[i][0], p.col + DIRS[i][1]};
    if (in_bounds(n)) out.push_back(n);
  }
  return out;
}

bool Board::is_adjacent(const Position& a, const Position& b) const {
  if (!in_bounds(a) || !in_bounds(b)) return false;
  const int dr = std::abs(a.row - b.row);
  const int dc = std::abs(a.col - b.col);
  return dr <= 1 && dc <= 1 && (dr != 0 || dc != 0);
}

int Board::empty_neighbor_count(const Position& p) const {
  int n = 0;
  for (const auto& q : neighbors(p)) {
    if (is_empty(q)) ++n;
  }
  return n;
}

bool Board::is_edge(const Position& p) const {
  if (!in_bounds(p)) return false;
  return p.row == 0 || p.row == size_ - 1 || p.col == 0 || p.col == size_ - 1;
}

bool Board::is_corner(const Position& p) const {
  if (!in_bounds(p)) return false;
  return (p.row == 0 || p.row == size_ - 1) && (p.col == 0 || p.col == size_ - 1);
}

bool Board::base_of(PlayerId player, Position& out) const {
  auto it = bases_.find(player);
  if (it == bases_.end()) return false;
  out = it->second;
  return true;
}

int Board::count_cells(PlayerId player) const {
  int n = 0;
  for (const auto& c : cells_) {
    if (c.is_owned_by(player)) ++n;
  }
  return n;
}

std::vector<Position> Board::player_cells(PlayerId player) const {
  std::vector<Position> out;
  for (int r = 0; r < size_; ++r) {
    for (int c = 0; c < size_; ++c) {
      if (cells_[r * size_ + c].is_owned_by(player)) out.push_back({r, c});
    }
  }
  return out;
}

std::vector<Position> Board::empty_cells() const {
  std::vector<Position> out;
  for (int r = 0; r < size_; ++r) {
    for (int c = 0; c < size_; ++c) {
      if (cells_[r * size_ + c].is_empty()) out.push_back({r, c});
    }
  }
  return out;
}

Board Board::apply(const Move& m, PlayerId player) const {
  Board next = *this;
  Cell claimed;
  claimed.owner = player;
  claimed.flag = CellFlag::Normal;
  next.set_cell(m.target, claimed);
  return next;
}

std::string Board::to_string() const {
  // '.' empty, 'x' inert, digit = owner, 'A'.. base, 'a'.. fortified
  std::ostringstream ss;
  for (int r = 0; r < size_; ++r) {
    for (int c = 0; c < size_; ++c) {
      const Cell& cell = cells_[r * size_ + c];
      char ch = '.';
      if (cell.is_inert()) {
        ch = 'x';
      } else if (cell.owner != kNoPlayer) {
        switch (cell.flag) {
          case CellFlag::Base:      ch = static_cast<char>('A' + cell.owner - 1); break;
          case CellFlag::Fortified: ch = static_cast<char>('a' + cell.owner - 1); break;
          default:                  ch = static_cast<char>('0' + cell.owner); break;
        }
      }
      ss << ch;
      if (c + 1 < size_) ss << ' ';
    }
    ss << '\n';
  }
  return ss.str();
}

} // namespace virusbot
