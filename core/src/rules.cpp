#include "virusbot/rules.hpp"
#include "virusbot/board.hpp"
#include <deque>

namespace virusbot {

namespace {

// BFS start: the base while the player still holds it, otherwise the first
// owned cell in row-major order.
bool find_bfs_start(const Board& b, PlayerId player, Position& start) {
  Position base;
  if (b.base_of(player, base) && b.is_owned_by(base, player)) {
    start = base;
    return true;
  }
  for (int r = 0; r < b.size(); ++r) {
    for (int c = 0; c < b.size(); ++c) {
      if (b.is_owned_by({r, c}, player)) {
        start = {r, c};
        return true;
      }
    }
  }
  return false;
}

} // namespace

std::vector<Position> Rules::reachable_cells(const Board& b, PlayerId player) {
  std::vector<Position> out;
  Position start;
  if (!find_bfs_start(b, player, start)) return out;

  std::vector<char> visited(static_cast<size_t>(b.size() * b.size()), 0);
  std::deque<Position> queue;
  queue.push_back(start);
  visited[b.index_of(start)] = 1;

  while (!queue.empty()) {
    Position cur = queue.front();
    queue.pop_front();
    out.push_back(cur);
    for (int i = 0; i < kNeighborDirections; ++i) {
      Position n{cur.row + DIRS[i][0], cur.col + DIRS[i][1]};
      if (!b.in_bounds(n)) continue;
      if (visited[b.index_of(n)]) continue;
      if (!b.is_owned_by(n, player)) continue;
      visited[b.index_of(n)] = 1;
      queue.push_back(n);
    }
  }
  return out;
}

bool Rules::is_legal_origin(const Board& b, PlayerId player, const Position& p) {
  if (!b.is_owned_by(p, player)) return false;
  for (const auto& q : reachable_cells(b, player)) {
    if (q == p) return true;
  }
  return false;
}

void Rules::legal_moves(const Board& b, PlayerId player, std::vector<Move>& out) {
  out.clear();
  if (player == kNoPlayer || player == kNeutralOwner) return;

  std::vector<Position> origins = reachable_cells(b, player);

  // no territory yet: initial placement on any empty cell
  if (origins.empty()) {
    for (const auto& p : b.empty_cells()) {
      Move m;
      m.type = MoveType::Grow;
      m.target = p;
      m.origin = p;
      out.push_back(m);
    }
    return;
  }

  std::vector<char> seen(static_cast<size_t>(b.size() * b.size()), 0);
  for (const auto& from : origins) {
    for (int i = 0; i < kNeighborDirections; ++i) {
      Position to{from.row + DIRS[i][0], from.col + DIRS[i][1]};
      if (!b.in_bounds(to)) continue;
      if (seen[b.index_of(to)]) continue;

      const Cell c = b.cell(to);
      Move m;
      m.target = to;
      m.origin = from;
      if (c.is_empty()) {
        m.type = MoveType::Grow;
      } else if (c.is_attackable_by(player)) {
        m.type = MoveType::Attack;
      } else {
        continue;
      }
      seen[b.index_of(to)] = 1;
      out.push_back(m);
    }
  }
}

std::vector<Move> Rules::legal_moves(const Board& b, PlayerId player) {
  std::vector<Move> out;
  legal_moves(b, player, out);
  return out;
}

bool Rules::is_valid_move(const Board& b, PlayerId player, const Move& m) {
  if (player == kNoPlayer || player == kNeutralOwner) return false;
  if (!b.in_bounds(m.target)) return false;

  if (b.count_cells(player) == 0) {
    return m.type == MoveType::Grow && m.origin == m.target && b.is_empty(m.target);
  }

  if (!b.is_adjacent(m.origin, m.target)) return false;
  if (!is_legal_origin(b, player, m.origin)) return false;

  switch (m.type) {
    case MoveType::Grow:
      return b.is_empty(m.target);
    case MoveType::Attack:
      return b.is_attackable_by(m.target, player);
  }
  return false;
}

std::vector<Position> Rules::legal_block_positions(const Board& b, PlayerId player) {
  // owned cells are never inert, so every owned cell qualifies
  return b.player_cells(player);
}

} // namespace virusbot
