#pragma once
#include "virusbot/types.hpp"
#include "virusbot/move.hpp"
#include <vector>

namespace virusbot {

class Board; // forward

namespace Rules {
  // owned cells connected to the player's base (or to the first owned cell
  // once the base is lost), in BFS order
  std::vector<Position> reachable_cells(const Board& b, PlayerId player);
  bool is_legal_origin(const Board& b, PlayerId player, const Position& p);

  void legal_moves(const Board& b, PlayerId player, std::vector<Move>& out);
  std::vector<Move> legal_moves(const Board& b, PlayerId player);
  bool is_valid_move(const Board& b, PlayerId player, const Move& m);

  std::vector<Position> legal_block_positions(const Board& b, PlayerId player);
}

} // namespace virusbot
