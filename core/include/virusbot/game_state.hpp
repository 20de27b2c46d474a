#pragma once
#include "virusbot/board.hpp"
#include "virusbot/types.hpp"
#include "virusbot/move.hpp"
#include <string>
#include <vector>

namespace virusbot {

struct Player {
  PlayerId id = kNoPlayer;
  std::string name;
  Position base;
  bool alive = true;
  bool used_neutrals = false;
};

class GameState {
public:
  GameState();
  GameState(Board board, std::vector<Player> players, PlayerId current, PlayerId acting);

  // Fresh game: square board, each player's base placed and flagged.
  static GameState new_game(int size, const std::vector<Player>& players, PlayerId acting);

  const Board& board() const { return board_; }
  Board& board() { return board_; }

  const std::vector<Player>& players() const { return players_; }

  PlayerId current_player() const { return current_; }
  PlayerId acting_player() const { return acting_; }
  void set_current_player(PlayerId p) { current_ = p; }
  void set_acting_player(PlayerId p) { acting_ = p; }
  bool is_acting_turn() const { return current_ == acting_; }

  // returns nullptr when the id is not in the roster
  const Player* find_player(PlayerId id) const;
  Player* find_player(PlayerId id);

  std::vector<PlayerId> alive_players() const;
  int alive_count() const;
  std::vector<PlayerId> opponents_of(PlayerId id) const;
  bool is_terminal() const { return alive_count() <= 1; }
  // kNoPlayer unless exactly one player is alive
  PlayerId sole_survivor() const;

  int actions_per_turn() const { return actions_per_turn_; }
  int actions_remaining() const { return actions_remaining_; }
  void set_actions_per_turn(int n);
  void begin_turn(int actions);

  GameState apply(const Move& m) const;
  void apply_move(const Move& m);

  GameState apply_blocks(const std::vector<Position>& positions) const;
  void place_blocks(const std::vector<Position>& positions);

  void advance_turn();

private:
  void refresh_alive(PlayerId id);

  Board board_;
  std::vector<Player> players_;
  PlayerId current_ = kNoPlayer;
  PlayerId acting_ = kNoPlayer;
  int actions_per_turn_ = 1;
  int actions_remaining_ = 1;
};

} // namespace virusbot
