#include "virusbot/game_state.hpp"
#include <utility>

namespace virusbot {

GameState::GameState() = default;

GameState::GameState(Board board, std::vector<Player> players, PlayerId current, PlayerId acting)
  : board_(std::move(board)), players_(std::move(players)), current_(current), acting_(acting) {}

GameState GameState::new_game(int size, const std::vector<Player>& players, PlayerId acting) {
  Board b(size);
  for (const auto& p : players) {
    Cell base;
    base.owner = p.id;
    base.flag = CellFlag::Base;
    b.set_cell(p.base, base);
    b.set_base(p.id, p.base);
  }
  PlayerId first = players.empty() ? kNoPlayer : players.front().id;
  return GameState(std::move(b), players, first, acting);
}

const Player* GameState::find_player(PlayerId id) const {
  for (const auto& p : players_) {
    if (p.id == id) return &p;
  }
  return nullptr;
}

Player* GameState::find_player(PlayerId id) {
  for (auto& p : players_) {
    if (p.id == id) return &p;
  }
  return nullptr;
}

std::vector<PlayerId> GameState::alive_players() const {
  std::vector<PlayerId> out;
  for (const auto& p : players_) {
    if (p.alive) out.push_back(p.id);
  }
  return out;
}

int GameState::alive_count() const {
  int n = 0;
  for (const auto& p : players_) {
    if (p.alive) ++n;
  }
  return n;
}

std::vector<PlayerId> GameState::opponents_of(PlayerId id) const {
  std::vector<PlayerId> out;
  for (const auto& p : players_) {
    if (p.id != id && p.alive) out.push_back(p.id);
  }
  return out;
}

PlayerId GameState::sole_survivor() const {
  PlayerId survivor = kNoPlayer;
  for (const auto& p : players_) {
    if (!p.alive) continue;
    if (survivor != kNoPlayer) return kNoPlayer;
    survivor = p.id;
  }
  return survivor;
}

void GameState::set_actions_per_turn(int n) {
  actions_per_turn_ = n > 0 ? n : 1;
  actions_remaining_ = actions_per_turn_;
}

void GameState::begin_turn(int actions) {
  actions_remaining_ = actions > 0 ? actions : 1;
}

GameState GameState::apply(const Move& m) const {
  GameState next = *this;
  next.apply_move(m);
  return next;
}

void GameState::apply_move(const Move& m) {
  if (!board_.in_bounds(m.target)) return;
  Player* mover = find_player(current_);
  if (mover == nullptr) return;

  const Cell before = board_.cell(m.target);
  Cell claimed;
  claimed.owner = mover->id;
  claimed.flag = CellFlag::Normal;
  board_.set_cell(m.target, claimed);

  if (m.type == MoveType::Attack && before.owner != kNoPlayer && before.owner != mover->id) {
    refresh_alive(before.owner);
  }
  refresh_alive(mover->id);

  if (--actions_remaining_ <= 0) {
    advance_turn();
  }
}

GameState GameState::apply_blocks(const std::vector<Position>& positions) const {
  GameState next = *this;
  next.place_blocks(positions);
  return next;
}

void GameState::place_blocks(const std::vector<Position>& positions) {
  Player* me = find_player(acting_);
  if (me == nullptr || me->used_neutrals) return;

  int placed = 0;
  for (const auto& p : positions) {
    if (placed >= kBlocksPerGame) break;
    if (!board_.is_owned_by(p, me->id)) continue;
    Cell blocked;
    blocked.owner = kNeutralOwner;
    blocked.flag = CellFlag::Killed;
    board_.set_cell(p, blocked);
    ++placed;
  }

  me->used_neutrals = true;
  refresh_alive(me->id);
  advance_turn();
}

void GameState::advance_turn() {
  actions_remaining_ = actions_per_turn_;
  const int n = static_cast<int>(players_.size());
  if (n == 0) return;

  int idx = n - 1;
  for (int i = 0; i < n; ++i) {
    if (players_[i].id == current_) {
      idx = i;
      break;
    }
  }
  for (int k = 1; k <= n; ++k) {
    const Player& next = players_[(idx + k) % n];
    if (next.alive) {
      current_ = next.id;
      return;
    }
  }
}

void GameState::refresh_alive(PlayerId id) {
  Player* p = find_player(id);
  if (p == nullptr) return;
  p->alive = board_.count_cells(id) > 0;
}

} // namespace virusbot
