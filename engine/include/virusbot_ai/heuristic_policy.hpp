#pragma once
#include "virusbot/game_state.hpp"
#include "virusbot/move.hpp"
#include "virusbot_ai/config.hpp"
#include <vector>

namespace virusbot_ai {

// Per-factor contributions of one move, each already weighted.
struct MoveScore {
  double territory = 0.0;
  double strategic = 0.0;
  double threat = 0.0;
  double connectivity = 0.0;
  double expansion = 0.0;
  double defensive = 0.0;

  double total() const {
    return territory + strategic + threat + connectivity + expansion + defensive;
  }
};

struct ScoredMove {
  virusbot::Move move;
  MoveScore score;
};

// Deterministic multi-factor policy:
//   1. territory gain      (every move)
//   2. strategic position  (corner > edge)
//   3. threat removal      (attacks only)
//   4. connectivity repair
//   5. expansion potential (empty neighbours of the target)
//   6. defensive value     (near own base / contesting an opponent base)
class HeuristicPolicy {
public:
  HeuristicPolicy();
  explicit HeuristicPolicy(const EvaluationWeights& weights, bool verbose = false);

  // Up to `count` moves for the acting player; empty when it is not the
  // acting player's turn or nothing is legal.
  std::vector<virusbot::Move> decide_moves(const virusbot::GameState& s, int count) const;

  // Two cells to neutralize, or empty when the allowance is gone or fewer
  // than two cells qualify.
  std::vector<virusbot::Position> decide_blocks(const virusbot::GameState& s) const;

  MoveScore score_move(const virusbot::GameState& s, const virusbot::Move& m) const;
  double score_block(const virusbot::GameState& s, const virusbot::Position& p) const;

  // All legal moves for the acting player, scored and ranked (stable).
  std::vector<ScoredMove> rank_moves(const virusbot::GameState& s) const;

  const EvaluationWeights& weights() const { return weights_; }

private:
  MoveScore score_move(const virusbot::GameState& s, const virusbot::Move& m,
                       const std::vector<virusbot::Position>& reachable) const;
  bool improves_connectivity(const virusbot::Board& b,
                             const std::vector<virusbot::Position>& reachable,
                             const virusbot::Position& target) const;
  bool has_defensive_value(const virusbot::GameState& s, const virusbot::Position& target) const;
  std::vector<virusbot::Move> select_diverse(const std::vector<ScoredMove>& ranked, int count) const;

  EvaluationWeights weights_;
  bool verbose_;
};

} // namespace virusbot_ai
