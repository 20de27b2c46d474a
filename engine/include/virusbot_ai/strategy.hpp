#pragma once
#include "virusbot/game_state.hpp"
#include "virusbot_ai/config.hpp"
#include "virusbot_ai/heuristic_policy.hpp"
#include "virusbot_ai/mcts.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace virusbot_ai {

enum class StrategyType {
  HEURISTIC,
  MCTS
};

// "mcts" / "MCTS" select the search, anything else the heuristic
StrategyType parse_strategy_type(const std::string& name);

// Closed set of decision strategies behind one capability.
class Strategy {
public:
  explicit Strategy(HeuristicPolicy policy) : impl_(std::move(policy)) {}
  explicit Strategy(MCTS search) : impl_(std::move(search)) {}

  StrategyType type() const;
  std::string name() const;

  std::vector<virusbot::Move> decide_moves(const virusbot::GameState& s, int count);
  std::vector<virusbot::Position> decide_blocks(const virusbot::GameState& s);

private:
  std::variant<HeuristicPolicy, MCTS> impl_;
};

Strategy make_strategy(const EngineConfig& config);

} // namespace virusbot_ai
