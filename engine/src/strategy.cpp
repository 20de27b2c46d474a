#include "virusbot_ai/strategy.hpp"
#include <iostream>

using namespace virusbot;

namespace virusbot_ai {

StrategyType parse_strategy_type(const std::string& name) {
  if (name == "mcts" || name == "MCTS") {
    return StrategyType::MCTS;
  }
  return StrategyType::HEURISTIC;
}

StrategyType Strategy::type() const {
  return std::holds_alternative<MCTS>(impl_) ? StrategyType::MCTS : StrategyType::HEURISTIC;
}

std::string Strategy::name() const {
  return type() == StrategyType::MCTS ? "mcts" : "heuristic";
}

std::vector<Move> Strategy::decide_moves(const GameState& s, int count) {
  return std::visit([&](auto& impl) { return impl.decide_moves(s, count); }, impl_);
}

std::vector<Position> Strategy::decide_blocks(const GameState& s) {
  return std::visit([&](auto& impl) { return impl.decide_blocks(s); }, impl_);
}

Strategy make_strategy(const EngineConfig& config) {
  if (parse_strategy_type(config.strategy) == StrategyType::MCTS) {
    if (config.verbose) {
      std::cerr << "[Strategy] mcts: iterations=" << config.search.iterations
                << " time=" << config.search.time_ms << "ms"
                << " uct=" << config.search.exploration
                << " threads=" << config.search.threads << std::endl;
    }
    return Strategy(MCTS(config.search, config.weights, config.verbose));
  }
  if (config.verbose) {
    std::cerr << "[Strategy] heuristic" << std::endl;
  }
  return Strategy(HeuristicPolicy(config.weights, config.verbose));
}

} // namespace virusbot_ai
