#pragma once
#include "virusbot/game_state.hpp"
#include "virusbot/move.hpp"
#include "virusbot_ai/config.hpp"
#include "virusbot_ai/heuristic_policy.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace virusbot_ai {

/**
 * MCTSノード
 *
 * Holds its own state snapshot. `untried_moves` are the moves of the
 * state's current player that have no child yet. Players without a legal
 * move are skipped when the node is built, so every non-terminal node has
 * something to expand.
 */
struct MCTSNode {
  virusbot::GameState state;
  virusbot::Move move;  // このノードに至った手
  MCTSNode* parent;
  std::vector<std::unique_ptr<MCTSNode>> children;
  std::vector<virusbot::Move> untried_moves;

  int visits;
  double total_value;
  bool is_terminal;

  MCTSNode(const virusbot::GameState& s, const virusbot::Move& m, MCTSNode* p)
    : state(s), move(m), parent(p), visits(0), total_value(0.0), is_terminal(false) {}

  float ucb1(float exploration_constant) const {
    if (visits == 0) return std::numeric_limits<float>::infinity();
    // rewards are always from the acting player's view, no negation
    float exploitation = static_cast<float>(total_value / visits);
    float exploration = exploration_constant * std::sqrt(std::log(static_cast<float>(parent->visits)) / visits);
    return exploitation + exploration;
  }

  double average_value() const {
    return visits > 0 ? total_value / visits : 0.0;
  }
};

/**
 * UCT search over the acting player's turn.
 *
 * The turn budget (iteration cap and wall-clock time) is shared by all the
 * actions of the turn: it is split evenly over the actions still to choose,
 * the most visited child of the current root is taken, and that child
 * becomes the root for the next action. Rollouts are uniform random.
 */
class MCTS {
public:
  MCTS();
  explicit MCTS(const SearchConfig& config, const EvaluationWeights& weights = EvaluationWeights(),
                bool verbose = false);

  std::vector<virusbot::Move> decide_moves(const virusbot::GameState& s, int count);

  // block placement is not searched
  std::vector<virusbot::Position> decide_blocks(const virusbot::GameState& s) const;

  void set_exploration_constant(float c) { config_.exploration = c; }
  void set_verbose(bool v) { verbose_ = v; }
  const SearchConfig& config() const { return config_; }

  // tree and iteration count of the last decide_moves call (tests, logging)
  const MCTSNode* last_root() const { return root_.get(); }
  int last_iterations() const { return last_iterations_; }

private:
  using Clock = std::chrono::steady_clock;

  struct SearchContext {
    MCTSNode* root = nullptr;  // current selection root
    std::mutex tree_mutex;
    std::atomic<int> started{0};
    std::atomic<int> completed{0};
  };

  // MCTS操作
  MCTSNode* select(MCTSNode* node) const;
  MCTSNode* expand(MCTSNode* node, std::mt19937& rng) const;
  float simulate(virusbot::GameState state, std::mt19937& rng) const;
  void backpropagate(MCTSNode* node, float value) const;

  // ヘルパー関数
  void init_node(MCTSNode& node) const;
  float terminal_reward(const virusbot::GameState& state) const;
  bool claim_iteration(SearchContext& ctx, int cap) const;
  void worker(SearchContext& ctx, int cap, Clock::time_point deadline, uint32_t seed) const;
  void run_slice(SearchContext& ctx, int cap, Clock::time_point deadline);

  SearchConfig config_;
  HeuristicPolicy fallback_;
  bool verbose_;
  std::mt19937 rng_;
  std::unique_ptr<MCTSNode> root_;
  int last_iterations_ = 0;
};

} // namespace virusbot_ai
