#include "virusbot_ai/mcts.hpp"
#include "virusbot/rules.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>

using namespace virusbot_ai;
using namespace virusbot;

MCTS::MCTS() : MCTS(SearchConfig()) {}

MCTS::MCTS(const SearchConfig& config, const EvaluationWeights& weights, bool verbose)
  : config_(config), fallback_(weights, verbose), verbose_(verbose),
    rng_(config.seed != 0 ? static_cast<uint32_t>(config.seed)
                          : static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count())) {
}

/**
 * ノード初期化: 合法手を列挙し、手がないプレイヤーは手番を飛ばす
 */
void MCTS::init_node(MCTSNode& node) const {
  GameState& st = node.state;
  if (st.is_terminal()) {
    node.is_terminal = true;
    return;
  }

  const int num_players = static_cast<int>(st.players().size());
  int skips = 0;
  while (true) {
    Rules::legal_moves(st.board(), st.current_player(), node.untried_moves);
    if (!node.untried_moves.empty()) return;
    if (++skips > num_players) {
      // nobody can move
      node.is_terminal = true;
      return;
    }
    st.advance_turn();
  }
}

float MCTS::terminal_reward(const GameState& state) const {
  return state.sole_survivor() == state.acting_player() ? 1.0f : 0.0f;
}

/**
 * Selection: UCB1を使って探索すべきノードを選択
 */
MCTSNode* MCTS::select(MCTSNode* node) const {
  while (!node->is_terminal && node->untried_moves.empty()) {
    if (node->children.empty()) {
      return node;
    }

    MCTSNode* best_child = nullptr;
    float best_ucb = -std::numeric_limits<float>::infinity();
    for (auto& child : node->children) {
      float ucb = child->ucb1(config_.exploration);
      if (ucb > best_ucb) {
        best_ucb = ucb;
        best_child = child.get();
      }
    }
    node = best_child;
  }
  return node;
}

/**
 * Expansion: 未試行の手から1つ選んで子ノードを作る
 */
MCTSNode* MCTS::expand(MCTSNode* node, std::mt19937& rng) const {
  if (node->is_terminal || node->untried_moves.empty()) {
    return node;
  }

  std::uniform_int_distribution<size_t> dist(0, node->untried_moves.size() - 1);
  size_t idx = dist(rng);
  Move move = node->untried_moves[idx];
  node->untried_moves[idx] = node->untried_moves.back();
  node->untried_moves.pop_back();

  auto child = std::make_unique<MCTSNode>(node->state.apply(move), move, node);
  init_node(*child);
  MCTSNode* child_ptr = child.get();
  node->children.push_back(std::move(child));
  return child_ptr;
}

/**
 * Simulation: ランダムプレイアウト
 */
float MCTS::simulate(GameState state, std::mt19937& rng) const {
  std::vector<Move> moves;
  const int num_players = static_cast<int>(state.players().size());
  int depth = 0;
  int skips = 0;

  while (depth < config_.max_depth && !state.is_terminal()) {
    Rules::legal_moves(state.board(), state.current_player(), moves);
    if (moves.empty()) {
      if (++skips > num_players) break;
      state.advance_turn();
      continue;
    }
    skips = 0;
    std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
    state.apply_move(moves[dist(rng)]);
    ++depth;
  }
  return terminal_reward(state);
}

/**
 * Backpropagation: 木の最上位ノードまで加算する
 */
void MCTS::backpropagate(MCTSNode* node, float value) const {
  while (node != nullptr) {
    node->visits++;
    node->total_value += value;
    node = node->parent;
  }
}

bool MCTS::claim_iteration(SearchContext& ctx, int cap) const {
  int cur = ctx.started.load();
  while (cur < cap) {
    if (ctx.started.compare_exchange_weak(cur, cur + 1)) {
      return true;
    }
  }
  return false;
}

void MCTS::worker(SearchContext& ctx, int cap, Clock::time_point deadline, uint32_t seed) const {
  std::mt19937 rng(seed);
  while (Clock::now() < deadline && claim_iteration(ctx, cap)) {
    MCTSNode* leaf = nullptr;
    GameState rollout;
    {
      std::lock_guard<std::mutex> lock(ctx.tree_mutex);
      leaf = expand(select(ctx.root), rng);
      rollout = leaf->state;
    }

    // the rollout itself runs outside the lock on the worker's own copy
    float value = simulate(std::move(rollout), rng);

    {
      std::lock_guard<std::mutex> lock(ctx.tree_mutex);
      backpropagate(leaf, value);
    }
    ctx.completed++;
  }
}

void MCTS::run_slice(SearchContext& ctx, int cap, Clock::time_point deadline) {
  const int threads = std::min(std::max(1, config_.threads), kMaxSearchThreads);
  if (threads == 1) {
    worker(ctx, cap, deadline, rng_());
    return;
  }

  std::vector<std::thread> workers;
  workers.reserve(threads);
  for (int i = 0; i < threads; ++i) {
    try {
      workers.emplace_back(&MCTS::worker, this, std::ref(ctx), cap, deadline, static_cast<uint32_t>(rng_()));
    } catch (const std::system_error& e) {
      // the workers already running share the rest of the slice
      if (verbose_) {
        std::cerr << "[MCTS] Started " << workers.size() << "/" << threads
                  << " workers: " << e.what() << std::endl;
      }
      break;
    }
  }
  if (workers.empty()) {
    worker(ctx, cap, deadline, rng_());
  }
  for (auto& t : workers) {
    t.join();
  }
}

/**
 * メイン探索関数
 */
std::vector<Move> MCTS::decide_moves(const GameState& s, int count) {
  last_iterations_ = 0;
  root_.reset();

  if (count <= 0) return {};
  if (!s.is_acting_turn()) return {};
  const Player* me = s.find_player(s.acting_player());
  if (me == nullptr) return {};

  std::vector<Move> legal = Rules::legal_moves(s.board(), me->id);
  if (legal.empty()) return {};

  // nothing to search when the roster already has a winner
  if (s.is_terminal()) {
    return fallback_.decide_moves(s, count);
  }

  // a player without territory places a single seed cell
  if (s.board().count_cells(me->id) == 0) {
    count = 1;
  }
  if (static_cast<int>(legal.size()) <= count) {
    return legal;
  }

  const auto start_time = Clock::now();

  // ルートノード作成: 最初の count 手は自分の手番のまま
  GameState root_state = s;
  root_state.set_actions_per_turn(config_.actions_per_turn);
  root_state.begin_turn(count);
  root_ = std::make_unique<MCTSNode>(root_state, Move(), nullptr);
  init_node(*root_);
  root_->visits = 1;

  SearchContext ctx;
  ctx.root = root_.get();

  const int cap = std::max(0, config_.iterations);
  const long long budget_ms = std::max(0, config_.time_ms);

  std::vector<Move> chosen;
  for (int i = 0; i < count; ++i) {
    MCTSNode* current = ctx.root;
    if (current->is_terminal || current->state.current_player() != me->id) {
      break;
    }

    const int slice_cap = static_cast<int>(static_cast<long long>(cap) * (i + 1) / count);
    const auto slice_deadline = start_time + std::chrono::milliseconds(budget_ms * (i + 1) / count);
    run_slice(ctx, slice_cap, slice_deadline);

    // 最も訪問回数の多い手を選択
    MCTSNode* best = nullptr;
    int best_visits = 0;
    for (auto& child : current->children) {
      if (child->visits > best_visits) {
        best_visits = child->visits;
        best = child.get();
      }
    }

    if (best == nullptr) {
      std::vector<Move> rest = fallback_.decide_moves(current->state, count - i);
      if (verbose_) {
        std::cerr << "[MCTS] No statistics for action " << (i + 1) << ", heuristic supplied "
                  << rest.size() << " move(s)" << std::endl;
      }
      chosen.insert(chosen.end(), rest.begin(), rest.end());
      break;
    }

    if (verbose_) {
      std::cerr << "[MCTS] Action " << (i + 1) << "/" << count << ": " << best->move
                << " | visits=" << best->visits
                << " | win rate=" << (best->average_value() * 100.0) << "%" << std::endl;
    }
    chosen.push_back(best->move);
    ctx.root = best;
  }

  last_iterations_ = ctx.completed.load();

  if (verbose_) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time).count();
    std::cerr << "[MCTS] Iterations: " << last_iterations_
              << " | Threads: " << std::min(std::max(1, config_.threads), kMaxSearchThreads)
              << " | Time: " << elapsed << "ms" << std::endl;
  }
  return chosen;
}

std::vector<Position> MCTS::decide_blocks(const GameState& s) const {
  return fallback_.decide_blocks(s);
}
