#include "virusbot_ai/heuristic_policy.hpp"
#include "virusbot/rules.hpp"
#include "virusbot/board.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <utility>

using namespace virusbot;

namespace virusbot_ai {

namespace {

constexpr double kTerritoryValue = 10.0;
constexpr double kCornerValue = 8.0;
constexpr double kEdgeValue = 5.0;
constexpr double kAttackValue = 15.0;
constexpr double kConnectivityValue = 3.0;
constexpr double kExpansionValue = 4.0;
constexpr double kDefensiveValue = 2.0;

constexpr double kBlockPathBonus = 20.0;
constexpr double kBlockChokepointBonus = 15.0;
constexpr double kBlockCornerBonus = 10.0;
constexpr double kBlockEmptyNeighborBonus = 3.0;
constexpr double kBlockOwnBasePenalty = 10.0;

} // namespace

HeuristicPolicy::HeuristicPolicy() : HeuristicPolicy(EvaluationWeights()) {}

HeuristicPolicy::HeuristicPolicy(const EvaluationWeights& weights, bool verbose)
  : weights_(weights), verbose_(verbose) {}

bool HeuristicPolicy::improves_connectivity(const Board& b,
                                            const std::vector<Position>& reachable,
                                            const Position& target) const {
  for (const auto& p : reachable) {
    if (p == target) return false;
  }
  for (const auto& p : reachable) {
    if (b.is_adjacent(p, target)) return true;
  }
  return false;
}

bool HeuristicPolicy::has_defensive_value(const GameState& s, const Position& target) const {
  const Board& b = s.board();
  Position base;
  if (b.base_of(s.acting_player(), base) && b.is_adjacent(target, base)) {
    return true;
  }
  // contesting the ring around an opponent's base
  for (PlayerId opp : s.opponents_of(s.acting_player())) {
    if (b.base_of(opp, base) && b.is_adjacent(target, base)) {
      return true;
    }
  }
  return false;
}

MoveScore HeuristicPolicy::score_move(const GameState& s, const Move& m) const {
  return score_move(s, m, Rules::reachable_cells(s.board(), s.acting_player()));
}

MoveScore HeuristicPolicy::score_move(const GameState& s, const Move& m,
                                      const std::vector<Position>& reachable) const {
  const Board& b = s.board();
  MoveScore score;
  score.territory = kTerritoryValue * weights_.territory;

  if (b.is_corner(m.target)) {
    score.strategic = kCornerValue * weights_.strategic;
  } else if (b.is_edge(m.target)) {
    score.strategic = kEdgeValue * weights_.strategic;
  }

  if (m.type == MoveType::Attack) {
    score.threat = kAttackValue * weights_.threat;
  }

  if (improves_connectivity(b, reachable, m.target)) {
    score.connectivity = kConnectivityValue * weights_.connectivity;
  }

  score.expansion = b.empty_neighbor_count(m.target) * kExpansionValue * weights_.expansion;

  if (has_defensive_value(s, m.target)) {
    score.defensive = kDefensiveValue * weights_.defensive;
  }
  return score;
}

std::vector<ScoredMove> HeuristicPolicy::rank_moves(const GameState& s) const {
  std::vector<ScoredMove> ranked;
  std::vector<Move> moves;
  Rules::legal_moves(s.board(), s.acting_player(), moves);
  const std::vector<Position> reachable = Rules::reachable_cells(s.board(), s.acting_player());
  ranked.reserve(moves.size());
  for (const auto& m : moves) {
    ranked.push_back(ScoredMove{m, score_move(s, m, reachable)});
  }
  std::stable_sort(ranked.begin(), ranked.end(), [](const ScoredMove& a, const ScoredMove& b) {
    return a.score.total() > b.score.total();
  });
  return ranked;
}

std::vector<Move> HeuristicPolicy::select_diverse(const std::vector<ScoredMove>& ranked, int count) const {
  std::vector<Move> selected;
  if (static_cast<int>(ranked.size()) <= count) {
    for (const auto& sm : ranked) selected.push_back(sm.move);
    return selected;
  }

  // avoid drawing every move from one origin while other origins score close
  std::set<Position> origins;
  std::vector<char> taken(ranked.size(), 0);
  for (size_t i = 0; i < ranked.size() && static_cast<int>(selected.size()) < count; ++i) {
    const Move& m = ranked[i].move;
    if (origins.count(m.origin) == 0 || static_cast<int>(origins.size()) >= count - 1) {
      selected.push_back(m);
      origins.insert(m.origin);
      taken[i] = 1;
    }
  }

  for (size_t i = 0; i < ranked.size() && static_cast<int>(selected.size()) < count; ++i) {
    if (!taken[i]) selected.push_back(ranked[i].move);
  }
  return selected;
}

std::vector<Move> HeuristicPolicy::decide_moves(const GameState& s, int count) const {
  if (count <= 0) return {};
  if (!s.is_acting_turn()) return {};
  if (s.find_player(s.acting_player()) == nullptr) return {};

  std::vector<ScoredMove> ranked = rank_moves(s);
  if (ranked.empty()) return {};

  // a player without territory places a single seed cell
  if (s.board().count_cells(s.acting_player()) == 0) {
    count = 1;
  }

  std::vector<Move> chosen = select_diverse(ranked, count);

  if (verbose_) {
    std::cerr << "[Heuristic] " << ranked.size() << " legal moves, chose " << chosen.size() << ":";
    for (const auto& m : chosen) std::cerr << " [" << m << "]";
    std::cerr << std::endl;
  }
  return chosen;
}

double HeuristicPolicy::score_block(const GameState& s, const Position& p) const {
  const Board& b = s.board();
  double score = 0.0;
  Position base;

  // sitting next to an opponent base cuts its exit
  for (PlayerId opp : s.opponents_of(s.acting_player())) {
    if (b.base_of(opp, base) && b.is_adjacent(p, base)) {
      score += kBlockPathBonus;
    }
  }

  int edge_neighbors = 0;
  for (const auto& n : b.neighbors(p)) {
    if (b.is_edge(n)) ++edge_neighbors;
  }
  if (edge_neighbors >= 2) score += kBlockChokepointBonus;

  if (b.is_corner(p)) score += kBlockCornerBonus;

  score += b.empty_neighbor_count(p) * kBlockEmptyNeighborBonus;

  if (b.base_of(s.acting_player(), base) && b.is_adjacent(p, base)) {
    score -= kBlockOwnBasePenalty;
  }
  return score;
}

std::vector<Position> HeuristicPolicy::decide_blocks(const GameState& s) const {
  if (!s.is_acting_turn()) return {};
  const Player* me = s.find_player(s.acting_player());
  if (me == nullptr || me->used_neutrals) return {};

  std::vector<Position> eligible = Rules::legal_block_positions(s.board(), me->id);
  if (static_cast<int>(eligible.size()) < kBlocksPerGame) return {};

  std::vector<std::pair<Position, double>> scored;
  scored.reserve(eligible.size());
  for (const auto& p : eligible) {
    scored.emplace_back(p, score_block(s, p));
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const std::pair<Position, double>& a, const std::pair<Position, double>& b) {
                     return a.second > b.second;
                   });

  std::vector<Position> out;
  for (int i = 0; i < kBlocksPerGame; ++i) {
    out.push_back(scored[i].first);
  }

  if (verbose_) {
    std::cerr << "[Heuristic] blocks at " << out[0] << " (" << scored[0].second << ") and "
              << out[1] << " (" << scored[1].second << ")" << std::endl;
  }
  return out;
}

} // namespace virusbot_ai
