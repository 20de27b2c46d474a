#pragma once
#include <cstdint>
#include <string>

namespace virusbot_ai {

/**
 * Heuristic factor weights. Each factor's base value is multiplied by its
 * weight; zeroing a weight removes exactly that factor from the score.
 */
struct EvaluationWeights {
  double territory = 1.0;     // base value 10 per captured cell
  double strategic = 0.5;     // corner 8, edge 5
  double threat = 1.5;        // 15 per attack
  double connectivity = 0.3;  // 3 when the target joins reachable territory
  double expansion = 0.4;     // 4 per empty neighbour of the target
  double defensive = 0.2;     // 2 near our base or an opponent's base
};

// upper bound on rollout workers; larger requests are clamped
constexpr int kMaxSearchThreads = 256;

struct SearchConfig {
  int iterations = 1000;         // iteration cap for the whole turn
  int time_ms = 1000;            // wall-clock budget for the whole turn
  float exploration = 1.41f;     // UCT constant
  int max_depth = 50;            // rollout length cap in moves
  int threads = 1;               // rollout workers sharing the tree
  int actions_per_turn = 3;      // plies per player inside rollouts
  uint64_t seed = 0;             // 0 = seed from the clock
};

struct EngineConfig {
  std::string strategy = "heuristic";  // "heuristic" or "mcts"
  EvaluationWeights weights;
  SearchConfig search;
  bool verbose = false;
};

// Reads VIRUSBOT_* environment variables on top of the defaults.
// Unparsable values are reported on stderr and ignored.
EngineConfig load_engine_config();

// A bare millisecond count ("250") or a sequence of number+unit pairs
// ("1.5s", "1m30s", "500us") with units ns, us, ms, s, m and h.
// false on garbage or negative values.
bool parse_duration_ms(const std::string& text, int& out_ms);

} // namespace virusbot_ai
