#include <gtest/gtest.h>
#include "virusbot_ai/mcts.hpp"
#include "virusbot_ai/heuristic_policy.hpp"
#include "virusbot/rules.hpp"

using namespace virusbot;
using namespace virusbot_ai;

namespace {

Player make_player(PlayerId id, Position base) {
  Player p;
  p.id = id;
  p.base = base;
  return p;
}

GameState open_game() {
  return GameState::new_game(6, {make_player(1, {0, 0}), make_player(2, {5, 5})}, 1);
}

SearchConfig small_search(int iterations, int threads = 1) {
  SearchConfig cfg;
  cfg.iterations = iterations;
  cfg.time_ms = 60000;  // the iteration cap ends the search
  cfg.max_depth = 20;
  cfg.threads = threads;
  cfg.seed = 42;
  return cfg;
}

// Walks the tree and checks that every expanded node has one more visit
// than its children together.
void check_visits(const MCTSNode* node) {
  if (node->children.empty()) return;
  int sum = 0;
  for (const auto& child : node->children) {
    EXPECT_EQ(child->parent, node);
    sum += child->visits;
    check_visits(child.get());
  }
  EXPECT_EQ(sum, node->visits - 1);
}

} // namespace

TEST(MCTSTest, MovesAreLegalInSequence) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);

  MCTS mcts(small_search(200));
  auto moves = mcts.decide_moves(s, 3);
  ASSERT_EQ(moves.size(), 3u);

  GameState replay = s;
  replay.set_actions_per_turn(3);
  for (const auto& m : moves) {
    EXPECT_TRUE(Rules::is_valid_move(replay.board(), 1, m)) << m;
    replay.apply_move(m);
  }
  EXPECT_EQ(replay.current_player(), 2);
}

TEST(MCTSTest, ReturnsAllWhenFewLegalMoves) {
  GameState s = open_game();
  MCTS mcts(small_search(200));
  auto moves = mcts.decide_moves(s, 3);
  EXPECT_EQ(moves, Rules::legal_moves(s.board(), 1));
  EXPECT_EQ(mcts.last_iterations(), 0);
}

TEST(MCTSTest, WalledInReturnsNothing) {
  GameState s = GameState::new_game(5, {make_player(1, {2, 2}), make_player(2, {0, 0})}, 1);
  for (int r = 0; r < 5; ++r) {
    for (int col = 0; col < 5; ++col) {
      if ((r == 2 && col == 2) || (r == 0 && col == 0)) continue;
      const bool inner = r >= 1 && r <= 3 && col >= 1 && col <= 3;
      Cell c;
      c.owner = 2;
      c.flag = inner ? CellFlag::Fortified : CellFlag::Normal;
      s.board().set_cell({r, col}, c);
    }
  }
  MCTS mcts(small_search(100));
  EXPECT_TRUE(mcts.decide_moves(s, 3).empty());
}

TEST(MCTSTest, NothingOutsideOwnTurn) {
  GameState s = open_game();
  s.set_current_player(2);
  MCTS mcts(small_search(100));
  EXPECT_TRUE(mcts.decide_moves(s, 3).empty());
  EXPECT_TRUE(mcts.decide_moves(open_game(), 0).empty());
}

TEST(MCTSTest, ZeroBudgetFallsBackToHeuristic) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);

  SearchConfig cfg = small_search(0);
  MCTS no_iterations(cfg);
  HeuristicPolicy heuristic;
  auto expected = heuristic.decide_moves(s, 3);
  EXPECT_EQ(no_iterations.decide_moves(s, 3), expected);
  EXPECT_EQ(no_iterations.last_iterations(), 0);

  cfg = small_search(1000);
  cfg.time_ms = 0;
  MCTS no_time(cfg);
  EXPECT_EQ(no_time.decide_moves(s, 3), expected);
}

TEST(MCTSTest, IterationCapIsExact) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);

  MCTS single(small_search(300));
  single.decide_moves(s, 3);
  EXPECT_EQ(single.last_iterations(), 300);

  MCTS parallel(small_search(300, 4));
  parallel.decide_moves(s, 3);
  EXPECT_EQ(parallel.last_iterations(), 300);
}

TEST(MCTSTest, VisitCountsAddUp) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);

  MCTS mcts(small_search(400));
  mcts.decide_moves(s, 3);
  ASSERT_NE(mcts.last_root(), nullptr);
  EXPECT_EQ(mcts.last_root()->visits, 401);
  check_visits(mcts.last_root());
}

TEST(MCTSTest, VisitCountsAddUpWithWorkers) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);

  MCTS mcts(small_search(400, 4));
  auto moves = mcts.decide_moves(s, 3);
  EXPECT_EQ(moves.size(), 3u);
  ASSERT_NE(mcts.last_root(), nullptr);
  EXPECT_EQ(mcts.last_root()->visits, 401);
  check_visits(mcts.last_root());
}

TEST(MCTSTest, OversizedWorkerCountStillDecides) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);

  MCTS mcts(small_search(100, 100000));
  auto moves = mcts.decide_moves(s, 3);
  ASSERT_EQ(moves.size(), 3u);
  EXPECT_EQ(mcts.last_iterations(), 100);

  GameState replay = s;
  replay.set_actions_per_turn(3);
  for (const auto& m : moves) {
    EXPECT_TRUE(Rules::is_valid_move(replay.board(), 1, m)) << m;
    replay.apply_move(m);
  }
}

TEST(MCTSTest, FinishedRosterUsesHeuristic) {
  // the only player left still gets moves
  GameState s = GameState::new_game(6, {make_player(1, {0, 0})}, 1);
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);
  ASSERT_TRUE(s.is_terminal());

  MCTS mcts(small_search(100));
  auto moves = mcts.decide_moves(s, 3);
  EXPECT_FALSE(moves.empty());
  EXPECT_EQ(moves, HeuristicPolicy().decide_moves(s, 3));
}

TEST(MCTSTest, SeededSearchIsReproducible) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);
  s.board().set_cell({1, 2}, c);

  MCTS a(small_search(250));
  MCTS b(small_search(250));
  EXPECT_EQ(a.decide_moves(s, 3), b.decide_moves(s, 3));
}

TEST(MCTSTest, RewardStaysInUnitRange) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({1, 1}, c);

  MCTS mcts(small_search(200));
  mcts.decide_moves(s, 3);
  for (const auto& child : mcts.last_root()->children) {
    EXPECT_GE(child->average_value(), 0.0);
    EXPECT_LE(child->average_value(), 1.0);
  }
}

TEST(MCTSTest, BlocksComeFromHeuristic) {
  GameState s = open_game();
  Cell c;
  c.owner = 1;
  s.board().set_cell({0, 1}, c);
  s.board().set_cell({1, 1}, c);

  MCTS mcts(small_search(10));
  EXPECT_EQ(mcts.decide_blocks(s), HeuristicPolicy().decide_blocks(s));
}
