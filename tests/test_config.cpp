#include <gtest/gtest.h>
#include "virusbot_ai/config.hpp"
#include <cstdlib>
#include <string>

using namespace virusbot_ai;

namespace {

const char* kKeys[] = {
  "VIRUSBOT_STRATEGY", "VIRUSBOT_DEBUG",
  "VIRUSBOT_MCTS_ITERATIONS", "VIRUSBOT_MCTS_TIME_LIMIT", "VIRUSBOT_MCTS_UCT_CONST",
  "VIRUSBOT_MCTS_MAX_DEPTH", "VIRUSBOT_MCTS_THREADS", "VIRUSBOT_MCTS_SEED",
  "VIRUSBOT_WGT_TERRITORY", "VIRUSBOT_WGT_STRATEGIC", "VIRUSBOT_WGT_THREAT",
  "VIRUSBOT_WGT_CONNECTIVITY", "VIRUSBOT_WGT_EXPANSION", "VIRUSBOT_WGT_DEFENSIVE",
};

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    for (const char* key : kKeys) unsetenv(key);
  }
};

} // namespace

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
  EngineConfig cfg = load_engine_config();
  EXPECT_EQ(cfg.strategy, "heuristic");
  EXPECT_FALSE(cfg.verbose);
  EXPECT_EQ(cfg.search.iterations, 1000);
  EXPECT_EQ(cfg.search.time_ms, 1000);
  EXPECT_FLOAT_EQ(cfg.search.exploration, 1.41f);
  EXPECT_EQ(cfg.search.max_depth, 50);
  EXPECT_EQ(cfg.search.threads, 1);
  EXPECT_DOUBLE_EQ(cfg.weights.territory, 1.0);
  EXPECT_DOUBLE_EQ(cfg.weights.strategic, 0.5);
  EXPECT_DOUBLE_EQ(cfg.weights.threat, 1.5);
  EXPECT_DOUBLE_EQ(cfg.weights.connectivity, 0.3);
  EXPECT_DOUBLE_EQ(cfg.weights.expansion, 0.4);
  EXPECT_DOUBLE_EQ(cfg.weights.defensive, 0.2);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  setenv("VIRUSBOT_STRATEGY", "mcts", 1);
  setenv("VIRUSBOT_DEBUG", "true", 1);
  setenv("VIRUSBOT_MCTS_ITERATIONS", "500", 1);
  setenv("VIRUSBOT_MCTS_TIME_LIMIT", "250ms", 1);
  setenv("VIRUSBOT_MCTS_UCT_CONST", "2.0", 1);
  setenv("VIRUSBOT_MCTS_MAX_DEPTH", "30", 1);
  setenv("VIRUSBOT_MCTS_THREADS", "4", 1);
  setenv("VIRUSBOT_MCTS_SEED", "9", 1);
  setenv("VIRUSBOT_WGT_THREAT", "3.5", 1);
  setenv("VIRUSBOT_WGT_DEFENSIVE", "0", 1);

  EngineConfig cfg = load_engine_config();
  EXPECT_EQ(cfg.strategy, "mcts");
  EXPECT_TRUE(cfg.verbose);
  EXPECT_EQ(cfg.search.iterations, 500);
  EXPECT_EQ(cfg.search.time_ms, 250);
  EXPECT_FLOAT_EQ(cfg.search.exploration, 2.0f);
  EXPECT_EQ(cfg.search.max_depth, 30);
  EXPECT_EQ(cfg.search.threads, 4);
  EXPECT_EQ(cfg.search.seed, 9u);
  EXPECT_DOUBLE_EQ(cfg.weights.threat, 3.5);
  EXPECT_DOUBLE_EQ(cfg.weights.defensive, 0.0);
  EXPECT_DOUBLE_EQ(cfg.weights.territory, 1.0);
}

TEST_F(ConfigTest, GarbageIsIgnored) {
  setenv("VIRUSBOT_MCTS_ITERATIONS", "lots", 1);
  setenv("VIRUSBOT_MCTS_TIME_LIMIT", "soon", 1);
  setenv("VIRUSBOT_MCTS_THREADS", "0", 1);
  setenv("VIRUSBOT_MCTS_SEED", "-3", 1);
  setenv("VIRUSBOT_WGT_EXPANSION", "1.2x", 1);
  setenv("VIRUSBOT_DEBUG", "maybe", 1);

  EngineConfig cfg = load_engine_config();
  EXPECT_EQ(cfg.search.iterations, 1000);
  EXPECT_EQ(cfg.search.time_ms, 1000);
  EXPECT_EQ(cfg.search.threads, 1);
  EXPECT_EQ(cfg.search.seed, 0u);
  EXPECT_DOUBLE_EQ(cfg.weights.expansion, 0.4);
  EXPECT_FALSE(cfg.verbose);
}

TEST_F(ConfigTest, TimeLimitAcceptsMinutes) {
  setenv("VIRUSBOT_MCTS_TIME_LIMIT", "1m30s", 1);
  EXPECT_EQ(load_engine_config().search.time_ms, 90000);
}

TEST_F(ConfigTest, ThreadCountIsBounded) {
  setenv("VIRUSBOT_MCTS_THREADS", "1000000", 1);
  EXPECT_EQ(load_engine_config().search.threads, 1);

  setenv("VIRUSBOT_MCTS_THREADS", std::to_string(kMaxSearchThreads).c_str(), 1);
  EXPECT_EQ(load_engine_config().search.threads, kMaxSearchThreads);
}

TEST(DurationTest, Units) {
  int ms = -1;
  ASSERT_TRUE(parse_duration_ms("250ms", ms));
  EXPECT_EQ(ms, 250);
  ASSERT_TRUE(parse_duration_ms("1s", ms));
  EXPECT_EQ(ms, 1000);
  ASSERT_TRUE(parse_duration_ms("1.5s", ms));
  EXPECT_EQ(ms, 1500);
  ASSERT_TRUE(parse_duration_ms("300", ms));
  EXPECT_EQ(ms, 300);
  ASSERT_TRUE(parse_duration_ms("0", ms));
  EXPECT_EQ(ms, 0);
}

TEST(DurationTest, CompoundAndLongUnits) {
  int ms = -1;
  ASSERT_TRUE(parse_duration_ms("2m", ms));
  EXPECT_EQ(ms, 120000);
  ASSERT_TRUE(parse_duration_ms("1m30s", ms));
  EXPECT_EQ(ms, 90000);
  ASSERT_TRUE(parse_duration_ms("1h", ms));
  EXPECT_EQ(ms, 3600000);
  ASSERT_TRUE(parse_duration_ms("250000us", ms));
  EXPECT_EQ(ms, 250);
  ASSERT_TRUE(parse_duration_ms("3000000ns", ms));
  EXPECT_EQ(ms, 3);
  ASSERT_TRUE(parse_duration_ms("1s500ms", ms));
  EXPECT_EQ(ms, 1500);
}

TEST(DurationTest, Rejects) {
  int ms = 77;
  EXPECT_FALSE(parse_duration_ms("", ms));
  EXPECT_FALSE(parse_duration_ms("ms", ms));
  EXPECT_FALSE(parse_duration_ms("fast", ms));
  EXPECT_FALSE(parse_duration_ms("-1s", ms));
  EXPECT_FALSE(parse_duration_ms("2x", ms));
  EXPECT_FALSE(parse_duration_ms("1s5", ms));
  EXPECT_FALSE(parse_duration_ms(".s", ms));
  EXPECT_FALSE(parse_duration_ms("500h", ms));
  EXPECT_EQ(ms, 77);
}
