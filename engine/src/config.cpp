#include "virusbot_ai/config.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace virusbot_ai {

namespace {

bool parse_int(const char* text, long long& out) {
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE) return false;
  out = v;
  return true;
}

bool parse_double(const char* text, double& out) {
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(text, &end);
  if (end == text || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return false;
  out = v;
  return true;
}

void warn(const char* key, const char* value) {
  std::cerr << "[Config] ignoring " << key << "=\"" << value << "\"" << std::endl;
}

void read_int(const char* key, int& field, int min_value, long long max_value = 1000000000LL) {
  const char* v = std::getenv(key);
  if (v == nullptr || *v == '\0') return;
  long long parsed = 0;
  if (!parse_int(v, parsed) || parsed < min_value || parsed > max_value) {
    warn(key, v);
    return;
  }
  field = static_cast<int>(parsed);
}

void read_double(const char* key, double& field) {
  const char* v = std::getenv(key);
  if (v == nullptr || *v == '\0') return;
  double parsed = 0.0;
  if (!parse_double(v, parsed)) {
    warn(key, v);
    return;
  }
  field = parsed;
}

bool read_bool(const char* key) {
  const char* v = std::getenv(key);
  if (v == nullptr) return false;
  const std::string s(v);
  return s == "true" || s == "1" || s == "yes";
}

} // namespace

bool parse_duration_ms(const std::string& text, int& out_ms) {
  if (text.empty()) return false;

  double ms = 0.0;
  if (parse_double(text.c_str(), ms)) {
    // bare number
    if (ms < 0.0 || ms > 1e9) return false;
    out_ms = static_cast<int>(std::lround(ms));
    return true;
  }

  auto is_number_char = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) || c == '.'; };

  ms = 0.0;
  size_t i = 0;
  while (i < text.size()) {
    const size_t number_start = i;
    while (i < text.size() && is_number_char(text[i])) ++i;
    if (i == number_start) return false;
    double value = 0.0;
    if (!parse_double(text.substr(number_start, i - number_start).c_str(), value)) return false;

    const size_t unit_start = i;
    while (i < text.size() && !is_number_char(text[i])) ++i;
    const std::string unit = text.substr(unit_start, i - unit_start);

    double scale = 0.0;
    if (unit == "ns") {
      scale = 1e-6;
    } else if (unit == "us" || unit == "\xC2\xB5s") {
      scale = 1e-3;
    } else if (unit == "ms") {
      scale = 1.0;
    } else if (unit == "s") {
      scale = 1000.0;
    } else if (unit == "m") {
      scale = 60000.0;
    } else if (unit == "h") {
      scale = 3600000.0;
    } else {
      return false;
    }
    ms += value * scale;
  }

  if (ms > 1e9) return false;
  out_ms = static_cast<int>(std::lround(ms));
  return true;
}

EngineConfig load_engine_config() {
  EngineConfig cfg;

  if (const char* s = std::getenv("VIRUSBOT_STRATEGY")) {
    if (*s != '\0') cfg.strategy = s;
  }
  cfg.verbose = read_bool("VIRUSBOT_DEBUG");

  read_int("VIRUSBOT_MCTS_ITERATIONS", cfg.search.iterations, 0);
  if (const char* t = std::getenv("VIRUSBOT_MCTS_TIME_LIMIT")) {
    int ms = 0;
    if (parse_duration_ms(t, ms)) {
      cfg.search.time_ms = ms;
    } else if (*t != '\0') {
      warn("VIRUSBOT_MCTS_TIME_LIMIT", t);
    }
  }
  double uct = cfg.search.exploration;
  read_double("VIRUSBOT_MCTS_UCT_CONST", uct);
  cfg.search.exploration = static_cast<float>(uct);
  read_int("VIRUSBOT_MCTS_MAX_DEPTH", cfg.search.max_depth, 1);
  read_int("VIRUSBOT_MCTS_THREADS", cfg.search.threads, 1, kMaxSearchThreads);
  if (const char* seed = std::getenv("VIRUSBOT_MCTS_SEED")) {
    long long parsed = 0;
    if (parse_int(seed, parsed) && parsed >= 0) {
      cfg.search.seed = static_cast<uint64_t>(parsed);
    } else if (*seed != '\0') {
      warn("VIRUSBOT_MCTS_SEED", seed);
    }
  }

  read_double("VIRUSBOT_WGT_TERRITORY", cfg.weights.territory);
  read_double("VIRUSBOT_WGT_STRATEGIC", cfg.weights.strategic);
  read_double("VIRUSBOT_WGT_THREAT", cfg.weights.threat);
  read_double("VIRUSBOT_WGT_CONNECTIVITY", cfg.weights.connectivity);
  read_double("VIRUSBOT_WGT_EXPANSION", cfg.weights.expansion);
  read_double("VIRUSBOT_WGT_DEFENSIVE", cfg.weights.defensive);

  return cfg;
}

} // namespace virusbot_ai
