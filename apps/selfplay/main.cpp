#include "virusbot/game_state.hpp"
#include "virusbot/rules.hpp"
#include "virusbot_ai/config.hpp"
#include "virusbot_ai/strategy.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

using namespace virusbot;
using namespace virusbot_ai;

namespace {

struct ArenaConfig {
    int games = 20;
    int size = kDefaultBoardSize;
    int players = 2;
    int max_turns = 200;
    int block_at = 0;                 // spend the blocks once a seat owns this many cells (0 = never)
    std::vector<std::string> seats;   // strategy per seat, cycled when shorter than `players`
    EngineConfig engine;
};

struct GameResult {
    PlayerId winner = kNoPlayer;
    int turns = 0;
    int illegal = 0;
};

struct SeatStats {
    int wins = 0;
    long long decisions = 0;
    double decision_ms = 0.0;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  --games N         number of games (default 20)\n"
              << "  --size N          board size (default " << kDefaultBoardSize << ")\n"
              << "  --players N       2-4 players (default 2)\n"
              << "  --max-turns N     turn limit per game (default 200)\n"
              << "  --block-at N      place blocks at N owned cells (default 0 = never)\n"
              << "  --seat NAME       add a seat strategy: heuristic | mcts (repeatable)\n"
              << "  --iterations N    MCTS iteration cap per turn\n"
              << "  --time DURATION   MCTS time budget per turn (250, 250ms, 1.5s, 1m30s, ...)\n"
              << "  --threads N       MCTS rollout workers\n"
              << "  --seed N          MCTS seed (0 = clock)\n"
              << "  --verbose         log every decision\n"
              << "Defaults for engine settings come from VIRUSBOT_* environment variables.\n";
}

int parse_int_arg(const std::string& flag, const std::string& value, int min_value, int max_value) {
    std::size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid value for " + flag + ": " + value);
    }
    if (used != value.size() || v < min_value || v > max_value) {
        throw std::runtime_error("invalid value for " + flag + ": " + value);
    }
    return v;
}

ArenaConfig parse_args(int argc, char* argv[]) {
    ArenaConfig config;
    config.engine = load_engine_config();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::runtime_error("missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--games") {
            config.games = parse_int_arg(arg, next(), 1, 1000000);
        } else if (arg == "--size") {
            config.size = parse_int_arg(arg, next(), 3, 100);
        } else if (arg == "--players") {
            config.players = parse_int_arg(arg, next(), 2, kMaxPlayers);
        } else if (arg == "--max-turns") {
            config.max_turns = parse_int_arg(arg, next(), 1, 1000000);
        } else if (arg == "--block-at") {
            config.block_at = parse_int_arg(arg, next(), 0, 10000);
        } else if (arg == "--seat") {
            config.seats.push_back(next());
        } else if (arg == "--iterations") {
            config.engine.search.iterations = parse_int_arg(arg, next(), 0, 100000000);
        } else if (arg == "--time") {
            std::string v = next();
            int ms = 0;
            if (!parse_duration_ms(v, ms)) throw std::runtime_error("invalid value for --time: " + v);
            config.engine.search.time_ms = ms;
        } else if (arg == "--threads") {
            config.engine.search.threads = parse_int_arg(arg, next(), 1, kMaxSearchThreads);
        } else if (arg == "--seed") {
            config.engine.search.seed = static_cast<uint64_t>(parse_int_arg(arg, next(), 0, 2147483647));
        } else if (arg == "--verbose") {
            config.engine.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            throw std::runtime_error("unknown option: " + arg);
        }
    }

    if (config.seats.empty()) {
        config.seats = {"heuristic", "mcts"};
    }
    return config;
}

std::vector<Player> make_roster(int players, int size) {
    const Position corners[kMaxPlayers] = {
        {0, 0}, {size - 1, size - 1}, {0, size - 1}, {size - 1, 0}};
    std::vector<Player> roster;
    for (int i = 0; i < players; ++i) {
        Player p;
        p.id = i + 1;
        p.name = "seat" + std::to_string(i + 1);
        p.base = corners[i];
        roster.push_back(p);
    }
    return roster;
}

// Most cells wins when the turn limit is hit; ties are draws.
PlayerId leader(const GameState& state) {
    PlayerId best = kNoPlayer;
    int best_cells = -1;
    bool tie = false;
    for (const auto& p : state.players()) {
        int cells = state.board().count_cells(p.id);
        if (cells > best_cells) {
            best_cells = cells;
            best = p.id;
            tie = false;
        } else if (cells == best_cells) {
            tie = true;
        }
    }
    return tie ? kNoPlayer : best;
}

GameResult play_game(const ArenaConfig& config, std::vector<Strategy>& seats, std::vector<SeatStats>& stats) {
    GameState state = GameState::new_game(config.size, make_roster(config.players, config.size), 1);
    state.set_actions_per_turn(kActionsPerTurn);

    GameResult result;
    while (result.turns < config.max_turns && !state.is_terminal()) {
        const PlayerId me = state.current_player();
        Strategy& strategy = seats[me - 1];

        GameState snapshot = state;
        snapshot.set_acting_player(me);

        auto t0 = std::chrono::steady_clock::now();
        const Player* info = snapshot.find_player(me);
        bool acted = false;
        if (config.block_at > 0 && info != nullptr && !info->used_neutrals &&
            snapshot.board().count_cells(me) >= config.block_at) {
            std::vector<Position> blocks = strategy.decide_blocks(snapshot);
            if (!blocks.empty()) {
                state.set_acting_player(me);
                state.place_blocks(blocks);
                acted = true;
                if (config.engine.verbose) {
                    std::cout << "Turn " << result.turns << ": player " << me << " blocks "
                              << blocks[0] << " " << blocks[1] << "\n";
                }
            }
        }

        if (!acted) {
            std::vector<Move> moves = strategy.decide_moves(snapshot, kActionsPerTurn);
            for (const auto& m : moves) {
                if (state.current_player() != me) break;
                if (!Rules::is_valid_move(state.board(), me, m)) {
                    ++result.illegal;
                    std::cerr << "Illegal move from player " << me << " (" << strategy.name() << "): " << m << "\n";
                    break;
                }
                state.apply_move(m);
            }
            // an unfinished turn is passed on
            if (state.current_player() == me) {
                state.advance_turn();
            }
        }
        auto t1 = std::chrono::steady_clock::now();

        stats[me - 1].decisions++;
        stats[me - 1].decision_ms += std::chrono::duration<double, std::milli>(t1 - t0).count();

        if (config.engine.verbose) {
            std::cout << "Turn " << result.turns << " (player " << me << ")\n" << state.board().to_string();
        }
        result.turns++;
    }

    result.winner = state.is_terminal() ? state.sole_survivor() : leader(state);
    return result;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        ArenaConfig config = parse_args(argc, argv);

        std::vector<Strategy> seats;
        std::vector<std::string> seat_names;
        for (int i = 0; i < config.players; ++i) {
            EngineConfig engine = config.engine;
            engine.strategy = config.seats[i % config.seats.size()];
            seats.push_back(make_strategy(engine));
            seat_names.push_back(seats.back().name());
        }
        std::vector<SeatStats> stats(config.players);

        std::cout << "========================================\n";
        std::cout << "virusbot self-play\n";
        std::cout << "========================================\n";
        std::cout << "Board " << config.size << "x" << config.size << ", " << config.players
                  << " players, " << config.games << " games\n";
        for (int i = 0; i < config.players; ++i) {
            std::cout << "  Player " << (i + 1) << ": " << seat_names[i] << "\n";
        }

        int draws = 0;
        int illegal = 0;
        long long total_turns = 0;
        for (int g = 0; g < config.games; ++g) {
            GameResult result = play_game(config, seats, stats);
            if (result.winner == kNoPlayer) {
                draws++;
            } else {
                stats[result.winner - 1].wins++;
            }
            illegal += result.illegal;
            total_turns += result.turns;

            if ((g + 1) % 10 == 0) {
                std::cout << "  Progress: " << (g + 1) << "/" << config.games << "\n";
            }
        }

        std::cout << "\n--- Results ---\n";
        std::cout << std::fixed << std::setprecision(1);
        for (int i = 0; i < config.players; ++i) {
            const SeatStats& s = stats[i];
            double avg_ms = s.decisions > 0 ? s.decision_ms / s.decisions : 0.0;
            std::cout << "Player " << (i + 1) << " (" << seat_names[i] << "): " << s.wins << " wins ("
                      << (100.0 * s.wins / config.games) << "%), avg decision " << avg_ms << "ms\n";
        }
        std::cout << "Draws: " << draws << " (" << (100.0 * draws / config.games) << "%)\n";
        std::cout << "Average turns per game: " << (static_cast<double>(total_turns) / config.games) << "\n";
        std::cout << "Illegal moves: " << illegal << "\n";
        std::cout << "---------------\n";

        return illegal == 0 ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
}
