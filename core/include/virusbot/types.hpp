#pragma once
#include <cstdint>

namespace virusbot {

using PlayerId = int;

constexpr PlayerId kNoPlayer = 0;
constexpr PlayerId kMaxPlayers = 4;
constexpr PlayerId kNeutralOwner = 5;

// Cell flags live in bits 0x30 of the packed value, the owner in 0x0F.
enum class CellFlag : uint8_t { Normal = 0x00, Base = 0x10, Fortified = 0x20, Killed = 0x30 };

constexpr int kOwnerMask = 0x0F;
constexpr int kFlagMask = 0x30;

enum class MoveType : uint8_t { Grow = 0, Attack = 1 };

constexpr int kDefaultBoardSize = 10;
constexpr int kActionsPerTurn = 3;
constexpr int kBlocksPerGame = 2;

// Adjacency relation used everywhere: orthogonal + diagonal.
constexpr int kNeighborDirections = 8;
constexpr int DIRS[kNeighborDirections][2] = {
  {-1, 0}, {1, 0}, {0, -1}, {0, 1}, {-1, -1}, {-1, 1}, {1, -1}, {1, 1}};

} // namespace virusbot
