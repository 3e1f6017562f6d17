#pragma once

#include "board.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace slidegraph {

enum class Direction : uint8_t {
    Up = 0,
    Down = 1,
    Left = 2,
    Right = 3,
};

// Enumeration order used by the move generator
constexpr std::array<Direction, 4> DIRECTIONS = {
    Direction::Up, Direction::Down, Direction::Left, Direction::Right};

struct DirectionDelta {
    int8_t dx, dy;
};

constexpr std::array<DirectionDelta, 4> DIRECTION_DELTAS = {{
    {0, 1},   // Up
    {0, -1},  // Down
    {-1, 0},  // Left
    {1, 0},   // Right
}};

inline DirectionDelta to_delta(Direction dir) noexcept {
    return DIRECTION_DELTAS[static_cast<size_t>(dir)];
}

// Up <-> Down, Left <-> Right
inline Direction opposite(Direction dir) noexcept {
    return static_cast<Direction>(static_cast<uint8_t>(dir) ^ 1);
}

const char* to_string(Direction dir) noexcept;

// One slide of a single piece in a straight line.
struct SlideMove {
    Size piece_size;
    Cell start;       // origin of the piece before the move
    Direction direction = Direction::Up;
    int8_t distance = 0;

    SlideMove() = default;
    SlideMove(Size size, Cell from, Direction dir, int8_t dist)
        : piece_size(size), start(from), direction(dir), distance(dist) {}

    // Origin of the piece after the move
    Cell end() const noexcept {
        DirectionDelta d = to_delta(direction);
        return Cell{static_cast<int8_t>(start.x + d.dx * distance),
                    static_cast<int8_t>(start.y + d.dy * distance)};
    }

    // The move that puts the piece back
    SlideMove inverse() const noexcept {
        return SlideMove{piece_size, end(), opposite(direction), distance};
    }

    bool operator==(const SlideMove& other) const noexcept {
        return piece_size == other.piece_size && start == other.start &&
               direction == other.direction && distance == other.distance;
    }
    bool operator!=(const SlideMove& other) const noexcept { return !(*this == other); }
};

} // namespace slidegraph
