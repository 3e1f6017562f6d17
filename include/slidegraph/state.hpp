#pragma once

#include "board.hpp"
#include "move.hpp"
#include <cstdint>
#include <limits>

namespace slidegraph {

using StateId = uint32_t;
using Distance = uint32_t;

// The start board is always registered first
constexpr StateId START_ID = 0;

// Distance not filled in yet by a propagation pass
constexpr Distance NOT_COMPUTED = std::numeric_limits<Distance>::max();
// Propagation finished without reaching the state
constexpr Distance UNREACHABLE = std::numeric_limits<Distance>::max() - 1;

inline bool is_finite(Distance d) noexcept { return d < UNREACHABLE; }

struct State {
    StateId id = 0;
    Board board;  // canonical (sorted) board
    bool solved = false;
    Distance distance_to_solution = NOT_COMPUTED;
    Distance distance_to_start = NOT_COMPUTED;
    bool on_shortest_path = false;
};

struct Edge {
    StateId from = 0;
    SlideMove move;
    StateId to = 0;
};

} // namespace slidegraph
