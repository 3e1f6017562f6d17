#pragma once

#include "board.hpp"
#include "state.hpp"
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace slidegraph {

// Hands out dense IDs to canonical boards, in discovery order.
class StateRegistry {
private:
    Goal goal_;
    std::unordered_map<CanonicalKey, StateId, CanonicalKeyHash> ids_;
    std::vector<State> states_;

public:
    explicit StateRegistry(const Goal& goal) : goal_(goal) {}

    // Non-copyable, the registry is the arena of one build
    StateRegistry(const StateRegistry&) = delete;
    StateRegistry& operator=(const StateRegistry&) = delete;

    // Returns (id, is_new)
    std::pair<StateId, bool> register_board(const Board& board);

    std::optional<StateId> find(const Board& board) const;

    // Throws NotFound for an ID that was never allocated
    const State& get(StateId id) const;

    size_t size() const noexcept { return states_.size(); }

    // Moves the states out; the registry is empty afterwards
    std::vector<State> release_states();
};

} // namespace slidegraph
