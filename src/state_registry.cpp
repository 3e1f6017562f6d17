#include "slidegraph/state_registry.hpp"
#include "slidegraph/errors.hpp"
#include <string>

namespace slidegraph {

std::pair<StateId, bool> StateRegistry::register_board(const Board& board) {
    CanonicalKey key = canonicalize(board);
    auto [it, inserted] = ids_.try_emplace(key, static_cast<StateId>(states_.size()));
    if (!inserted) {
        return {it->second, false};
    }

    State state;
    state.id = it->second;
    state.board = board.canonical();
    state.solved = is_solved(state.board, goal_);
    states_.push_back(std::move(state));
    return {it->second, true};
}

std::optional<StateId> StateRegistry::find(const Board& board) const {
    if (!board.is_valid()) return std::nullopt;
    auto it = ids_.find(canonicalize(board));
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

const State& StateRegistry::get(StateId id) const {
    if (id >= states_.size()) {
        throw NotFound("state " + std::to_string(id) + " was never registered");
    }
    return states_[id];
}

std::vector<State> StateRegistry::release_states() {
    ids_.clear();
    std::vector<State> released = std::move(states_);
    states_.clear();
    return released;
}

} // namespace slidegraph
