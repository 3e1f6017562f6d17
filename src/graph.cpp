#include "slidegraph/graph.hpp"
#include "slidegraph/errors.hpp"
#include <algorithm>
#include <string>

namespace slidegraph {

const State& Graph::state(StateId id) const {
    if (id >= states_.size()) {
        throw NotFound("state " + std::to_string(id) + " is not in the graph");
    }
    return states_[id];
}

EdgeRange Graph::edges(StateId id) const {
    if (id >= states_.size()) {
        throw NotFound("state " + std::to_string(id) + " is not in the graph");
    }
    const Edge* base = edges_.data();
    return EdgeRange(base + edge_offsets_[id], base + edge_offsets_[id + 1]);
}

std::vector<StateId> Graph::solved_states() const {
    std::vector<StateId> solved;
    for (const State& state : states_) {
        if (state.solved) solved.push_back(state.id);
    }
    return solved;
}

size_t Graph::solved_count() const noexcept {
    return static_cast<size_t>(std::count_if(states_.begin(), states_.end(),
                                             [](const State& s) { return s.solved; }));
}

} // namespace slidegraph
