#include "slidegraph/distance_propagator.hpp"
#include "slidegraph/profiler.hpp"
#include <deque>

namespace slidegraph {

DistancePropagator::DistancePropagator(Graph& graph) : graph_(graph) {}

void DistancePropagator::build_reverse_index() {
    SLIDEGRAPH_PROFILE_SCOPE("DistancePropagator::reverse_index");

    const size_t n = graph_.states_.size();
    reverse_offsets_.assign(n + 1, 0);
    for (const Edge& edge : graph_.edges_) {
        ++reverse_offsets_[edge.to + 1];
    }
    for (size_t s = 0; s < n; ++s) {
        reverse_offsets_[s + 1] += reverse_offsets_[s];
    }

    reverse_.resize(graph_.edges_.size());
    std::vector<size_t> fill(reverse_offsets_.begin(), reverse_offsets_.end() - 1);
    for (const Edge& edge : graph_.edges_) {
        reverse_[fill[edge.to]++] = edge.from;
    }
}

Distance DistancePropagator::propagate_to_solution() {
    SLIDEGRAPH_PROFILE_SCOPE("DistancePropagator::to_solution");

    if (reverse_offsets_.size() != graph_.states_.size() + 1) {
        build_reverse_index();
    }

    std::deque<StateId> frontier;
    for (State& state : graph_.states_) {
        if (state.solved) {
            state.distance_to_solution = 0;
            frontier.push_back(state.id);
        } else {
            state.distance_to_solution = NOT_COMPUTED;
        }
    }

    Distance max_distance = 0;
    while (!frontier.empty()) {
        StateId current = frontier.front();
        frontier.pop_front();
        Distance next_distance = graph_.states_[current].distance_to_solution + 1;

        // An edge from -> current is one move away from `current` when walked backwards
        for (size_t i = reverse_offsets_[current]; i < reverse_offsets_[current + 1]; ++i) {
            State& source = graph_.states_[reverse_[i]];
            if (source.distance_to_solution != NOT_COMPUTED) continue;
            source.distance_to_solution = next_distance;
            if (next_distance > max_distance) max_distance = next_distance;
            frontier.push_back(source.id);
        }
    }

    for (State& state : graph_.states_) {
        if (state.distance_to_solution == NOT_COMPUTED) {
            state.distance_to_solution = UNREACHABLE;
        }
    }

    graph_.max_distance_to_solution_ = max_distance;
    return max_distance;
}

Distance DistancePropagator::propagate_from_start() {
    SLIDEGRAPH_PROFILE_SCOPE("DistancePropagator::from_start");

    for (State& state : graph_.states_) {
        state.distance_to_start = NOT_COMPUTED;
    }

    Distance max_distance = 0;
    if (graph_.states_.empty()) {
        graph_.max_distance_to_start_ = 0;
        return 0;
    }

    std::deque<StateId> frontier;
    graph_.states_[START_ID].distance_to_start = 0;
    frontier.push_back(START_ID);

    while (!frontier.empty()) {
        StateId current = frontier.front();
        frontier.pop_front();
        Distance next_distance = graph_.states_[current].distance_to_start + 1;

        for (size_t i = graph_.edge_offsets_[current]; i < graph_.edge_offsets_[current + 1]; ++i) {
            State& target = graph_.states_[graph_.edges_[i].to];
            if (target.distance_to_start != NOT_COMPUTED) continue;
            target.distance_to_start = next_distance;
            if (next_distance > max_distance) max_distance = next_distance;
            frontier.push_back(target.id);
        }
    }

    for (State& state : graph_.states_) {
        if (state.distance_to_start == NOT_COMPUTED) {
            state.distance_to_start = UNREACHABLE;
        }
    }

    graph_.max_distance_to_start_ = max_distance;
    return max_distance;
}

size_t DistancePropagator::mark_shortest_paths() {
    size_t marked = 0;
    if (graph_.states_.empty()) return marked;

    const Distance total = graph_.states_[START_ID].distance_to_solution;
    for (State& state : graph_.states_) {
        state.on_shortest_path = is_finite(total) && is_finite(state.distance_to_start) &&
                                 is_finite(state.distance_to_solution) &&
                                 state.distance_to_start + state.distance_to_solution == total;
        if (state.on_shortest_path) ++marked;
    }
    return marked;
}

void DistancePropagator::run() {
    propagate_to_solution();
    propagate_from_start();
    mark_shortest_paths();
}

} // namespace slidegraph
