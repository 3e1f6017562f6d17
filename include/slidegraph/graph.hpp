#pragma once

#include "board.hpp"
#include "state.hpp"
#include <cstddef>
#include <vector>

namespace slidegraph {

// Contiguous view over the outgoing edges of one state
class EdgeRange {
private:
    const Edge* begin_;
    const Edge* end_;

public:
    EdgeRange(const Edge* begin, const Edge* end) : begin_(begin), end_(end) {}

    const Edge* begin() const noexcept { return begin_; }
    const Edge* end() const noexcept { return end_; }
    size_t size() const noexcept { return static_cast<size_t>(end_ - begin_); }
    bool empty() const noexcept { return begin_ == end_; }
    const Edge& operator[](size_t i) const { return begin_[i]; }
};

// States and directed move-edges of one puzzle. Edges of state i are stored
// contiguously in edges_[edge_offsets_[i] .. edge_offsets_[i + 1]).
class Graph {
    friend class GraphBuilder;
    friend class DistancePropagator;

private:
    Goal goal_;
    std::vector<State> states_;
    std::vector<Edge> edges_;
    std::vector<size_t> edge_offsets_;
    Distance max_distance_to_solution_ = 0;
    Distance max_distance_to_start_ = 0;

public:
    Graph() = default;

    // Move-only, graphs can be large
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;
    Graph(Graph&&) = default;
    Graph& operator=(Graph&&) = default;

    StateId start_id() const noexcept { return START_ID; }
    const Goal& goal() const noexcept { return goal_; }

    size_t state_count() const noexcept { return states_.size(); }
    size_t edge_count() const noexcept { return edges_.size(); }
    bool contains(StateId id) const noexcept { return id < states_.size(); }

    // Throws NotFound for unknown IDs
    const State& state(StateId id) const;
    EdgeRange edges(StateId id) const;

    const std::vector<State>& states() const noexcept { return states_; }
    const std::vector<Edge>& all_edges() const noexcept { return edges_; }

    std::vector<StateId> solved_states() const;
    size_t solved_count() const noexcept;

    // Largest finite distances, valid after propagation
    Distance max_distance_to_solution() const noexcept { return max_distance_to_solution_; }
    Distance max_distance_to_start() const noexcept { return max_distance_to_start_; }
};

} // namespace slidegraph
