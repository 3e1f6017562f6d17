#pragma once

#include "graph.hpp"
#include "state.hpp"
#include <vector>

namespace slidegraph {

// Breadth-first distance passes over a finished graph.
class DistancePropagator {
private:
    Graph& graph_;

    // reverse_[reverse_offsets_[s] .. reverse_offsets_[s + 1]) are the sources
    // of the edges ending in s
    std::vector<StateId> reverse_;
    std::vector<size_t> reverse_offsets_;

    void build_reverse_index();

public:
    explicit DistancePropagator(Graph& graph);
    ~DistancePropagator() = default;

    // Multi-source BFS from every solved state over the reversed edges.
    // States never reached are set to UNREACHABLE. Returns the largest finite distance.
    Distance propagate_to_solution();

    // Forward BFS from the start state. Returns the largest finite distance.
    Distance propagate_from_start();

    // Flags states on some shortest start-to-solution path. Needs both passes.
    size_t mark_shortest_paths();

    // All three passes in order
    void run();
};

} // namespace slidegraph
