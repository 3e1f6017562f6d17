#pragma once

#include "board.hpp"
#include "graph.hpp"
#include "move_generator.hpp"

namespace slidegraph {

class GraphBuilder {
private:
    const MoveGenerator& move_generator_;

public:
    explicit GraphBuilder(const MoveGenerator& generator);
    ~GraphBuilder() = default;

    // Breadth-first enumeration of every board reachable from `initial`.
    // Throws MalformedBoard before any traversal if the board or goal is invalid.
    // Distances are left as NOT_COMPUTED; see DistancePropagator.
    Graph build(const Board& initial, const Goal& goal) const;
};

} // namespace slidegraph
