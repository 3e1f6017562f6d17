#include "slidegraph/graph_builder.hpp"
#include "slidegraph/profiler.hpp"
#include "slidegraph/state_registry.hpp"

namespace slidegraph {

GraphBuilder::GraphBuilder(const MoveGenerator& generator) : move_generator_(generator) {}

Graph GraphBuilder::build(const Board& initial, const Goal& goal) const {
    SLIDEGRAPH_PROFILE_SCOPE("GraphBuilder::build");

    initial.validate();
    validate_goal(initial, goal);

    Graph graph;
    graph.goal_ = goal;

    StateRegistry registry(goal);
    registry.register_board(initial);

    // IDs are handed out in discovery order, so the FIFO frontier is simply the
    // range [next, registry.size()) and states are expanded in ID order. That
    // also keeps each state's edges contiguous.
    std::vector<Edge>& edges = graph.edges_;
    std::vector<size_t>& offsets = graph.edge_offsets_;
    for (StateId next = 0; next < registry.size(); ++next) {
        SLIDEGRAPH_PROFILE_SCOPE("GraphBuilder::expand");
        offsets.push_back(edges.size());

        // The start state's moves follow the caller's piece order, every other
        // state's follow its canonical board. Copy: registering successors may
        // reallocate the registry's storage.
        const Board board = next == START_ID ? initial : registry.get(next).board;
        move_generator_.for_each_move(board, [&](const Board& successor, const SlideMove& move) {
            StateId neighbor = registry.register_board(successor).first;
            edges.push_back(Edge{next, move, neighbor});
        });
    }
    offsets.push_back(edges.size());

    graph.states_ = registry.release_states();
    return graph;
}

} // namespace slidegraph
