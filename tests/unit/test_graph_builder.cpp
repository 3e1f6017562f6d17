#include <gtest/gtest.h>
#include "slidegraph/errors.hpp"
#include "slidegraph/graph_builder.hpp"
#include "slidegraph/puzzle_config.hpp"
#include <set>
#include <unordered_set>

using namespace slidegraph;

class GraphBuilderTest : public ::testing::Test {
protected:
    MoveGenerator generator;
    PuzzleConfig tiny = PuzzleConfig::tiny();

    Graph build_tiny() const {
        return GraphBuilder(generator).build(tiny.board, tiny.goal);
    }
};

TEST_F(GraphBuilderTest, TinyPuzzleStateAndEdgeCounts) {
    Graph graph = build_tiny();

    // Two interchangeable pieces on six cells: C(6,2) placements
    EXPECT_EQ(graph.state_count(), 15u);
    EXPECT_EQ(graph.edge_count(), 68u);
    EXPECT_EQ(graph.start_id(), START_ID);
    EXPECT_EQ(graph.solved_count(), 5u);
}

TEST_F(GraphBuilderTest, StartStateIsTheInitialBoard) {
    Graph graph = build_tiny();
    const State& start = graph.state(graph.start_id());

    EXPECT_EQ(start.id, START_ID);
    EXPECT_EQ(canonicalize(start.board), canonicalize(tiny.board));
    EXPECT_FALSE(start.solved);
}

TEST_F(GraphBuilderTest, StartEdgesFollowEnumerationOrder) {
    Graph graph = build_tiny();
    EdgeRange edges = graph.edges(START_ID);

    ASSERT_EQ(edges.size(), 4u);
    const Cell expected_start[] = {Cell{0, 0}, Cell{0, 0}, Cell{1, 0}, Cell{1, 0}};
    const int expected_distance[] = {1, 2, 1, 2};
    for (size_t i = 0; i < edges.size(); ++i) {
        EXPECT_EQ(edges[i].from, START_ID);
        EXPECT_EQ(edges[i].move.start, expected_start[i]);
        EXPECT_EQ(edges[i].move.direction, Direction::Up);
        EXPECT_EQ(edges[i].move.distance, expected_distance[i]);
    }
    // First time seen, so numbered in the same order
    EXPECT_EQ(edges[0].to, 1u);
    EXPECT_EQ(edges[3].to, 4u);
}

TEST_F(GraphBuilderTest, IdsAreDenseAndEdgesBelongToTheirState) {
    Graph graph = build_tiny();
    size_t edge_total = 0;
    for (StateId id = 0; id < graph.state_count(); ++id) {
        EXPECT_EQ(graph.state(id).id, id);
        for (const Edge& edge : graph.edges(id)) {
            EXPECT_EQ(edge.from, id);
            EXPECT_TRUE(graph.contains(edge.to));
        }
        edge_total += graph.edges(id).size();
    }
    EXPECT_EQ(edge_total, graph.edge_count());
}

TEST_F(GraphBuilderTest, EveryPlacementIsDiscoveredExactlyOnce) {
    Graph graph = build_tiny();

    std::set<std::pair<int, int>> expected;
    for (int a = 0; a < 6; ++a) {
        for (int b = a + 1; b < 6; ++b) {
            expected.insert({a, b});
        }
    }

    std::set<std::pair<int, int>> found;
    for (const State& state : graph.states()) {
        ASSERT_EQ(state.board.piece_count(), 2u);
        int a = state.board.piece(0).origin.y * 2 + state.board.piece(0).origin.x;
        int b = state.board.piece(1).origin.y * 2 + state.board.piece(1).origin.x;
        EXPECT_LT(a, b);  // canonical order
        EXPECT_TRUE(found.insert({a, b}).second);
    }
    EXPECT_EQ(found, expected);
}

TEST_F(GraphBuilderTest, StartEdgesFollowTheCallersPieceOrder) {
    Board reversed(2, 3, {Piece{Cell{1, 0}, Size{1, 1}}, Piece{Cell{0, 0}, Size{1, 1}}});
    Graph graph = GraphBuilder(generator).build(reversed, tiny.goal);
    EdgeRange edges = graph.edges(START_ID);

    ASSERT_EQ(edges.size(), 4u);
    EXPECT_EQ(edges[0].move.start, (Cell{1, 0}));
    EXPECT_EQ(edges[1].move.start, (Cell{1, 0}));
    EXPECT_EQ(edges[2].move.start, (Cell{0, 0}));
    EXPECT_EQ(edges[3].move.start, (Cell{0, 0}));

    // The stored board is still the canonical one
    EXPECT_EQ(graph.state(START_ID).board, reversed.canonical());
}

TEST_F(GraphBuilderTest, ClassicStartEdgesInStorageOrder) {
    PuzzleConfig classic = PuzzleConfig::classic();
    Graph graph = GraphBuilder(generator).build(classic.board, classic.goal);
    EdgeRange edges = graph.edges(START_ID);

    // G and H step down first, then I and J slide sideways
    ASSERT_EQ(edges.size(), 6u);
    EXPECT_EQ(edges[0].move.start, (Cell{1, 1}));
    EXPECT_EQ(edges[0].move.direction, Direction::Down);
    EXPECT_EQ(edges[1].move.start, (Cell{2, 1}));
    EXPECT_EQ(edges[2].move.start, (Cell{0, 0}));
    EXPECT_EQ(edges[2].move.direction, Direction::Right);
    EXPECT_EQ(edges[4].move.start, (Cell{3, 0}));
    EXPECT_EQ(edges[4].move.direction, Direction::Left);
}

TEST_F(GraphBuilderTest, KeepsEdgesToAlreadyVisitedStates) {
    Graph graph = build_tiny();
    size_t back_edges = 0;
    for (const Edge& edge : graph.all_edges()) {
        if (edge.to <= edge.from) ++back_edges;
    }
    // Every edge has a reverse edge, so at least half point backwards or sideways
    EXPECT_GE(back_edges * 2, graph.edge_count());
}

TEST_F(GraphBuilderTest, SlideCapChangesEdgesButNotStates) {
    MoveGenerator single_step(1);
    Graph graph = GraphBuilder(single_step).build(tiny.board, tiny.goal);
    EXPECT_EQ(graph.state_count(), 15u);
    EXPECT_EQ(graph.edge_count(), 56u);
}

TEST_F(GraphBuilderTest, DistancesAreNotComputedYet) {
    Graph graph = build_tiny();
    for (const State& state : graph.states()) {
        EXPECT_EQ(state.distance_to_solution, NOT_COMPUTED);
        EXPECT_EQ(state.distance_to_start, NOT_COMPUTED);
    }
}

TEST_F(GraphBuilderTest, MalformedInitialBoardFailsFast) {
    Board overlapping(2, 3, {
        Piece{Cell{0, 0}, Size{1, 2}},
        Piece{Cell{0, 1}, Size{1, 1}},
    });
    EXPECT_THROW(GraphBuilder(generator).build(overlapping, tiny.goal), MalformedBoard);

    Board outside(2, 3, {Piece{Cell{1, 0}, Size{2, 1}}});
    EXPECT_THROW(GraphBuilder(generator).build(outside, tiny.goal), MalformedBoard);

    EXPECT_THROW(GraphBuilder(generator).build(tiny.board, Goal{Size{2, 2}, Cell{1, 1}}), MalformedBoard);
}

TEST_F(GraphBuilderTest, UnknownIdIsNotFound) {
    Graph graph = build_tiny();
    EXPECT_THROW(graph.state(15), NotFound);
    EXPECT_THROW(graph.edges(15), NotFound);
}
