#include <gtest/gtest.h>
#include "slidegraph/distance_propagator.hpp"
#include "slidegraph/graph_builder.hpp"
#include "slidegraph/puzzle_config.hpp"
#include <deque>
#include <vector>

using namespace slidegraph;

namespace {

// Plain forward BFS from `from` to the nearest solved state
Distance brute_force_distance(const Graph& graph, StateId from) {
    std::vector<Distance> seen(graph.state_count(), NOT_COMPUTED);
    std::deque<StateId> queue{from};
    seen[from] = 0;
    while (!queue.empty()) {
        StateId current = queue.front();
        queue.pop_front();
        if (graph.state(current).solved) return seen[current];
        for (const Edge& edge : graph.edges(current)) {
            if (seen[edge.to] == NOT_COMPUTED) {
                seen[edge.to] = seen[current] + 1;
                queue.push_back(edge.to);
            }
        }
    }
    return UNREACHABLE;
}

} // namespace

class DistancePropagatorTest : public ::testing::Test {
protected:
    MoveGenerator generator;

    Graph build(const PuzzleConfig& config) const {
        return GraphBuilder(generator).build(config.board, config.goal);
    }
};

TEST_F(DistancePropagatorTest, SolvedStatesAreAtDistanceZero) {
    Graph graph = build(PuzzleConfig::tiny());
    DistancePropagator(graph).propagate_to_solution();

    for (const State& state : graph.states()) {
        EXPECT_EQ(state.solved, state.distance_to_solution == 0);
    }
}

TEST_F(DistancePropagatorTest, TinyPuzzleDistances) {
    Graph graph = build(PuzzleConfig::tiny());
    Distance max_distance = DistancePropagator(graph).propagate_to_solution();

    EXPECT_EQ(graph.state(START_ID).distance_to_solution, 1u);
    EXPECT_EQ(max_distance, 2u);
    EXPECT_EQ(graph.max_distance_to_solution(), 2u);
}

TEST_F(DistancePropagatorTest, MatchesBruteForceShortestPaths) {
    PuzzleConfig configs[] = {PuzzleConfig::tiny(), PuzzleConfig::tiny()};
    configs[1].board = Board(3, 3, {
        Piece{Cell{0, 0}, Size{2, 1}},
        Piece{Cell{2, 0}, Size{1, 2}},
        Piece{Cell{0, 1}, Size{1, 1}},
        Piece{Cell{1, 1}, Size{1, 1}},
    });
    configs[1].goal = Goal{Size{2, 1}, Cell{0, 1}};

    for (const PuzzleConfig& config : configs) {
        Graph graph = build(config);
        DistancePropagator(graph).propagate_to_solution();
        for (const State& state : graph.states()) {
            EXPECT_EQ(state.distance_to_solution, brute_force_distance(graph, state.id))
                << "state " << state.id;
        }
    }
}

TEST_F(DistancePropagatorTest, NeighbourDistancesDifferByAtMostOne) {
    Graph graph = build(PuzzleConfig::tiny());
    DistancePropagator(graph).propagate_to_solution();

    for (const State& state : graph.states()) {
        bool has_closer_neighbour = false;
        for (const Edge& edge : graph.edges(state.id)) {
            Distance there = graph.state(edge.to).distance_to_solution;
            EXPECT_LE(there, state.distance_to_solution + 1);
            EXPECT_LE(state.distance_to_solution, there + 1);
            if (there + 1 == state.distance_to_solution) has_closer_neighbour = true;
        }
        EXPECT_EQ(has_closer_neighbour, !state.solved);
    }
}

TEST_F(DistancePropagatorTest, UnreachableStatesGetTheSentinel) {
    // The goal asks for a 2x1 piece that does not exist on this board
    PuzzleConfig config;
    config.board = Board(2, 2, {Piece{Cell{0, 0}, Size{1, 1}}});
    config.goal = Goal{Size{2, 1}, Cell{0, 0}};

    Graph graph = build(config);
    ASSERT_EQ(graph.state_count(), 4u);

    Distance max_distance = DistancePropagator(graph).propagate_to_solution();
    EXPECT_EQ(max_distance, 0u);
    for (const State& state : graph.states()) {
        EXPECT_EQ(state.distance_to_solution, UNREACHABLE);
        EXPECT_NE(state.distance_to_solution, NOT_COMPUTED);
        EXPECT_FALSE(is_finite(state.distance_to_solution));
    }
}

TEST_F(DistancePropagatorTest, DistanceFromStart) {
    Graph graph = build(PuzzleConfig::tiny());
    Distance max_distance = DistancePropagator(graph).propagate_from_start();

    EXPECT_EQ(graph.state(START_ID).distance_to_start, 0u);
    EXPECT_EQ(max_distance, 3u);
    EXPECT_EQ(graph.max_distance_to_start(), 3u);
    for (const Edge& edge : graph.edges(START_ID)) {
        EXPECT_EQ(graph.state(edge.to).distance_to_start, 1u);
    }
}

TEST_F(DistancePropagatorTest, ShortestPathMembership) {
    Graph graph = build(PuzzleConfig::tiny());
    DistancePropagator propagator(graph);
    propagator.run();

    // Start plus the one solved board a single move away
    size_t marked = 0;
    for (const State& state : graph.states()) {
        if (!state.on_shortest_path) continue;
        ++marked;
        EXPECT_EQ(state.distance_to_start + state.distance_to_solution,
                  graph.state(START_ID).distance_to_solution);
    }
    EXPECT_EQ(marked, 2u);
    EXPECT_TRUE(graph.state(START_ID).on_shortest_path);
    EXPECT_EQ(propagator.mark_shortest_paths(), 2u);
}

TEST_F(DistancePropagatorTest, NoShortestPathsWithoutASolution) {
    PuzzleConfig config;
    config.board = Board(2, 2, {Piece{Cell{0, 0}, Size{1, 1}}});
    config.goal = Goal{Size{2, 1}, Cell{0, 0}};

    Graph graph = build(config);
    DistancePropagator(graph).run();
    for (const State& state : graph.states()) {
        EXPECT_FALSE(state.on_shortest_path);
        EXPECT_TRUE(is_finite(state.distance_to_start));
    }
}
