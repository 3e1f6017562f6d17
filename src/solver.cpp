#include "slidegraph/solver.hpp"
#include "slidegraph/distance_propagator.hpp"
#include "slidegraph/graph_builder.hpp"
#include <algorithm>
#include <chrono>

namespace slidegraph {

const char* to_string(MoveEffect effect) noexcept {
    switch (effect) {
        case MoveEffect::Positive:
            return "Positive";
        case MoveEffect::Neutral:
            return "Neutral";
        case MoveEffect::Negative:
            return "Negative";
    }
    return "?";
}

Solver::Solver(const PuzzleConfig& config)
    : config_(config), move_generator_(config.max_slide_distance) {
    auto t0 = std::chrono::steady_clock::now();
    graph_ = GraphBuilder(move_generator_).build(config_.board, config_.goal);
    auto t1 = std::chrono::steady_clock::now();

    DistancePropagator(graph_).run();
    auto t2 = std::chrono::steady_clock::now();

    build_ms_ = std::chrono::duration<double, std::milli>(t1 - t0).count();
    analyze_ms_ = std::chrono::duration<double, std::milli>(t2 - t1).count();
}

StateView Solver::get_state(StateId id) const {
    const State& state = graph_.state(id);
    return StateView{state.id, state.board, state.solved, state.distance_to_solution,
                     state.distance_to_start, state.on_shortest_path, graph_.edges(id)};
}

EdgeRange Solver::edges(StateId id) const {
    return graph_.edges(id);
}

MoveEffect Solver::classify_move(Distance from_distance, Distance to_distance) noexcept {
    if (to_distance < from_distance) return MoveEffect::Positive;
    if (to_distance > from_distance) return MoveEffect::Negative;
    return MoveEffect::Neutral;
}

std::optional<Edge> Solver::best_neighbor(StateId id) const {
    std::optional<Edge> best;
    Distance best_distance = NOT_COMPUTED;
    for (const Edge& edge : graph_.edges(id)) {
        Distance d = graph_.state(edge.to).distance_to_solution;
        // Strict comparison keeps the first edge on ties
        if (!best || d < best_distance) {
            best = edge;
            best_distance = d;
        }
    }
    return best;
}

std::vector<MoveInfo> Solver::collect_moves(StateId id) const {
    const Distance current = graph_.state(id).distance_to_solution;

    std::vector<MoveInfo> moves;
    EdgeRange range = graph_.edges(id);
    moves.reserve(range.size());
    for (const Edge& edge : range) {
        Distance resulting = graph_.state(edge.to).distance_to_solution;
        moves.push_back(MoveInfo{edge, resulting, classify_move(current, resulting)});
    }

    std::stable_sort(moves.begin(), moves.end(), [](const MoveInfo& a, const MoveInfo& b) {
        return a.resulting_distance < b.resulting_distance;
    });
    return moves;
}

std::vector<Edge> Solver::solution_path(StateId id) const {
    std::vector<Edge> path;
    const State* state = &graph_.state(id);
    if (!is_finite(state->distance_to_solution)) return path;

    // Each best move lowers the distance by exactly one
    path.reserve(state->distance_to_solution);
    while (!state->solved) {
        std::optional<Edge> edge = best_neighbor(state->id);
        if (!edge) break;
        path.push_back(*edge);
        state = &graph_.state(edge->to);
    }
    return path;
}

std::optional<StateId> Solver::find(const Board& board) const {
    if (board.width() != config_.board.width() || board.height() != config_.board.height() ||
        !board.is_valid()) {
        return std::nullopt;
    }
    // Linear scan, the key map does not outlive the build
    const CanonicalKey key = canonicalize(board);
    for (const State& state : graph_.states()) {
        if (state.board.piece_count() == board.piece_count() && canonicalize(state.board) == key) {
            return state.id;
        }
    }
    return std::nullopt;
}

} // namespace slidegraph
