#pragma once

#include "graph.hpp"
#include "move_generator.hpp"
#include "puzzle_config.hpp"
#include "state.hpp"
#include <optional>
#include <vector>

namespace slidegraph {

enum class MoveEffect {
    Positive,  // gets closer to the solution
    Neutral,
    Negative,
};

const char* to_string(MoveEffect effect) noexcept;

// One state together with its outgoing edges. References point into the
// Solver's graph and stay valid as long as the Solver.
struct StateView {
    StateId id;
    const Board& board;  // canonical
    bool solved;
    Distance distance_to_solution;
    Distance distance_to_start;
    bool on_shortest_path;
    EdgeRange edges;
};

struct MoveInfo {
    Edge edge;
    Distance resulting_distance;
    MoveEffect effect;
};

// Read-only queries over a fully built and analyzed puzzle graph. The
// constructor runs both phases, so every method sees a complete graph and none
// of them mutate it; a constructed Solver may be shared between threads.
class Solver {
private:
    PuzzleConfig config_;
    MoveGenerator move_generator_;
    Graph graph_;
    double build_ms_ = 0.0;
    double analyze_ms_ = 0.0;

public:
    // Throws MalformedBoard if the configured board or goal is invalid
    explicit Solver(const PuzzleConfig& config);
    ~Solver() = default;

    Solver(const Solver&) = delete;
    Solver& operator=(const Solver&) = delete;

    StateId start_id() const noexcept { return graph_.start_id(); }

    // Throws NotFound for unknown IDs
    StateView get_state(StateId id) const;
    EdgeRange edges(StateId id) const;

    static MoveEffect classify_move(Distance from_distance, Distance to_distance) noexcept;

    // Edge to the neighbour closest to a solution, first one on ties.
    // Empty when the state has no moves at all.
    std::optional<Edge> best_neighbor(StateId id) const;

    // Outgoing moves sorted by resulting distance, ties in enumeration order
    std::vector<MoveInfo> collect_moves(StateId id) const;

    // Best moves from `id` until a solved state; empty if `id` is solved or unreachable
    std::vector<Edge> solution_path(StateId id) const;

    // ID of an arbitrary board, if it was reached from the start. Boards that
    // fail validation are never found.
    std::optional<StateId> find(const Board& board) const;

    const Graph& graph() const noexcept { return graph_; }
    const PuzzleConfig& config() const noexcept { return config_; }
    const MoveGenerator& move_generator() const noexcept { return move_generator_; }

    double build_ms() const noexcept { return build_ms_; }
    double analyze_ms() const noexcept { return analyze_ms_; }
};

} // namespace slidegraph
