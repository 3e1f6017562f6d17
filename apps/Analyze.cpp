#include "slidegraph/board_io.hpp"
#include "slidegraph/profiler.hpp"
#include "slidegraph/puzzle_config.hpp"
#include "slidegraph/solver.hpp"
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace slidegraph;

namespace {

PuzzleConfig load_config(const std::string& source) {
    for (const std::string& name : PuzzleConfig::preset_names()) {
        if (name == source) return PuzzleConfig::preset(name);
    }

    std::ifstream file(source);
    if (!file) {
        throw std::invalid_argument("'" + source + "' is neither a preset nor a readable layout file");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    PuzzleConfig config;
    config.name = source;
    config.board = BoardIO::parse(buffer.str());
    config.goal = PuzzleConfig::classic().goal;
    return config;
}

std::string format_distance(Distance d) {
    if (d == UNREACHABLE) return "unreachable";
    if (d == NOT_COMPUTED) return "not computed";
    return std::to_string(d);
}

} // namespace

// How to run: ./slidegraph_analyze [classic|pillars|tiny|layout-file] [goal WxH@x,y] [max-slide]
int main(int argc, char* argv[]) {
    try {
        PuzzleConfig config = load_config(argc >= 2 ? argv[1] : "classic");
        if (argc >= 3) config.goal = BoardIO::parse_goal(argv[2]);
        if (argc >= 4) config.max_slide_distance = std::atoi(argv[3]);

        std::cout << "Puzzle: " << config.name << "\n";
        std::cout << BoardIO::render(config.board);
        std::cout << "Goal: " << BoardIO::format_goal(config.goal)
                  << ", max slide: "
                  << (config.max_slide_distance > 0 ? std::to_string(config.max_slide_distance) : "unbounded")
                  << "\n\n";

        Solver solver(config);
        const Graph& graph = solver.graph();
        const StateView start = solver.get_state(solver.start_id());

        size_t on_path = 0;
        for (const State& state : graph.states()) {
            if (state.on_shortest_path) ++on_path;
        }

        std::cout << "States:                   " << BoardIO::format_with_commas(graph.state_count()) << "\n";
        std::cout << "Edges:                    " << BoardIO::format_with_commas(graph.edge_count()) << "\n";
        std::cout << "Solved states:            " << BoardIO::format_with_commas(graph.solved_count()) << "\n";
        std::cout << "States on shortest paths: " << BoardIO::format_with_commas(on_path) << "\n";
        std::cout << "Max distance to solution: " << graph.max_distance_to_solution() << "\n";
        std::cout << "Max distance from start:  " << graph.max_distance_to_start() << "\n";
        std::cout << "Minimum moves from start: " << format_distance(start.distance_to_solution) << "\n";
        std::cout << std::fixed << std::setprecision(1)
                  << "Build: " << solver.build_ms() << " ms, analysis: " << solver.analyze_ms() << " ms\n";

        std::vector<Edge> path = solver.solution_path(solver.start_id());
        if (!path.empty()) {
            std::cout << "\nSolution:\n";
            for (size_t i = 0; i < path.size(); ++i) {
                std::cout << std::setw(4) << (i + 1) << ". " << BoardIO::format_move(path[i].move) << "\n";
            }
            std::cout << "\nSolved board:\n" << BoardIO::render(solver.get_state(path.back().to).board);
        }

        Profiler::instance().print_report();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
