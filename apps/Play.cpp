#include "slidegraph/board_io.hpp"
#include "slidegraph/puzzle_config.hpp"
#include "slidegraph/solver.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

using namespace slidegraph;

namespace {

void print_state(const Solver& solver, StateId id) {
    const StateView state = solver.get_state(id);
    std::cout << "\n" << BoardIO::render(state.board);
    if (state.solved) {
        std::cout << "Solved!\n";
    } else if (is_finite(state.distance_to_solution)) {
        std::cout << state.distance_to_solution << " moves from a solution\n";
    } else {
        std::cout << "No solution is reachable from here\n";
    }
}

void print_moves(const std::vector<MoveInfo>& moves) {
    for (size_t i = 0; i < moves.size(); ++i) {
        const MoveInfo& info = moves[i];
        std::cout << "  " << (i + 1) << ") " << BoardIO::format_move(info.edge.move) << "  ";
        if (is_finite(info.resulting_distance)) {
            std::cout << info.resulting_distance << " steps left";
        } else {
            std::cout << "dead end";
        }
        std::cout << " [" << to_string(info.effect) << "]\n";
    }
}

} // namespace

// How to run: ./slidegraph_play [classic|pillars|tiny]
int main(int argc, char* argv[]) {
    try {
        PuzzleConfig config = PuzzleConfig::preset(argc >= 2 ? argv[1] : "classic");
        std::cout << "Building the state graph for '" << config.name << "'..." << std::endl;
        Solver solver(config);

        StateId current = solver.start_id();
        std::string input;
        while (true) {
            print_state(solver, current);
            std::vector<MoveInfo> moves = solver.collect_moves(current);
            print_moves(moves);
            std::cout << "Move number, (b)est, (a)uto-solve, (r)estart or (q)uit: " << std::flush;

            if (!std::getline(std::cin, input) || input == "q") break;

            if (input == "r") {
                current = solver.start_id();
            } else if (input == "b") {
                std::optional<Edge> best = solver.best_neighbor(current);
                if (best) current = best->to;
            } else if (input == "a") {
                for (const Edge& edge : solver.solution_path(current)) {
                    std::cout << "  " << BoardIO::format_move(edge.move) << "\n";
                    current = edge.to;
                }
            } else {
                int choice = std::atoi(input.c_str());
                if (choice >= 1 && choice <= static_cast<int>(moves.size())) {
                    current = moves[choice - 1].edge.to;
                } else {
                    std::cout << "Unknown command '" << input << "'\n";
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
