#include "slidegraph/puzzle_config.hpp"
#include <stdexcept>

namespace slidegraph {

namespace {

Piece piece(int x, int y, int w, int h) {
    return Piece{Cell{static_cast<int8_t>(x), static_cast<int8_t>(y)},
                 Size{static_cast<int8_t>(w), static_cast<int8_t>(h)}};
}

Goal big_block_home() {
    return Goal{Size{2, 2}, Cell{1, 0}};
}

} // namespace

PuzzleConfig PuzzleConfig::classic() {
    PuzzleConfig config;
    config.name = "classic";
    config.board = Board(4, 5, {
        piece(0, 3, 1, 2),  // A
        piece(1, 3, 2, 2),  // B
        piece(3, 3, 1, 2),  // C
        piece(0, 1, 1, 2),  // D
        piece(1, 2, 2, 1),  // E
        piece(3, 1, 1, 2),  // F
        piece(1, 1, 1, 1),  // G
        piece(2, 1, 1, 1),  // H
        piece(0, 0, 1, 1),  // I
        piece(3, 0, 1, 1),  // J
    });
    config.goal = big_block_home();
    return config;
}

PuzzleConfig PuzzleConfig::pillars() {
    PuzzleConfig config;
    config.name = "pillars";
    config.board = Board(4, 5, {
        piece(1, 3, 2, 2),
        piece(0, 3, 1, 2),
        piece(3, 3, 1, 2),
        piece(0, 1, 1, 1),
        piece(1, 1, 1, 1),
        piece(2, 1, 1, 1),
        piece(3, 1, 1, 1),
    });
    config.goal = big_block_home();
    config.max_slide_distance = 2;
    return config;
}

PuzzleConfig PuzzleConfig::tiny() {
    PuzzleConfig config;
    config.name = "tiny";
    config.board = Board(2, 3, {
        piece(0, 0, 1, 1),
        piece(1, 0, 1, 1),
    });
    config.goal = Goal{Size{1, 1}, Cell{0, 2}};
    return config;
}

std::vector<std::string> PuzzleConfig::preset_names() {
    return {"classic", "pillars", "tiny"};
}

PuzzleConfig PuzzleConfig::preset(const std::string& name) {
    if (name == "classic") return classic();
    if (name == "pillars") return pillars();
    if (name == "tiny") return tiny();
    throw std::invalid_argument("unknown puzzle preset '" + name + "'");
}

} // namespace slidegraph
