#pragma once

#include "board.hpp"
#include <string>
#include <vector>

namespace slidegraph {

struct PuzzleConfig {
    std::string name;
    Board board;
    Goal goal;
    int max_slide_distance = 0;  // 0: unbounded

    // Traditional layout, the 2x2 block must reach the bottom middle:
    // ABBC
    // ABBC
    // DEEF
    // DGHF
    // I..J
    static PuzzleConfig classic();

    // Open board, slides limited to two cells:
    // BAAC
    // BAAC
    // ....
    // DEFG
    // ....
    static PuzzleConfig pillars();

    // 2x3 board with two unit pieces, one must reach the top-left cell
    static PuzzleConfig tiny();

    static std::vector<std::string> preset_names();

    // Throws std::invalid_argument for unknown names
    static PuzzleConfig preset(const std::string& name);
};

} // namespace slidegraph
