#pragma once

#include "board.hpp"
#include "move.hpp"
#include <string>

namespace slidegraph {

class BoardIO {
public:
    // Rows top to bottom, one letter per piece in storage order, '.' for free cells
    static std::string render(const Board& board);

    // Inverse of render(). Every letter must form a 1x1..2x2 rectangle, rows must
    // share one width. Throws MalformedBoard otherwise.
    static Board parse(const std::string& layout);

    // "WxH@x,y", e.g. "2x2@1,0". Throws MalformedBoard on bad syntax.
    static Goal parse_goal(const std::string& text);
    static std::string format_goal(const Goal& goal);

    // "(x,y) Up 2"
    static std::string format_move(const SlideMove& move);

    static std::string format_with_commas(size_t value);
};

} // namespace slidegraph
