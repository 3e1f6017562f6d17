#include "slidegraph/board_io.hpp"
#include "slidegraph/errors.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace slidegraph {

namespace {

char label_for(size_t index) {
    if (index < 26) return static_cast<char>('A' + index);
    if (index < 52) return static_cast<char>('a' + (index - 26));
    return '#';
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

bool parse_int_pair(const std::string& text, char separator, int& a, int& b) {
    size_t pos = text.find(separator);
    if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) return false;
    const std::string first = text.substr(0, pos);
    const std::string second = text.substr(pos + 1);
    auto all_digits = [](const std::string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        });
    };
    if (!all_digits(first) || !all_digits(second) || first.size() > 2 || second.size() > 2) return false;
    a = std::stoi(first);
    b = std::stoi(second);
    return true;
}

} // namespace

std::string BoardIO::render(const Board& board) {
    std::vector<std::string> rows(board.height(), std::string(board.width(), '.'));
    for (size_t i = 0; i < board.piece_count(); ++i) {
        const Piece& piece = board.piece(i);
        for (int y = piece.origin.y; y < piece.origin.y + piece.size.height; ++y) {
            for (int x = piece.origin.x; x < piece.origin.x + piece.size.width; ++x) {
                if (y >= 0 && y < board.height() && x >= 0 && x < board.width()) {
                    rows[y][x] = label_for(i);
                }
            }
        }
    }

    std::string out;
    for (int y = board.height() - 1; y >= 0; --y) {
        out += rows[y];
        out += '\n';
    }
    return out;
}

Board BoardIO::parse(const std::string& layout) {
    std::vector<std::string> lines;
    std::istringstream in(layout);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) lines.push_back(line);
    }
    if (lines.empty()) {
        throw MalformedBoard("empty layout");
    }

    const int height = static_cast<int>(lines.size());
    const int width = static_cast<int>(lines.front().size());
    if (width > Board::MAX_DIMENSION || height > Board::MAX_DIMENSION) {
        throw MalformedBoard("layout larger than " + std::to_string(Board::MAX_DIMENSION) + "x" +
                             std::to_string(Board::MAX_DIMENSION));
    }

    // Bounding box per label, in order of first appearance reading top-down
    struct Extent {
        int min_x, min_y, max_x, max_y, cells;
    };
    std::vector<char> order;
    std::map<char, Extent> extents;
    for (int row = 0; row < height; ++row) {
        if (static_cast<int>(lines[row].size()) != width) {
            throw MalformedBoard("row " + std::to_string(row + 1) + " has a different width");
        }
        const int y = height - 1 - row;
        for (int x = 0; x < width; ++x) {
            char c = lines[row][x];
            if (c == '.') continue;
            if (!std::isalnum(static_cast<unsigned char>(c))) {
                throw MalformedBoard(std::string("unexpected character '") + c + "'");
            }
            auto it = extents.find(c);
            if (it == extents.end()) {
                order.push_back(c);
                extents[c] = Extent{x, y, x, y, 1};
            } else {
                Extent& e = it->second;
                e.min_x = std::min(e.min_x, x);
                e.min_y = std::min(e.min_y, y);
                e.max_x = std::max(e.max_x, x);
                e.max_y = std::max(e.max_y, y);
                ++e.cells;
            }
        }
    }

    std::vector<Piece> pieces;
    for (char c : order) {
        const Extent& e = extents[c];
        const int w = e.max_x - e.min_x + 1;
        const int h = e.max_y - e.min_y + 1;
        if (e.cells != w * h) {
            throw MalformedBoard(std::string("piece '") + c + "' is not a rectangle");
        }
        Piece piece{Cell{static_cast<int8_t>(e.min_x), static_cast<int8_t>(e.min_y)},
                    Size{static_cast<int8_t>(w), static_cast<int8_t>(h)}};
        if (piece.size.code() == 0) {
            throw MalformedBoard(std::string("piece '") + c + "' is larger than 2x2");
        }
        pieces.push_back(piece);
    }

    Board board(width, height, std::move(pieces));
    board.validate();
    return board;
}

Goal BoardIO::parse_goal(const std::string& text) {
    const std::string goal_text = trim(text);
    size_t at = goal_text.find('@');
    int w = 0, h = 0, x = 0, y = 0;
    if (at == std::string::npos ||
        !parse_int_pair(goal_text.substr(0, at), 'x', w, h) ||
        !parse_int_pair(goal_text.substr(at + 1), ',', x, y)) {
        throw MalformedBoard("goal '" + text + "' is not of the form WxH@x,y");
    }
    Goal goal{Size{static_cast<int8_t>(w), static_cast<int8_t>(h)},
              Cell{static_cast<int8_t>(x), static_cast<int8_t>(y)}};
    if (goal.piece_size.code() == 0) {
        throw MalformedBoard("goal piece size " + std::to_string(w) + "x" + std::to_string(h) +
                             " is not supported");
    }
    return goal;
}

std::string BoardIO::format_goal(const Goal& goal) {
    return std::to_string(goal.piece_size.width) + "x" + std::to_string(goal.piece_size.height) +
           "@" + std::to_string(goal.cell.x) + "," + std::to_string(goal.cell.y);
}

std::string BoardIO::format_move(const SlideMove& move) {
    return "(" + std::to_string(move.start.x) + "," + std::to_string(move.start.y) + ") " +
           to_string(move.direction) + " " + std::to_string(move.distance);
}

std::string BoardIO::format_with_commas(size_t value) {
    std::string num = std::to_string(value);
    std::string result;
    int count = 0;
    for (int i = static_cast<int>(num.length()) - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0) result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return result;
}

} // namespace slidegraph
