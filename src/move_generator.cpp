#include "slidegraph/move_generator.hpp"
#include <stdexcept>
#include <string>

namespace slidegraph {

const char* to_string(Direction dir) noexcept {
    switch (dir) {
        case Direction::Up:
            return "Up";
        case Direction::Down:
            return "Down";
        case Direction::Left:
            return "Left";
        case Direction::Right:
            return "Right";
    }
    return "?";
}

MoveGenerator::MoveGenerator(int max_slide_distance)
    : max_slide_distance_(max_slide_distance < 0 ? 0 : max_slide_distance) {}

int MoveGenerator::max_run(const Occupancy& occupancy, const Piece& piece, Direction dir) const noexcept {
    const int x = piece.origin.x;
    const int y = piece.origin.y;
    const int w = piece.size.width;
    const int h = piece.size.height;

    // Probe the one-cell-thick strip just beyond the leading edge, step by step
    int run = 0;
    for (int step = 1;; ++step) {
        bool open = false;
        switch (dir) {
            case Direction::Up:
                open = occupancy.is_free(x, y + h - 1 + step, w, 1);
                break;
            case Direction::Down:
                open = occupancy.is_free(x, y - step, w, 1);
                break;
            case Direction::Left:
                open = occupancy.is_free(x - step, y, 1, h);
                break;
            case Direction::Right:
                open = occupancy.is_free(x + w - 1 + step, y, 1, h);
                break;
        }
        if (!open) break;
        run = step;
    }
    return run;
}

std::vector<Successor> MoveGenerator::generate(const Board& board) const {
    std::vector<Successor> successors;
    for_each_move(board, [&](const Board& next, const SlideMove& move) {
        successors.push_back(Successor{next, move});
    });
    return successors;
}

Board MoveGenerator::apply(const Board& board, const SlideMove& move) const {
    int index = board.piece_starting_at(move.start);
    if (index < 0 || board.piece(index).size != move.piece_size) {
        throw std::invalid_argument("no " + std::to_string(move.piece_size.width) + "x" +
                                    std::to_string(move.piece_size.height) + " piece starts at (" +
                                    std::to_string(move.start.x) + "," + std::to_string(move.start.y) + ")");
    }
    if (move.distance < 1) {
        throw std::invalid_argument("slide distance must be positive");
    }
    if (max_slide_distance_ > 0 && move.distance > max_slide_distance_) {
        throw std::invalid_argument("slide distance exceeds the configured limit");
    }

    int run = max_run(board.occupancy(), board.piece(index), move.direction);
    if (move.distance > run) {
        throw std::invalid_argument(std::string("slide ") + to_string(move.direction) + " " +
                                    std::to_string(move.distance) + " is blocked");
    }

    Board next = board;
    next.move_piece(static_cast<size_t>(index), move.end());
    return next;
}

} // namespace slidegraph
