#pragma once

#include "board.hpp"
#include "move.hpp"
#include <vector>

namespace slidegraph {

struct Successor {
    Board board;
    SlideMove move;
};

class MoveGenerator {
private:
    int max_slide_distance_;  // 0: as far as the free run allows

public:
    explicit MoveGenerator(int max_slide_distance = 0);
    ~MoveGenerator() = default;

    int max_slide_distance() const noexcept { return max_slide_distance_; }

    // Number of free cells the piece can travel in `dir` before hitting the
    // grid edge or another piece. The whole swept rectangle is checked.
    int max_run(const Occupancy& occupancy, const Piece& piece, Direction dir) const noexcept;

    // Calls visit(const Board& next, const SlideMove& move) for every legal slide,
    // pieces in storage order, directions Up/Down/Left/Right, distance ascending.
    // `next` is a scratch board that is only valid during the call.
    template <typename Visitor>
    void for_each_move(const Board& board, Visitor&& visit) const;

    std::vector<Successor> generate(const Board& board) const;

    // Performs one given move; throws std::invalid_argument if it is not legal
    Board apply(const Board& board, const SlideMove& move) const;
};

template <typename Visitor>
void MoveGenerator::for_each_move(const Board& board, Visitor&& visit) const {
    Occupancy occupancy = board.occupancy();
    Board scratch = board;

    for (size_t index = 0; index < board.piece_count(); ++index) {
        const Piece& piece = board.piece(index);
        for (Direction dir : DIRECTIONS) {
            int run = max_run(occupancy, piece, dir);
            if (max_slide_distance_ > 0 && run > max_slide_distance_) {
                run = max_slide_distance_;
            }
            for (int distance = 1; distance <= run; ++distance) {
                SlideMove move{piece.size, piece.origin, dir, static_cast<int8_t>(distance)};
                scratch.move_piece(index, move.end());
                visit(static_cast<const Board&>(scratch), static_cast<const SlideMove&>(move));
            }
            scratch.move_piece(index, piece.origin);
        }
    }
}

} // namespace slidegraph
