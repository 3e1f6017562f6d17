#include "slidegraph/board.hpp"
#include "slidegraph/errors.hpp"
#include "slidegraph/zobrist.hpp"
#include <algorithm>
#include <string>

namespace slidegraph {

namespace {

std::string describe(const Piece& piece) {
    return std::to_string(piece.size.width) + "x" + std::to_string(piece.size.height) +
           " piece at (" + std::to_string(piece.origin.x) + "," + std::to_string(piece.origin.y) + ")";
}

} // namespace

bool Occupancy::is_free(int x, int y, int w, int h) const noexcept {
    if (!in_bounds(x, y) || !in_bounds(x + w - 1, y + h - 1)) return false;
    for (int row = y; row < y + h; ++row) {
        for (int col = x; col < x + w; ++col) {
            if (occupied(col, row)) return false;
        }
    }
    return true;
}

int Occupancy::free_count() const noexcept {
    int occupied_cells = 0;
    for (uint64_t b = bits_; b != 0; b &= b - 1) {
        ++occupied_cells;
    }
    return width_ * height_ - occupied_cells;
}

Board::Board(int width, int height, std::vector<Piece> pieces)
    : width_(width), height_(height), pieces_(std::move(pieces)) {}

void Board::validate() const {
    if (width_ < 1 || height_ < 1 || width_ > MAX_DIMENSION || height_ > MAX_DIMENSION) {
        throw MalformedBoard("grid " + std::to_string(width_) + "x" + std::to_string(height_) +
                             " is outside 1x1.." + std::to_string(MAX_DIMENSION) + "x" +
                             std::to_string(MAX_DIMENSION));
    }

    Occupancy occupancy(width_, height_);
    for (const Piece& piece : pieces_) {
        if (piece.size.code() == 0) {
            throw MalformedBoard("unsupported size of " + describe(piece));
        }
        if (!occupancy.in_bounds(piece.origin.x, piece.origin.y) ||
            !occupancy.in_bounds(piece.origin.x + piece.size.width - 1,
                                 piece.origin.y + piece.size.height - 1)) {
            throw MalformedBoard(describe(piece) + " leaves the grid");
        }
        if (!occupancy.is_free(piece.origin.x, piece.origin.y, piece.size.width, piece.size.height)) {
            throw MalformedBoard(describe(piece) + " overlaps another piece");
        }
        for (int row = piece.origin.y; row < piece.origin.y + piece.size.height; ++row) {
            for (int col = piece.origin.x; col < piece.origin.x + piece.size.width; ++col) {
                occupancy.set(col, row);
            }
        }
    }
}

bool Board::is_valid() const noexcept {
    try {
        validate();
    } catch (const MalformedBoard&) {
        return false;
    }
    return true;
}

Occupancy Board::occupancy() const noexcept {
    Occupancy occupancy(width_, height_);
    for (const Piece& piece : pieces_) {
        for (int row = piece.origin.y; row < piece.origin.y + piece.size.height; ++row) {
            for (int col = piece.origin.x; col < piece.origin.x + piece.size.width; ++col) {
                occupancy.set(col, row);
            }
        }
    }
    return occupancy;
}

int Board::piece_at(Cell cell) const noexcept {
    for (size_t i = 0; i < pieces_.size(); ++i) {
        if (pieces_[i].covers(cell)) return static_cast<int>(i);
    }
    return -1;
}

int Board::piece_starting_at(Cell cell) const noexcept {
    for (size_t i = 0; i < pieces_.size(); ++i) {
        if (pieces_[i].origin == cell) return static_cast<int>(i);
    }
    return -1;
}

Board Board::canonical() const {
    Board sorted = *this;
    std::sort(sorted.pieces_.begin(), sorted.pieces_.end());
    return sorted;
}

bool Board::operator==(const Board& other) const noexcept {
    return width_ == other.width_ && height_ == other.height_ && pieces_ == other.pieces_;
}

CanonicalKey canonicalize(const Board& board) noexcept {
    const Zobrist& zobrist = Zobrist::instance();
    CanonicalKey key;
    for (const Piece& piece : board.pieces()) {
        int cell = piece.origin.y * board.width() + piece.origin.x;
        int code = piece.size.code();
        int word = cell / CanonicalKey::CELLS_PER_WORD;
        int shift = (cell % CanonicalKey::CELLS_PER_WORD) * CanonicalKey::BITS_PER_CELL;
        key.words[word] |= static_cast<uint64_t>(code) << shift;
        key.hash ^= zobrist.piece_key(code, cell);
    }
    return key;
}

Board canonical_board(const CanonicalKey& key, int width, int height) {
    std::vector<Piece> pieces;
    for (int cell = 0; cell < width * height; ++cell) {
        int word = cell / CanonicalKey::CELLS_PER_WORD;
        int shift = (cell % CanonicalKey::CELLS_PER_WORD) * CanonicalKey::BITS_PER_CELL;
        int code = static_cast<int>((key.words[word] >> shift) & 0x7);
        if (code == 0) continue;
        Cell origin{static_cast<int8_t>(cell % width), static_cast<int8_t>(cell / width)};
        pieces.emplace_back(origin, Size::from_code(code));
    }
    std::sort(pieces.begin(), pieces.end());
    return Board(width, height, std::move(pieces));
}

bool equivalent(const Board& a, const Board& b) noexcept {
    return a.width() == b.width() && a.height() == b.height() &&
           a.piece_count() == b.piece_count() && a.is_valid() && b.is_valid() &&
           canonicalize(a) == canonicalize(b);
}

bool is_solved(const Board& board, const Goal& goal) noexcept {
    return std::any_of(board.pieces().begin(), board.pieces().end(), [&](const Piece& piece) {
        return piece.size == goal.piece_size && piece.origin == goal.cell;
    });
}

void validate_goal(const Board& board, const Goal& goal) {
    if (goal.piece_size.code() == 0) {
        throw MalformedBoard("unsupported goal piece size");
    }
    Occupancy grid(board.width(), board.height());
    if (!grid.is_free(goal.cell.x, goal.cell.y, goal.piece_size.width, goal.piece_size.height)) {
        throw MalformedBoard("goal region at (" + std::to_string(goal.cell.x) + "," +
                             std::to_string(goal.cell.y) + ") lies outside the grid");
    }
}

} // namespace slidegraph
