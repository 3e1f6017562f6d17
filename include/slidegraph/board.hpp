#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace slidegraph {

struct Cell {
    int8_t x, y;  // column, row; (0,0) is the bottom-left cell

    Cell() = default;
    Cell(int8_t col, int8_t row) : x(col), y(row) {}

    bool operator==(const Cell& other) const noexcept {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Cell& other) const noexcept { return !(*this == other); }
    bool operator<(const Cell& other) const noexcept {
        if (y != other.y) return y < other.y;
        return x < other.x;
    }
};

struct Size {
    int8_t width, height;

    Size() = default;
    Size(int8_t w, int8_t h) : width(w), height(h) {}

    bool operator==(const Size& other) const noexcept {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const noexcept { return !(*this == other); }
    bool operator<(const Size& other) const noexcept {
        if (width != other.width) return width < other.width;
        return height < other.height;
    }

    // 1..4 for the supported sizes, 0 for anything else
    int code() const noexcept {
        if (width < 1 || width > 2 || height < 1 || height > 2) return 0;
        return 1 + (width - 1) * 2 + (height - 1);
    }
    static Size from_code(int code) noexcept {
        return Size{static_cast<int8_t>(1 + (code - 1) / 2), static_cast<int8_t>(1 + (code - 1) % 2)};
    }
};

struct Piece {
    Cell origin;  // bottom-left cell covered by the piece
    Size size;

    Piece() = default;
    Piece(Cell o, Size s) : origin(o), size(s) {}

    bool covers(Cell cell) const noexcept {
        return origin.x <= cell.x && cell.x < origin.x + size.width &&
               origin.y <= cell.y && cell.y < origin.y + size.height;
    }

    bool operator==(const Piece& other) const noexcept {
        return origin == other.origin && size == other.size;
    }
    bool operator!=(const Piece& other) const noexcept { return !(*this == other); }

    // Canonical order: size first, then position
    bool operator<(const Piece& other) const noexcept {
        if (size != other.size) return size < other.size;
        return origin < other.origin;
    }
};

// The designated piece (identified by its size) must reach `cell`.
struct Goal {
    Size piece_size;
    Cell cell;

    Goal() = default;
    Goal(Size s, Cell c) : piece_size(s), cell(c) {}
};

// Free/occupied mask of a board, one bit per cell (index = y * width + x).
class Occupancy {
private:
    uint64_t bits_ = 0;
    int width_ = 0;
    int height_ = 0;

    inline int to_index(int x, int y) const noexcept { return y * width_ + x; }

public:
    Occupancy(int width, int height) : width_(width), height_(height) {}

    inline bool in_bounds(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    inline bool occupied(int x, int y) const noexcept {
        return (bits_ >> to_index(x, y)) & 1ULL;
    }
    inline void set(int x, int y) noexcept { bits_ |= 1ULL << to_index(x, y); }
    inline void clear(int x, int y) noexcept { bits_ &= ~(1ULL << to_index(x, y)); }

    // True iff every cell of the rectangle is on the board and free
    bool is_free(int x, int y, int w, int h) const noexcept;

    int free_count() const noexcept;
    uint64_t bits() const noexcept { return bits_; }
};

// Deduplication key: the set of (size, origin) pairs packed per cell, so it does
// not depend on the order of same-size pieces.
struct CanonicalKey {
    static constexpr int BITS_PER_CELL = 3;
    static constexpr int CELLS_PER_WORD = 64 / BITS_PER_CELL;  // 21
    static constexpr int NUM_WORDS = 4;                         // 84 cells >= 64

    std::array<uint64_t, NUM_WORDS> words{};
    uint64_t hash = 0;  // Zobrist hash of the same pieces

    bool operator==(const CanonicalKey& other) const noexcept {
        return words == other.words;
    }
    bool operator!=(const CanonicalKey& other) const noexcept { return !(*this == other); }
};

struct CanonicalKeyHash {
    size_t operator()(const CanonicalKey& key) const noexcept {
        return static_cast<size_t>(key.hash);
    }
};

class Board {
public:
    static constexpr int MAX_DIMENSION = 8;
    static constexpr int MAX_CELLS = 64;

    Board() = default;
    Board(int width, int height, std::vector<Piece> pieces);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    const std::vector<Piece>& pieces() const noexcept { return pieces_; }
    size_t piece_count() const noexcept { return pieces_.size(); }
    const Piece& piece(size_t index) const { return pieces_[index]; }

    // Throws MalformedBoard when dimensions, sizes or placement are invalid
    void validate() const;
    bool is_valid() const noexcept;

    Occupancy occupancy() const noexcept;

    // Index of the piece covering `cell`, or -1 if the cell is free
    int piece_at(Cell cell) const noexcept;
    // Index of the piece whose origin is `cell`, or -1
    int piece_starting_at(Cell cell) const noexcept;

    // In-place relocation used by the move generator
    void move_piece(size_t index, Cell origin) noexcept { pieces_[index].origin = origin; }

    // Same pieces sorted by the canonical order
    Board canonical() const;

    // Pieces compared as lists, in storage order
    bool operator==(const Board& other) const noexcept;
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Piece> pieces_;
};

// The board must be valid; see Board::validate()
CanonicalKey canonicalize(const Board& board) noexcept;

// Rebuilds the sorted board described by `key`
Board canonical_board(const CanonicalKey& key, int width, int height);

// False whenever either board is invalid
bool equivalent(const Board& a, const Board& b) noexcept;

bool is_solved(const Board& board, const Goal& goal) noexcept;

// Throws MalformedBoard if the goal region does not fit on the board
void validate_goal(const Board& board, const Goal& goal);

} // namespace slidegraph
