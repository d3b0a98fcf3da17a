// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <optional>
#include <array>
#include <set>

namespace fl {

    // Canonical palette order. Action ids index into this order.
    enum class Color : uint8_t { Red = 0, Green = 1, Blue = 2, Yellow = 3, Purple = 4, Orange = 5 };

    constexpr int kPaletteSize = 6;

    constexpr std::array<Color, kPaletteSize> kCanonicalColors = {
        Color::Red, Color::Green, Color::Blue, Color::Yellow, Color::Purple, Color::Orange
    };

    inline int colorIndex(Color c) { return static_cast<int>(c); }

    inline std::optional<Color> colorFromIndex(int i) {
        if (i < 0 || i >= kPaletteSize) return std::nullopt;
        return kCanonicalColors[i];
    }

    inline const char* colorName(Color c) {
        switch (c) {
        case Color::Red: return "red";
        case Color::Green: return "green";
        case Color::Blue: return "blue";
        case Color::Yellow: return "yellow";
        case Color::Purple: return "purple";
        case Color::Orange: return "orange";
        }
        return "?";
    }

    struct Coord {
        int row{ 0 };
        int col{ 0 };

        bool operator==(const Coord& o) const { return row == o.row && col == o.col; }
        bool operator!=(const Coord& o) const { return !(*this == o); }
        bool operator<(const Coord& o) const { return row != o.row ? row < o.row : col < o.col; }
    };

    using CellSet = std::set<Coord>;

    // Square NxN matrix, row-major. Value type: copies never alias.
    struct Grid {
        int n{ 0 };
        std::vector<Color> cells;

        Grid() = default;
        Grid(int size, Color fill) : n(size), cells(size_t(size) * size, fill) {}

        int size() const { return n; }
        int area() const { return n * n; }
        bool inBounds(int r, int c) const { return r >= 0 && c >= 0 && r < n && c < n; }

        Color at(int r, int c) const { return cells[size_t(r) * n + c]; }
        Color& at(int r, int c) { return cells[size_t(r) * n + c]; }
        Color at(const Coord& p) const { return at(p.row, p.col); }

        bool operator==(const Grid& o) const { return n == o.n && cells == o.cells; }
        bool operator!=(const Grid& o) const { return !(*this == o); }
    };

    enum class GameStatus : uint8_t { InProgress = 0, Solved = 1, Lost = 2 };

    enum class MoveResult : uint8_t { Accepted = 0, OutOfBounds, NoOpMove, LockedCellMove, GameOver };

    enum class Difficulty : uint8_t { Easy = 0, Medium = 1, Hard = 2 };

    struct Move { int row{ -1 }; int col{ -1 }; Color color{ Color::Red }; };

    // xorshift; seed 0 is remapped so the stream never collapses to zero.
    struct RNG {
        uint64_t s = 0x9E3779B97F4A7C15ULL;
        RNG() = default;
        explicit RNG(uint64_t seed) : s(seed ? seed : 0xBADC0FFEEULL) {}
        uint64_t next();
        int irange(int lo, int hi);
    };

    struct Params {
        int gridSize{ 5 };
        int numColors{ kPaletteSize };
        int lossThreshold{ 13 };   // strict majority of 25

        int actionCount() const { return gridSize * gridSize * numColors; }
    };

    // Loss threshold per difficulty; Medium matches the 5x5 strict majority.
    inline int lossThresholdFor(Difficulty d) {
        switch (d) {
        case Difficulty::Easy: return 8;
        case Difficulty::Medium: return 13;
        case Difficulty::Hard: return 18;
        }
        return 13;
    }

    // Number of trace actions pre-applied to the starting grid.
    inline int startOffsetFor(Difficulty d) {
        switch (d) {
        case Difficulty::Easy: return 3;
        case Difficulty::Medium: return 1;
        case Difficulty::Hard: return 0;
        }
        return 0;
    }

    inline std::string labelFor(Difficulty d) {
        if (d == Difficulty::Easy) return "Easy";
        if (d == Difficulty::Medium) return "Medium";
        return "Hard";
    }

    inline std::string labelFor(GameStatus s) {
        if (s == GameStatus::Solved) return "Solved";
        if (s == GameStatus::Lost) return "Lost";
        return "In progress";
    }

    inline std::string labelFor(MoveResult r) {
        switch (r) {
        case MoveResult::Accepted: return "Accepted";
        case MoveResult::OutOfBounds: return "Out of bounds";
        case MoveResult::NoOpMove: return "Cell already has that color";
        case MoveResult::LockedCellMove: return "Cell is locked";
        case MoveResult::GameOver: return "Game is over";
        }
        return "";
    }

} // namespace fl
