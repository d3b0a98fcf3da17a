// ========================= src/core/FloodFill.hpp =========================
#pragma once
#include "Types.hpp"

namespace fl {

    struct Region {
        std::vector<Coord> cells;   // discovery order
        Color color{ Color::Red };

        int size() const { return static_cast<int>(cells.size()); }
        bool empty() const { return cells.empty(); }
        CellSet toSet() const { return CellSet(cells.begin(), cells.end()); }
    };

    // 4-connected component of `color` containing (row, col).
    // Empty when the origin is off-grid or holds another color.
    Region regionFrom(const Grid& g, int row, int col, Color color);

    // Recolors the origin's region to newColor and returns the cells changed.
    // Caller has already rejected off-grid, no-op and locked origins.
    std::vector<Coord> applyMove(Grid& g, int row, int col, Color newColor);

} // namespace fl
