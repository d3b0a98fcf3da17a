// ========================= src/core/FloodFill.cpp =========================
#include "FloodFill.hpp"

namespace fl {

    static constexpr int kDr[4] = { 1, -1, 0, 0 };
    static constexpr int kDc[4] = { 0, 0, 1, -1 };

    Region regionFrom(const Grid& g, int row, int col, Color color) {
        Region out; out.color = color;
        if (!g.inBounds(row, col) || g.at(row, col) != color) return out;

        std::vector<char> seen(size_t(g.area()), 0);
        std::vector<Coord> stack;
        stack.push_back(Coord{ row, col });
        seen[size_t(row) * g.n + col] = 1;

        while (!stack.empty()) {
            Coord p = stack.back(); stack.pop_back();
            out.cells.push_back(p);
            for (int k = 0; k < 4; ++k) {
                int nr = p.row + kDr[k], nc = p.col + kDc[k];
                if (!g.inBounds(nr, nc)) continue;
                char& s = seen[size_t(nr) * g.n + nc];
                if (s || g.at(nr, nc) != color) continue;
                s = 1;
                stack.push_back(Coord{ nr, nc });
            }
        }
        return out;
    }

    std::vector<Coord> applyMove(Grid& g, int row, int col, Color newColor) {
        if (!g.inBounds(row, col)) return {};
        Region r = regionFrom(g, row, col, g.at(row, col));
        for (const auto& p : r.cells) g.at(p.row, p.col) = newColor;
        return std::move(r.cells);
    }

} // namespace fl
