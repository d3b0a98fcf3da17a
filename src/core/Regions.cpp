// ========================= src/core/Regions.cpp =========================
#include "Regions.hpp"
#include <algorithm>

namespace fl {

    Region findLargestRegion(const Grid& g) {
        Region best;
        std::vector<char> visited(size_t(g.area()), 0);
        for (int r = 0; r < g.n; ++r) {
            for (int c = 0; c < g.n; ++c) {
                if (visited[size_t(r) * g.n + c]) continue;
                Region cur = regionFrom(g, r, c, g.at(r, c));
                for (const auto& p : cur.cells) visited[size_t(p.row) * g.n + p.col] = 1;
                if (cur.size() > best.size()) best = std::move(cur);
            }
        }
        return best;
    }

    bool updateLocks(const Region& largest, CellSet& locked) {
        // a tie keeps the current lock: locked cells stay fixed
        if (largest.size() <= (int)locked.size()) return false;
        locked = largest.toSet();
        return true;
    }

    GameStatus evaluateStatus(const Grid& g, const Region& largest, Color target, int lossThreshold) {
        if (largest.size() >= lossThreshold && largest.color != target) return GameStatus::Lost;
        if (largest.size() == g.area()) {
            return largest.color == target ? GameStatus::Solved : GameStatus::Lost;
        }
        return GameStatus::InProgress;
    }

    LockedRegionsInfo lockedRegionsInfo(const CellSet& locked) {
        LockedRegionsInfo info;
        info.totalSize = static_cast<int>(locked.size());
        CellSet seen;
        for (const auto& start : locked) {
            if (seen.count(start)) continue;
            int size = 0;
            std::vector<Coord> stack{ start };
            seen.insert(start);
            while (!stack.empty()) {
                Coord p = stack.back(); stack.pop_back();
                ++size;
                const Coord next[4] = { {p.row + 1, p.col}, {p.row - 1, p.col}, {p.row, p.col + 1}, {p.row, p.col - 1} };
                for (const auto& q : next) {
                    if (!locked.count(q) || seen.count(q)) continue;
                    seen.insert(q);
                    stack.push_back(q);
                }
            }
            info.regions.push_back(size);
        }
        std::sort(info.regions.begin(), info.regions.end(), [](int a, int b) { return a > b; });
        return info;
    }

    std::optional<Color> lockedColor(const Grid& g, const CellSet& locked) {
        if (locked.empty()) return std::nullopt;
        const Coord& p = *locked.begin();
        if (!g.inBounds(p.row, p.col)) return std::nullopt;
        return g.at(p);
    }

    bool canAutocomplete(const Grid& g, const CellSet& locked, Color target, GameStatus status) {
        if (status != GameStatus::InProgress) return false;
        if ((int)locked.size() < g.area() - 3) return false;
        auto lc = lockedColor(g, locked);
        return lc && *lc == target;
    }

    std::vector<Region> unlockedRegions(const Grid& g, const CellSet& locked) {
        std::vector<Region> out;
        std::vector<char> visited(size_t(g.area()), 0);
        for (const auto& p : locked) {
            if (g.inBounds(p.row, p.col)) visited[size_t(p.row) * g.n + p.col] = 1;
        }
        // locked cells are pre-marked, so traversal never crosses them
        for (int r = 0; r < g.n; ++r) {
            for (int c = 0; c < g.n; ++c) {
                if (visited[size_t(r) * g.n + c]) continue;
                Region reg; reg.color = g.at(r, c);
                std::vector<Coord> stack{ Coord{ r, c } };
                visited[size_t(r) * g.n + c] = 1;
                while (!stack.empty()) {
                    Coord p = stack.back(); stack.pop_back();
                    reg.cells.push_back(p);
                    const Coord next[4] = { {p.row + 1, p.col}, {p.row - 1, p.col}, {p.row, p.col + 1}, {p.row, p.col - 1} };
                    for (const auto& q : next) {
                        if (!g.inBounds(q.row, q.col)) continue;
                        char& v = visited[size_t(q.row) * g.n + q.col];
                        if (v || g.at(q) != reg.color) continue;
                        v = 1;
                        stack.push_back(q);
                    }
                }
                out.push_back(std::move(reg));
            }
        }
        return out;
    }

} // namespace fl
