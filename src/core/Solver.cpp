// ========================= src/core/Solver.cpp =========================
#include "Solver.hpp"
#include <algorithm>
#include <limits>

namespace fl {

    std::vector<int> HintSolver::validActions(const Grid& g, const CellSet& locked) const {
        std::vector<int> out;
        const int total = codec.actionCount();
        out.reserve(total);
        for (int id = 0; id < total; ++id) {
            DecodedAction a = codec.decodeLive(id);
            if (!a.valid) continue;
            if (locked.count(Coord{ a.row, a.col })) continue;
            if (g.at(a.row, a.col) == a.color) continue;
            out.push_back(id);
        }
        return out;
    }

    double HintSolver::scoreAction(const Grid& g, const CellSet& locked, Color target, int actionId) const {
        DecodedAction a = codec.decodeLive(actionId);
        if (!a.valid || !g.inBounds(a.row, a.col)) return kRejectScore;
        const Color oldColor = g.at(a.row, a.col);
        if (a.color == oldColor) return kRejectScore;
        if (locked.count(Coord{ a.row, a.col })) return kRejectScore;

        Grid scratch = g;
        Region changed = regionFrom(scratch, a.row, a.col, oldColor);
        const int oldColorSize = changed.size();

        // distinct blocks of the new color touching the recolored region
        std::vector<int> blockSizes;
        CellSet claimed;
        for (const auto& cell : changed.cells) {
            const Coord next[4] = { {cell.row + 1, cell.col}, {cell.row - 1, cell.col}, {cell.row, cell.col + 1}, {cell.row, cell.col - 1} };
            for (const auto& q : next) {
                if (!scratch.inBounds(q.row, q.col) || claimed.count(q)) continue;
                if (scratch.at(q) != a.color) continue;
                Region block = regionFrom(scratch, q.row, q.col, a.color);
                blockSizes.push_back(block.size());
                claimed.insert(block.cells.begin(), block.cells.end());
            }
        }

        int largestBlock = blockSizes.empty() ? 0 : *std::max_element(blockSizes.begin(), blockSizes.end());
        int largestInvolved = std::max(oldColorSize, largestBlock);

        for (const auto& cell : changed.cells) scratch.at(cell.row, cell.col) = a.color;
        int afterSize = regionFrom(scratch, a.row, a.col, a.color).size();

        if (afterSize >= p.lossThreshold && a.color != target) return kRejectScore;

        double score = double(afterSize - largestInvolved);
        if (blockSizes.size() >= 2) {
            double sum = 0.0;
            for (int s : blockSizes) sum += s;
            double avg = sum / double(blockSizes.size());
            score += double(blockSizes.size() - 1) * (0.1 / avg);
        }
        return score;
    }

    std::vector<int> HintSolver::bestActions(const Grid& g, const CellSet& locked, Color target, double* outScore) const {
        std::vector<int> best;
        double bestScore = -std::numeric_limits<double>::infinity();
        for (int id : validActions(g, locked)) {
            double s = scoreAction(g, locked, target, id);
            if (s > bestScore) { bestScore = s; best.assign(1, id); }
            else if (s == bestScore) best.push_back(id);
        }
        if (outScore) *outScore = bestScore;
        return best;
    }

    std::optional<Hint> HintSolver::suggest(const Grid& g, const CellSet& locked, Color target, RNG& rng) const {
        double bestScore = kRejectScore;
        auto best = bestActions(g, locked, target, &bestScore);
        // every legal move would lock a non-target color
        if (best.empty() || bestScore <= kRejectScore) return std::nullopt;

        int pick = best[rng.irange(0, (int)best.size() - 1)];
        DecodedAction a = codec.decodeLive(pick);
        if (!a.valid) return std::nullopt;

        Hint h; h.row = a.row; h.col = a.col; h.color = a.color;
        h.connected = regionFrom(g, a.row, a.col, g.at(a.row, a.col)).cells;
        return h;
    }

    std::optional<Hint> HintSolver::fromTrace(const Puzzle& pz, const Params& p, const Grid& g, int traceIndex) {
        if (traceIndex < 0 || traceIndex >= pz.trace.length()) return std::nullopt;
        DecodedAction a = pz.codec(p).decodeForTrace(pz.trace.actions[traceIndex]);
        if (!a.valid || !g.inBounds(a.row, a.col)) return std::nullopt;

        Hint h; h.row = a.row; h.col = a.col; h.color = a.color; h.fromTrace = true;
        h.connected = regionFrom(g, a.row, a.col, g.at(a.row, a.col)).cells;
        return h;
    }

} // namespace fl
