// ========================= src/core/Puzzle.cpp =========================
#include "Puzzle.hpp"
#include "FloodFill.hpp"
#include "Log.hpp"
#include <algorithm>

namespace fl {

    static bool fail(std::string* outReason, const std::string& why) {
        if (outReason) *outReason = why;
        return false;
    }

    bool Puzzle::validate(const Params& p, std::string* outReason) const {
        if (start.n != p.gridSize || (int)start.cells.size() != p.gridSize * p.gridSize)
            return fail(outReason, "starting grid is not " + std::to_string(p.gridSize) + "x" + std::to_string(p.gridSize));

        for (size_t i = 0; i < trace.snapshots.size(); ++i) {
            if (trace.snapshots[i].n != p.gridSize)
                return fail(outReason, "snapshot " + std::to_string(i) + " has the wrong size");
        }
        if (!trace.snapshots.empty() && trace.snapshots.size() != trace.actions.size() + 1)
            return fail(outReason, "trace has " + std::to_string(trace.snapshots.size()) + " snapshots for " +
                std::to_string(trace.actions.size()) + " actions");

        for (int id : trace.actions) {
            if (id < 0 || id >= p.actionCount()) return fail(outReason, "action id " + std::to_string(id) + " out of range");
        }

        if (!colorMap.empty()) {
            if ((int)colorMap.size() != p.numColors) return fail(outReason, "color map size mismatch");
            std::vector<int> sorted = colorMap;
            std::sort(sorted.begin(), sorted.end());
            for (int i = 0; i < (int)sorted.size(); ++i) {
                if (sorted[i] != i) return fail(outReason, "color map is not a permutation");
            }
        }
        return true;
    }

    Puzzle::Start Puzzle::makeStart(Difficulty d, const Params& p) const {
        Start s; s.grid = start;
        const int want = startOffsetFor(d);
        const int avail = std::min(want, trace.length());
        if (avail < want) {
            logWarn("Puzzle", "only %d trace actions for %s difficulty, applying %d", trace.length(), labelFor(d).c_str(), avail);
        }

        ActionCodec cd = codec(p);
        for (int i = 0; i < avail; ++i) {
            DecodedAction a = cd.decodeForTrace(trace.actions[i]);
            if (!a.valid) {
                logWarn("Puzzle", "trace action %d (id %d) does not decode, stopping at %d", i, trace.actions[i], s.effectiveStartIndex);
                break;
            }
            applyMove(s.grid, a.row, a.col, a.color);
            ++s.effectiveStartIndex;
        }
        return s;
    }

    Grid Puzzle::traceGridAt(int step, const Params& p) const {
        Grid g = start;
        ActionCodec cd = codec(p);
        int last = std::min(step, trace.length());
        for (int i = 0; i < last; ++i) {
            DecodedAction a = cd.decodeForTrace(trace.actions[i]);
            if (!a.valid) break;
            if (g.at(a.row, a.col) == a.color) continue;
            applyMove(g, a.row, a.col, a.color);
        }
        return g;
    }

} // namespace fl
