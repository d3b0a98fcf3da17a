// ========================= src/core/ActionCodec.cpp =========================
#include "ActionCodec.hpp"
#include <algorithm>

namespace fl {

    ActionCodec::ActionCodec(int gridSize, int numColors, std::vector<int> colorMap_)
        :n(gridSize), c(std::min(numColors, kPaletteSize)), colorMap(std::move(colorMap_)) {}

    int ActionCodec::encode(int row, int col, int colorIdx) const {
        return row * (n * c) + col * c + colorIdx;
    }

    DecodedAction ActionCodec::decodeLive(int actionId) const {
        DecodedAction a;
        if (actionId < 0 || actionId >= actionCount()) return a;
        a.row = actionId / (n * c);
        int rem = actionId % (n * c);
        a.col = rem / c;
        a.color = kCanonicalColors[rem % c];
        a.valid = a.row >= 0 && a.row < n && a.col >= 0 && a.col < n;
        return a;
    }

    int ActionCodec::canonicalSlotFor(int solverIdx) const {
        if (colorMap.empty()) return solverIdx;
        auto it = std::find(colorMap.begin(), colorMap.end(), solverIdx);
        if (it == colorMap.end()) return solverIdx;   // not in the map: direct indexing
        return static_cast<int>(it - colorMap.begin());
    }

    DecodedAction ActionCodec::decodeForTrace(int actionId) const {
        DecodedAction a;
        if (actionId < 0 || actionId >= actionCount()) return a;
        a.row = (n - 1) - actionId / (n * c);
        int rem = actionId % (n * c);
        a.col = rem / c;
        int slot = canonicalSlotFor(rem % c);
        if (slot < 0 || slot >= kPaletteSize) return a;
        a.color = kCanonicalColors[slot];
        a.valid = a.row >= 0 && a.row < n && a.col >= 0 && a.col < n;
        return a;
    }

    int ActionCodec::encodeForTrace(int row, int col, Color color) const {
        int idx = colorIndex(color);
        if (!colorMap.empty() && idx >= 0 && idx < (int)colorMap.size()) idx = colorMap[idx];
        return (n - 1 - row) * (n * c) + col * c + idx;
    }

} // namespace fl
