// ========================= src/core/Puzzle.hpp =========================
#pragma once
#include "ActionCodec.hpp"
#include "Trace.hpp"

namespace fl {

    // One daily puzzle as supplied by the data provider. Immutable once loaded.
    struct Puzzle {
        std::string date;             // e.g. 2025-03-14
        Grid start;                   // true initial board (== trace.snapshots[0])
        Color target{ Color::Red };
        SolutionTrace trace;
        std::vector<int> colorMap;    // empty = identity
        int algoScore{ -1 };          // optimal move count from the true start

        ActionCodec codec(const Params& p) const { return ActionCodec(p.gridSize, p.numColors, colorMap); }

        // Structural checks only (sizes, trace consistency, color map is a permutation).
        bool validate(const Params& p, std::string* outReason = nullptr) const;

        struct Start {
            Grid grid;
            int effectiveStartIndex{ 0 };   // trace actions already applied
        };

        // Starting board for a difficulty: Medium/Easy pre-apply 1/3 trace actions.
        Start makeStart(Difficulty d, const Params& p) const;

        // Board after `step` trace actions from the true start.
        Grid traceGridAt(int step, const Params& p) const;
    };

} // namespace fl
