// ========================= src/core/Trace.hpp =========================
#pragma once
#include "Types.hpp"

namespace fl {

    // Precomputed optimal play. snapshots[0] is the initial board and
    // actions[i] (trace convention) turns snapshots[i] into snapshots[i+1].
    struct SolutionTrace {
        std::vector<Grid> snapshots;
        std::vector<int> actions;

        int length() const { return static_cast<int>(actions.size()); }
        bool empty() const { return snapshots.empty() && actions.empty(); }
    };

    // False once moveIndex runs past the snapshots, or on the first differing cell.
    bool isOnTrace(const SolutionTrace& trace, const Grid& g, int moveIndex);

} // namespace fl
