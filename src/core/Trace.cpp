// ========================= src/core/Trace.cpp =========================
#include "Trace.hpp"

namespace fl {

    bool isOnTrace(const SolutionTrace& trace, const Grid& g, int moveIndex) {
        if (moveIndex < 0 || moveIndex >= (int)trace.snapshots.size()) return false;
        const Grid& expected = trace.snapshots[moveIndex];
        if (expected.n != g.n) return false;
        for (int r = 0; r < g.n; ++r) {
            for (int c = 0; c < g.n; ++c) {
                if (g.at(r, c) != expected.at(r, c)) return false;
            }
        }
        return true;
    }

} // namespace fl
