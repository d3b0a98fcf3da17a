// ========================= src/core/Regions.hpp =========================
#pragma once
#include "FloodFill.hpp"

namespace fl {

    // Largest region over the whole grid. Ties keep the first region found
    // in row-major scan order.
    Region findLargestRegion(const Grid& g);

    // Replaces `locked` with `largest` when it is strictly larger. Returns true if replaced.
    bool updateLocks(const Region& largest, CellSet& locked);

    // Termination rules, checked in order:
    //  1. largest >= lossThreshold and not the target color -> Lost
    //  2. one region covers the board -> Solved (target) or Lost
    //  3. otherwise InProgress
    GameStatus evaluateStatus(const Grid& g, const Region& largest, Color target, int lossThreshold);

    struct LockedRegionsInfo {
        int totalSize{ 0 };
        std::vector<int> regions;   // connected component sizes, largest first
    };

    LockedRegionsInfo lockedRegionsInfo(const CellSet& locked);

    std::optional<Color> lockedColor(const Grid& g, const CellSet& locked);

    bool canAutocomplete(const Grid& g, const CellSet& locked, Color target, GameStatus status);

    // Regions over unlocked cells only, in row-major discovery order.
    std::vector<Region> unlockedRegions(const Grid& g, const CellSet& locked);

} // namespace fl
