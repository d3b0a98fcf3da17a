// ========================= src/core/Solver.hpp =========================
#pragma once
#include "Puzzle.hpp"
#include "FloodFill.hpp"
#include <optional>

namespace fl {

    constexpr double kRejectScore = -999999.0;

    struct Hint {
        int row{ -1 };
        int col{ -1 };
        Color color{ Color::Red };
        std::vector<Coord> connected;   // cells the suggested move would recolor
        bool fromTrace{ false };
    };

    // One-ply greedy search over the live action space.
    class HintSolver {
    public:
        explicit HintSolver(Params p) :p(p), codec(p.gridSize, p.numColors) {}

        // Live action ids in encode order, minus locked cells and no-op colors.
        std::vector<int> validActions(const Grid& g, const CellSet& locked) const;

        // Net growth of the largest involved region, plus a small bonus for
        // merging several same-color blocks. kRejectScore for illegal moves and
        // for moves that would lock a non-target color.
        double scoreAction(const Grid& g, const CellSet& locked, Color target, int actionId) const;

        // All valid actions sharing the maximum score.
        std::vector<int> bestActions(const Grid& g, const CellSet& locked, Color target, double* outScore = nullptr) const;

        // Uniform pick among bestActions. nullopt when nothing is legal or
        // every legal move is rejected.
        std::optional<Hint> suggest(const Grid& g, const CellSet& locked, Color target, RNG& rng) const;

        // Next move of the solution trace, decoded with the trace convention.
        static std::optional<Hint> fromTrace(const Puzzle& pz, const Params& p, const Grid& g, int traceIndex);

    private:
        Params p;
        ActionCodec codec;
    };

} // namespace fl
