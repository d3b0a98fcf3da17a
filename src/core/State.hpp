// ========================= src/core/State.hpp =========================
#pragma once
#include "Solver.hpp"
#include "Regions.hpp"
#include <memory>

namespace fl {

    struct SessionOptions {
        Difficulty difficulty{ Difficulty::Medium };   // also sets Params::lossThreshold
        bool adjustStart{ false };   // pre-apply trace actions for Easy/Medium
        uint64_t seed{ 0xA17C3B5ECAFEBEEFULL };
    };

    // Live state of one play-through. Owns the grid and locks; the puzzle is
    // shared read-only.
    struct State {
        std::shared_ptr<const Puzzle> puzzle;
        Params p;
        SessionOptions opt;

        Grid grid;
        CellSet locked;
        int moveCount{ 0 };
        GameStatus status{ GameStatus::InProgress };

        int startIndex{ 0 };         // trace actions pre-applied by difficulty
        bool onTrace{ false };       // last path-tracker verdict
        std::vector<Grid> history;   // history[0] = start, one entry per accepted move
        std::vector<int> playerActions;   // accepted moves, trace convention

        State() = default;
        State(std::shared_ptr<const Puzzle> pz, Params params, SessionOptions o = {});

        // Resets to the starting board and re-derives the loss threshold, locks and status.
        void restart();

        MoveResult check(const Move& m) const;
        MoveResult apply(const Move& m);

        std::optional<Hint> hint();

        bool canAutocomplete() const;
        // Recolors every unlocked non-target region; one move per region.
        int autocomplete();

        int traceIndex() const { return startIndex + moveCount; }
        bool isOver() const { return status != GameStatus::InProgress; }

    private:
        RNG rng;
        void refreshLocks();   // lock update + termination rules
    };

} // namespace fl
