// ========================= src/core/State.cpp =========================
#include "State.hpp"
#include "Log.hpp"

namespace fl {

    static uint64_t rotl(uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }
    uint64_t RNG::next() { s ^= rotl(s, 7); s ^= (s >> 9); return s * 0x9E3779B97F4A7C15ULL; }
    int RNG::irange(int lo, int hi) { return lo + int(next() % uint64_t(hi - lo + 1)); }

    State::State(std::shared_ptr<const Puzzle> pz, Params params, SessionOptions o)
        :puzzle(std::move(pz)), p(params), opt(o), rng(o.seed) {
        restart();
    }

    void State::restart() {
        moveCount = 0;
        status = GameStatus::InProgress;
        locked.clear();
        history.clear();
        playerActions.clear();
        p.lossThreshold = lossThresholdFor(opt.difficulty);
        if (!puzzle) { grid = Grid(); startIndex = 0; onTrace = false; return; }

        if (opt.adjustStart) {
            Puzzle::Start s = puzzle->makeStart(opt.difficulty, p);
            grid = std::move(s.grid);
            startIndex = s.effectiveStartIndex;
            logInfo("Session", "%s start: %d trace action(s) pre-applied", labelFor(opt.difficulty).c_str(), startIndex);
        }
        else {
            grid = puzzle->start;
            startIndex = 0;
        }

        history.push_back(grid);
        refreshLocks();
        onTrace = isOnTrace(puzzle->trace, grid, traceIndex());
        logInfo("Session", "puzzle %s started: target %s, locked %d, %s", puzzle->date.c_str(),
            colorName(puzzle->target), (int)locked.size(), labelFor(status).c_str());
    }

    void State::refreshLocks() {
        Region largest = findLargestRegion(grid);
        updateLocks(largest, locked);
        status = evaluateStatus(grid, largest, puzzle->target, p.lossThreshold);
        if (status == GameStatus::Solved) locked.clear();
    }

    MoveResult State::check(const Move& m) const {
        if (isOver()) return MoveResult::GameOver;
        if (!grid.inBounds(m.row, m.col)) return MoveResult::OutOfBounds;
        if (grid.at(m.row, m.col) == m.color) return MoveResult::NoOpMove;
        if (locked.count(Coord{ m.row, m.col })) return MoveResult::LockedCellMove;
        return MoveResult::Accepted;
    }

    MoveResult State::apply(const Move& m) {
        MoveResult res = check(m);
        if (res != MoveResult::Accepted) return res;

        Grid next = grid;
        applyMove(next, m.row, m.col, m.color);
        grid = std::move(next);
        history.push_back(grid);
        playerActions.push_back(puzzle->codec(p).encodeForTrace(m.row, m.col, m.color));
        ++moveCount;

        refreshLocks();
        onTrace = isOnTrace(puzzle->trace, grid, traceIndex());

        if (status == GameStatus::Solved) logInfo("Session", "solved in %d move(s)", moveCount);
        else if (status == GameStatus::Lost) logInfo("Session", "lost after %d move(s)", moveCount);
        return res;
    }

    std::optional<Hint> State::hint() {
        if (!puzzle || isOver()) return std::nullopt;
        if (onTrace) {
            auto h = HintSolver::fromTrace(*puzzle, p, grid, traceIndex());
            if (h) return h;
            logWarn("Session", "on trace but no trace action at %d, falling back to solver", traceIndex());
        }
        HintSolver solver(p);
        auto h = solver.suggest(grid, locked, puzzle->target, rng);
        if (!h) logInfo("Session", "no hint available");
        return h;
    }

    bool State::canAutocomplete() const {
        if (!puzzle) return false;
        return fl::canAutocomplete(grid, locked, puzzle->target, status);
    }

    int State::autocomplete() {
        if (!canAutocomplete()) return 0;
        int added = 0;
        Grid next = grid;
        for (const auto& reg : unlockedRegions(grid, locked)) {
            if (reg.color == puzzle->target) continue;
            for (const auto& c : reg.cells) next.at(c.row, c.col) = puzzle->target;
            ++added;
        }
        grid = std::move(next);
        history.push_back(grid);
        moveCount += added;
        status = GameStatus::Solved;
        locked.clear();
        onTrace = false;
        logInfo("Session", "autocompleted with %d extra move(s), total %d", added, moveCount);
        return added;
    }

} // namespace fl
