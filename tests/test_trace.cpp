#include <iostream>
#include <cassert>
#include <string>
#include "core/Trace.hpp"
#include "core/Log.hpp"
#include "TestGrids.hpp"

using namespace fl;

void test_on_trace_snapshots() {
    std::cout << "[TEST] isOnTrace compares against the snapshot at the move index..." << std::endl;
    Puzzle pz = samplePuzzle();
    assert(pz.trace.snapshots.size() == 7);

    for (int i = 0; i < 7; ++i) assert(isOnTrace(pz.trace, pz.trace.snapshots[i], i));
    assert(!isOnTrace(pz.trace, pz.trace.snapshots[2], 1));

    Grid off = pz.trace.snapshots[1];
    off.at(4, 4) = Color::Orange;   // one cell differs
    assert(!isOnTrace(pz.trace, off, 1));
    std::cout << " -> PASS" << std::endl;
}

void test_exhausted_trace_is_off_trace() {
    std::cout << "[TEST] move index past the trace degrades to false..." << std::endl;
    Puzzle pz = samplePuzzle();
    assert(!isOnTrace(pz.trace, pz.trace.snapshots.back(), 7));
    assert(!isOnTrace(pz.trace, pz.start, 100));
    assert(!isOnTrace(SolutionTrace{}, pz.start, 0));
    std::cout << " -> PASS" << std::endl;
}

void test_validate() {
    std::cout << "[TEST] Puzzle::validate rejects malformed definitions..." << std::endl;
    Params p;
    std::string why;
    Puzzle ok = samplePuzzle();
    assert(ok.validate(p, &why));

    Puzzle badAction = ok;
    badAction.trace.actions[0] = 150;
    assert(!badAction.validate(p, &why));
    assert(why.find("150") != std::string::npos);

    Puzzle badCount = ok;
    badCount.trace.snapshots.pop_back();
    assert(!badCount.validate(p, &why));

    Puzzle badMap = ok;
    badMap.colorMap = { 0, 0, 1, 2, 3, 4 };
    assert(!badMap.validate(p, &why));

    Puzzle badSize = ok;
    badSize.start = Grid(4, Color::Red);
    assert(!badSize.validate(p, &why));
    std::cout << " -> PASS" << std::endl;
}

void test_make_start_by_difficulty() {
    std::cout << "[TEST] makeStart pre-applies trace actions per difficulty..." << std::endl;
    Params p;
    Puzzle pz = samplePuzzle();

    Puzzle::Start hard = pz.makeStart(Difficulty::Hard, p);
    assert(hard.effectiveStartIndex == 0 && hard.grid == pz.trace.snapshots[0]);

    Puzzle::Start medium = pz.makeStart(Difficulty::Medium, p);
    assert(medium.effectiveStartIndex == 1 && medium.grid == pz.trace.snapshots[1]);

    Puzzle::Start easy = pz.makeStart(Difficulty::Easy, p);
    assert(easy.effectiveStartIndex == 3 && easy.grid == pz.trace.snapshots[3]);

    // short trace: Easy applies what exists
    Puzzle shortPz = tracePuzzle(pz.start, Color::Green, { { 0, 0, Color::Green } });
    Puzzle::Start s = shortPz.makeStart(Difficulty::Easy, p);
    assert(s.effectiveStartIndex == 1 && s.grid == shortPz.trace.snapshots[1]);
    std::cout << " -> PASS" << std::endl;
}

void test_color_mapped_trace_replays() {
    std::cout << "[TEST] color-mapped trace replays to its snapshots..." << std::endl;
    Params p;
    Puzzle pz = samplePuzzle({ 3, 5, 0, 1, 4, 2 });
    assert(pz.validate(p));
    for (int step = 0; step <= pz.trace.length(); ++step) {
        assert(pz.traceGridAt(step, p) == pz.trace.snapshots[step]);
    }
    // raw ids differ from the identity-mapped trace
    assert(pz.trace.actions[0] != samplePuzzle().trace.actions[0]);
    std::cout << " -> PASS" << std::endl;
}

int main() {
    std::cout << "=== TRACE TESTS ===" << std::endl;
    setLogQuiet(true);
    test_on_trace_snapshots();
    test_exhausted_trace_is_off_trace();
    test_validate();
    test_make_start_by_difficulty();
    test_color_mapped_trace_replays();
    std::cout << "=== ALL TESTS PASSED ===" << std::endl;
    return 0;
}
