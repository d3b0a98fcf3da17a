#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include "io/Csv.hpp"
#include "core/Log.hpp"
#include "TestGrids.hpp"

using namespace fl;

void test_grid_codec() {
    std::cout << "[TEST] grids encode as digit rows joined by '#'..." << std::endl;
    Puzzle pz = samplePuzzle();
    std::string tok = CsvIO::encodeGrid(pz.start);
    assert(tok == "22110#21100#33104#35544#55224");

    Grid back;
    assert(CsvIO::decodeGrid(tok, back));
    assert(back == pz.start);

    assert(!CsvIO::decodeGrid("", back));
    assert(!CsvIO::decodeGrid("0123#01", back));      // ragged
    assert(!CsvIO::decodeGrid("07#10", back));        // no color 7
    assert(back == pz.start);                         // untouched on failure
    std::cout << " -> PASS" << std::endl;
}

void test_row_round_trip() {
    std::cout << "[TEST] puzzle survives encode/decode through a row..." << std::endl;
    Params p;
    Puzzle pz = samplePuzzle({ 3, 5, 0, 1, 4, 2 });
    CsvRow row = CsvIO::encode(7, pz);
    assert(row.index == 7 && row.date == "2025-03-14");
    assert(row.target == colorIndex(Color::Green));
    assert(row.colorMap == "3_5_0_1_4_2");
    assert(row.algoScore == 6);

    Puzzle back;
    std::string why;
    assert(CsvIO::decode(row, back, &why));
    assert(back.date == pz.date && back.target == pz.target);
    assert(back.start == pz.start);
    assert(back.colorMap == pz.colorMap);
    assert(back.trace.actions == pz.trace.actions);
    assert(back.trace.snapshots == pz.trace.snapshots);
    assert(back.algoScore == 6);
    assert(back.validate(p, &why));
    std::cout << " -> PASS" << std::endl;
}

void test_bad_rows_rejected() {
    std::cout << "[TEST] decode reports malformed rows..." << std::endl;
    CsvRow good = CsvIO::encode(1, samplePuzzle());
    assert(good.colorMap.empty());
    std::string why;
    Puzzle out;

    CsvRow badTarget = good; badTarget.target = 9;
    assert(!CsvIO::decode(badTarget, out, &why) && !why.empty());

    CsvRow badAction = good; badAction.actions = "12_x";
    assert(!CsvIO::decode(badAction, out, &why));

    CsvRow badGrid = good; badGrid.states = "0123#01";
    assert(!CsvIO::decode(badGrid, out, &why));

    CsvRow noStates = good; noStates.states.clear();
    assert(!CsvIO::decode(noStates, out, &why));
    std::cout << " -> PASS" << std::endl;
}

void test_save_and_load() {
    std::cout << "[TEST] save appends rows and load skips broken lines..." << std::endl;
    namespace fs = std::filesystem;
    const std::string path = (fs::temp_directory_path() / "floodlock_test_puzzles.csv").string();
    fs::remove(path);

    CsvRow first = CsvIO::encode(1, samplePuzzle());
    CsvRow second = CsvIO::encode(2, samplePuzzle({ 2, 0, 1, 3, 5, 4 }));
    assert(CsvIO::save(path, { first }, false));
    assert(CsvIO::save(path, { second }, true));
    {
        std::ofstream f(path, std::ios::app);
        f << "3,2025-03-16,1\n";                // too few fields
        f << "x,2025-03-17,1,,0,,4\n";           // non-numeric index
    }

    auto rows = CsvIO::load(path);
    assert(rows.size() == 2);
    assert(rows[0].index == 1 && rows[0].colorMap.empty());
    assert(rows[0].states == first.states && rows[0].actions == first.actions);
    assert(rows[1].index == 2 && rows[1].colorMap == "2_0_1_3_5_4");

    Puzzle pz;
    assert(CsvIO::decode(rows[1], pz));
    assert(pz.trace.actions == samplePuzzle({ 2, 0, 1, 3, 5, 4 }).trace.actions);

    fs::remove(path);
    assert(CsvIO::load(path).empty());
    std::cout << " -> PASS" << std::endl;
}

int main() {
    std::cout << "=== CSV TESTS ===" << std::endl;
    setLogQuiet(true);
    test_grid_codec();
    test_row_round_trip();
    test_bad_rows_rejected();
    test_save_and_load();
    std::cout << "=== ALL TESTS PASSED ===" << std::endl;
    return 0;
}
