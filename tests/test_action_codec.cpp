#include <iostream>
#include <cassert>
#include "core/ActionCodec.hpp"

using namespace fl;

void test_live_round_trip() {
    std::cout << "[TEST] live encode/decode covers the action space..." << std::endl;
    ActionCodec codec(5, 6);
    assert(codec.actionCount() == 150);
    int expected = 0;
    for (int r = 0; r < 5; ++r) {
        for (int c = 0; c < 5; ++c) {
            for (int k = 0; k < 6; ++k) {
                int id = codec.encode(r, c, k);
                assert(id == expected++);   // encode order == enumeration order
                DecodedAction a = codec.decodeLive(id);
                assert(a.valid && a.row == r && a.col == c && a.color == kCanonicalColors[k]);
            }
        }
    }
    std::cout << " -> PASS" << std::endl;
}

void test_trace_row_flip() {
    std::cout << "[TEST] trace ids store rows bottom-to-top..." << std::endl;
    ActionCodec codec(5, 6);
    // id 0 is the bottom-left cell in the trace convention, top-left live
    DecodedAction t = codec.decodeForTrace(0);
    assert(t.valid && t.row == 4 && t.col == 0 && t.color == Color::Red);
    DecodedAction l = codec.decodeLive(0);
    assert(l.valid && l.row == 0 && l.col == 0);

    // 149 = row 4 (flipped to 0), col 4, color 5
    DecodedAction last = codec.decodeForTrace(149);
    assert(last.row == 0 && last.col == 4 && last.color == Color::Orange);
    std::cout << " -> PASS" << std::endl;
}

void test_trace_round_trip_identity_map() {
    std::cout << "[TEST] trace encode/decode round trip without a color map..." << std::endl;
    ActionCodec codec(5, 6);
    for (int r = 0; r < 5; ++r)
        for (int c = 0; c < 5; ++c)
            for (Color col : kCanonicalColors) {
                int id = codec.encodeForTrace(r, c, col);
                assert(id == (4 - r) * 30 + c * 6 + colorIndex(col));
                DecodedAction a = codec.decodeForTrace(id);
                assert(a.valid && a.row == r && a.col == c && a.color == col);
            }
    std::cout << " -> PASS" << std::endl;
}

void test_trace_color_map() {
    std::cout << "[TEST] trace decoding searches the color map..." << std::endl;
    // canonical slot i is solver slot colorMap[i]
    std::vector<int> colorMap = { 2, 0, 1, 3, 5, 4 };
    ActionCodec codec(5, 6, colorMap);
    assert(codec.hasColorMap());

    // solver slot 0 lives at canonical slot 1 (green)
    DecodedAction a = codec.decodeForTrace(0);
    assert(a.color == Color::Green);
    // solver slot 2 -> canonical slot 0 (red)
    assert(codec.decodeForTrace(2).color == Color::Red);
    // solver slot 4 -> canonical slot 5 (orange)
    assert(codec.decodeForTrace(4).color == Color::Orange);

    for (int r = 0; r < 5; ++r)
        for (int c = 0; c < 5; ++c)
            for (Color col : kCanonicalColors) {
                DecodedAction d = codec.decodeForTrace(codec.encodeForTrace(r, c, col));
                assert(d.valid && d.row == r && d.col == c && d.color == col);
            }
    std::cout << " -> PASS" << std::endl;
}

void test_color_map_missing_slot_falls_back() {
    std::cout << "[TEST] slot missing from the color map falls back to direct indexing..." << std::endl;
    ActionCodec codec(5, 6, { 1, 2, 3, 4, 5, 1 });   // 0 never appears
    assert(codec.decodeForTrace(0).color == Color::Red);
    std::cout << " -> PASS" << std::endl;
}

void test_out_of_range_ids() {
    std::cout << "[TEST] ids outside the action space decode as invalid..." << std::endl;
    ActionCodec codec(5, 6);
    assert(!codec.decodeLive(-1).valid);
    assert(!codec.decodeLive(150).valid);
    assert(!codec.decodeForTrace(150).valid);
    assert(!codec.decodeForTrace(-7).valid);
    std::cout << " -> PASS" << std::endl;
}

int main() {
    std::cout << "=== ACTION CODEC TESTS ===" << std::endl;
    test_live_round_trip();
    test_trace_row_flip();
    test_trace_round_trip_identity_map();
    test_trace_color_map();
    test_color_map_missing_slot_falls_back();
    test_out_of_range_ids();
    std::cout << "=== ALL TESTS PASSED ===" << std::endl;
    return 0;
}
