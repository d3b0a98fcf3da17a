// ========================= src/io/Csv.hpp =========================
#pragma once
#include "../core/Puzzle.hpp"
#include <string>
#include <vector>

namespace fl {

    struct CsvRow {
        int index{ 0 };             // puzzle number
        std::string date;           // e.g. 2025-03-14
        int target{ 0 };            // canonical color index
        std::string colorMap;       // e.g. 2_0_1_3_5_4, empty = identity
        std::string states;         // grids joined by '/', each 01234#12340#...
        std::string actions;        // e.g. 112_87_15
        int algoScore{ -1 };
    };

    // Puzzle files exported by the data provider.
    struct CsvIO {
        static CsvRow encode(int index, const Puzzle& pz);
        static bool decode(const CsvRow& row, Puzzle& outPuzzle, std::string* outReason = nullptr);

        static std::string encodeGrid(const Grid& g);
        static bool decodeGrid(const std::string& token, Grid& out);

        static bool save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists = true);
        static std::vector<CsvRow> load(const std::string& path);
    };

} // namespace fl
