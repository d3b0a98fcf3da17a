// ========================= src/core/ActionCodec.hpp =========================
#pragma once
#include "Types.hpp"

namespace fl {

    struct DecodedAction {
        int row{ -1 };
        int col{ -1 };
        Color color{ Color::Red };
        bool valid{ false };   // row/col inside the grid
    };

    // Two action-id conventions share one action space of N*N*C ids:
    //  - live:  id = row*(N*C) + col*C + colorIndex, rows top-to-bottom,
    //           colorIndex is the canonical palette index.
    //  - trace: rows are stored bottom-to-top and the color slot goes through
    //           the puzzle's color map. Only ids from a solution trace use it.
    class ActionCodec {
    public:
        ActionCodec(int gridSize, int numColors, std::vector<int> colorMap = {});

        int actionCount() const { return n * n * c; }

        int encode(int row, int col, int colorIdx) const;
        DecodedAction decodeLive(int actionId) const;

        int encodeForTrace(int row, int col, Color color) const;
        DecodedAction decodeForTrace(int actionId) const;

        bool hasColorMap() const { return !colorMap.empty(); }

    private:
        int n{ 5 };
        int c{ kPaletteSize };
        std::vector<int> colorMap;   // colorMap[canonicalSlot] = solver slot

        int canonicalSlotFor(int solverIdx) const;
    };

} // namespace fl
