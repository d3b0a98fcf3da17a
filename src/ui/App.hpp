// ========================= src/ui/App.hpp =========================
#pragma once
#include "../core/State.hpp"
#include "../io/Csv.hpp"
#include <memory>
#include <optional>
#include <string>

namespace fl {

    class AppUI {
    public:
        AppUI();
        ~AppUI();
        AppUI(const AppUI&) = delete;              // the log sink captures this
        AppUI& operator=(const AppUI&) = delete;
        int run(); // SDL2 + ImGui main loop

    private:
        Params p; SessionOptions opt;
        std::vector<std::shared_ptr<const Puzzle>> puzzles; // loaded from CSV
        int currentIndex{ -1 };
        int viewIndexInput{ 1 };
        char loadPath[256] = "puzzles.csv";
        std::string statusMessage;

        std::unique_ptr<State> session;
        std::optional<Hint> hint;
        int paintColor{ 0 };        // canonical index used for the next click
        int playbackStep{ 0 };      // trace viewer step

        // UI helpers
        void drawTopBar();
        void drawBoard();
        void drawViewer();

        void ensureIndex(int idx);
        void startSession();
        void setStatus(const std::string& msg) { statusMessage = msg; }
    };

} // namespace fl
