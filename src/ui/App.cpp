// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include "../core/Log.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <algorithm> // for std::clamp
#include <cstdio>
#include <string>

namespace fl {

    AppUI::AppUI() {
        setLogSink([this](LogLevel lv, const std::string& line) {
            std::printf("%s\n", line.c_str());
            if (lv != LogLevel::Info) setStatus(line);
        });
    }

    AppUI::~AppUI() {
        setLogSink(nullptr);
    }

    void AppUI::ensureIndex(int idx) {
        if (idx >= 0 && idx < (int)puzzles.size()) {
            currentIndex = idx;
            viewIndexInput = idx + 1;
            playbackStep = 0;
            startSession();
        }
    }

    void AppUI::startSession() {
        hint.reset();
        if (currentIndex < 0 || currentIndex >= (int)puzzles.size()) { session.reset(); return; }
        session = std::make_unique<State>(puzzles[currentIndex], p, opt);
    }

    static bool InputIntClamped(const char* label, int* value, int minValue, int maxValue, int step = 1, int stepFast = 5) {
        if (minValue > maxValue) std::swap(minValue, maxValue);
        int before = *value;
        bool interacted = ImGui::InputInt(label, value, step, stepFast);
        if (*value < minValue) *value = minValue;
        if (*value > maxValue) *value = maxValue;

        return interacted || *value != before;
    }

    static ImU32 colorFor(Color c) {
        static const ImU32 table[kPaletteSize] = {
            IM_COL32(235, 78, 62, 255),   // red
            IM_COL32(101, 196, 102, 255), // green
            IM_COL32(52, 120, 247, 255),  // blue
            IM_COL32(247, 206, 69, 255),  // yellow
            IM_COL32(163, 7, 215, 255),   // purple
            IM_COL32(241, 154, 56, 255),  // orange
        };
        return table[colorIndex(c)];
    }

    void AppUI::drawTopBar() {
        ImGui::Begin("Controls");

        ImGui::InputText("Load CSV", loadPath, sizeof(loadPath));
        if (ImGui::Button("Load")) {
            puzzles.clear(); currentIndex = -1; viewIndexInput = 1; session.reset(); hint.reset();
            int skipped = 0;
            for (const auto& r : CsvIO::load(loadPath)) {
                Puzzle pz; std::string why;
                if (!CsvIO::decode(r, pz, &why) || !pz.validate(p, &why)) {
                    logWarn("Csv", "puzzle %d skipped: %s", r.index, why.c_str());
                    ++skipped;
                    continue;
                }
                puzzles.push_back(std::make_shared<const Puzzle>(std::move(pz)));
            }
            if (!puzzles.empty()) ensureIndex(0);
            if (skipped == 0) setStatus("Loaded " + std::to_string(puzzles.size()) + " puzzle(s).");
        }

        ImGui::Separator();
        ImGui::Text("Session");
        int diff = (int)opt.difficulty;
        if (ImGui::RadioButton("Easy", diff == 0)) diff = 0; ImGui::SameLine();
        if (ImGui::RadioButton("Medium", diff == 1)) diff = 1; ImGui::SameLine();
        if (ImGui::RadioButton("Hard", diff == 2)) diff = 2;
        bool changed = diff != (int)opt.difficulty;
        opt.difficulty = (Difficulty)diff;
        changed |= ImGui::Checkbox("Pre-apply trace moves for difficulty", &opt.adjustStart);
        ImGui::Text("Loss threshold: %d", lossThresholdFor(opt.difficulty));
        uint64_t seedValue = opt.seed;
        if (ImGui::InputScalar("Hint seed", ImGuiDataType_U64, &seedValue)) {
            opt.seed = seedValue;
        }
        if (changed) startSession();

        bool hasSession = session != nullptr;
        if (!hasSession) ImGui::BeginDisabled();
        if (ImGui::Button("Restart")) { startSession(); setStatus(""); }
        ImGui::SameLine();
        bool over = hasSession && session->isOver();
        if (over) ImGui::BeginDisabled();
        if (ImGui::Button("Hint")) {
            hint = session->hint();
            if (!hint) setStatus("No hint available.");
            else setStatus(std::string("Hint (") + (hint->fromTrace ? "trace" : "solver") + "): (" +
                std::to_string(hint->row + 1) + "," + std::to_string(hint->col + 1) + ") -> " + colorName(hint->color));
        }
        if (over) ImGui::EndDisabled();
        ImGui::SameLine();
        bool canAuto = hasSession && session->canAutocomplete();
        if (!canAuto) ImGui::BeginDisabled();
        if (ImGui::Button("Autocomplete")) {
            int extra = session->autocomplete();
            hint.reset();
            setStatus("Autocomplete added " + std::to_string(extra) + " move(s).");
        }
        if (!canAuto) ImGui::EndDisabled();
        if (!hasSession) ImGui::EndDisabled();

        if (!statusMessage.empty()) {
            ImGui::TextColored(ImVec4(0.9f, 0.6f, 0.5f, 1.0f), "%s", statusMessage.c_str());
        }

        ImGui::Separator();
        ImGui::Text("Puzzle by index");
        bool hasPuzzles = !puzzles.empty();
        int maxIndex = hasPuzzles ? (int)puzzles.size() : 1;
        viewIndexInput = std::clamp(viewIndexInput, 1, maxIndex);
        int inputValue = viewIndexInput;
        if (!hasPuzzles) ImGui::BeginDisabled();
        if (InputIntClamped("Puzzle #", &inputValue, 1, maxIndex)) {
            viewIndexInput = inputValue;
            if (hasPuzzles) ensureIndex(viewIndexInput - 1);
        }
        if (!hasPuzzles) ImGui::EndDisabled();

        ImGui::End();
    }

    void AppUI::drawBoard() {
        ImGui::Begin("Board");
        if (!session) { ImGui::Text("No puzzle loaded"); ImGui::End(); return; }
        State& s = *session;
        const Puzzle& pz = *s.puzzle;

        ImGui::Text("%s  target=%s  optimal=%d", pz.date.c_str(), colorName(pz.target), pz.algoScore);
        ImGui::Text("Moves=%d  Status=%s  %s", s.moveCount, labelFor(s.status).c_str(), s.onTrace ? "(on trace)" : "(off trace)");
        auto info = lockedRegionsInfo(s.locked);
        auto lc = lockedColor(s.grid, s.locked);
        ImGui::Text("Locked=%d (%s)", info.totalSize, lc ? colorName(*lc) : "-");

        ImGui::Separator();
        for (int i = 0; i < p.numColors && i < kPaletteSize; ++i) {
            Color c = kCanonicalColors[i];
            ImVec4 v = ImGui::ColorConvertU32ToFloat4(colorFor(c));
            ImGui::PushID(i);
            if (ImGui::ColorButton(colorName(c), v, ImGuiColorEditFlags_NoTooltip, ImVec2(28, 28))) paintColor = i;
            ImGui::PopID();
            if (i + 1 < p.numColors) ImGui::SameLine();
        }
        ImGui::Text("Paint: %s", colorName(kCanonicalColors[paintColor]));

        const float cell = 56.0f; const float gap = 4.0f;
        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();
        CellSet hinted;
        if (hint) hinted.insert(hint->connected.begin(), hint->connected.end());

        for (int r = 0; r < s.grid.n; ++r) {
            for (int c = 0; c < s.grid.n; ++c) {
                ImVec2 a(origin.x + c * (cell + gap), origin.y + r * (cell + gap));
                ImVec2 b(a.x + cell, a.y + cell);
                dl->AddRectFilled(a, b, colorFor(s.grid.at(r, c)), 4.0f);
                if (s.locked.count(Coord{ r, c })) dl->AddRect(a, b, IM_COL32(255, 255, 255, 255), 4.0f, 0, 3.0f);
                if (hinted.count(Coord{ r, c })) dl->AddRect(ImVec2(a.x + 4, a.y + 4), ImVec2(b.x - 4, b.y - 4), IM_COL32(20, 20, 20, 255), 2.0f, 0, 2.0f);
                if (hint && hint->row == r && hint->col == c) dl->AddCircleFilled(ImVec2(a.x + cell * 0.5f, a.y + cell * 0.5f), 8.0f, colorFor(hint->color));

                ImGui::SetCursorScreenPos(a);
                ImGui::PushID(r * s.grid.n + c);
                if (ImGui::InvisibleButton("cell", ImVec2(cell, cell))) {
                    MoveResult res = s.apply(Move{ r, c, kCanonicalColors[paintColor] });
                    if (res == MoveResult::Accepted) { hint.reset(); setStatus(""); }
                    else setStatus(labelFor(res));
                }
                ImGui::PopID();
            }
        }
        ImGui::SetCursorScreenPos(ImVec2(origin.x, origin.y + s.grid.n * (cell + gap)));
        ImGui::Dummy(ImVec2(1, 1));
        ImGui::End();
    }

    void AppUI::drawViewer() {
        ImGui::Begin("Solution trace");
        if (currentIndex < 0 || currentIndex >= (int)puzzles.size()) { ImGui::Text("No puzzle selected"); ImGui::End(); return; }
        const Puzzle& pz = *puzzles[currentIndex];
        const auto& actions = pz.trace.actions;
        int maxStep = (int)actions.size();
        playbackStep = std::clamp(playbackStep, 0, maxStep);
        if (actions.empty()) {
            ImGui::TextDisabled("No solution trace recorded.");
            ImGui::End();
            return;
        }

        ImGui::Text("Trace step: %d / %d", playbackStep, maxStep);
        bool canPrev = playbackStep > 0;
        bool canNext = playbackStep < maxStep;
        if (!canPrev) ImGui::BeginDisabled();
        if (ImGui::Button("Prev")) { --playbackStep; }
        if (!canPrev) ImGui::EndDisabled();
        ImGui::SameLine();
        if (!canNext) ImGui::BeginDisabled();
        if (ImGui::Button("Next")) { ++playbackStep; }
        if (!canNext) ImGui::EndDisabled();
        ImGui::SameLine();
        if (ImGui::Button("Reset")) { playbackStep = 0; }
        int stepInput = playbackStep;
        if (InputIntClamped("Step", &stepInput, 0, maxStep)) {
            playbackStep = stepInput;
        }
        if (playbackStep > 0) {
            DecodedAction a = pz.codec(p).decodeForTrace(actions[playbackStep - 1]);
            ImGui::Text("Move %d: (%d,%d) -> %s  [id %d]", playbackStep, a.row + 1, a.col + 1, colorName(a.color), actions[playbackStep - 1]);
        }

        Grid g = pz.traceGridAt(playbackStep, p);
        bool matches = isOnTrace(pz.trace, g, playbackStep);
        if (!matches) ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Replayed board differs from snapshot %d", playbackStep);

        const float cell = 22.0f;
        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();
        for (int r = 0; r < g.n; ++r) {
            for (int c = 0; c < g.n; ++c) {
                ImVec2 a(origin.x + c * (cell + 2), origin.y + r * (cell + 2));
                dl->AddRectFilled(a, ImVec2(a.x + cell, a.y + cell), colorFor(g.at(r, c)), 2.0f);
            }
        }
        ImGui::Dummy(ImVec2(g.n * (cell + 2), g.n * (cell + 2)));
        ImGui::End();
    }

    int AppUI::run() {
        // SDL2 init
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            logError("SDL", "init failed: %s", SDL_GetError());
            return 1;
        }
        SDL_Window* window = SDL_CreateWindow("FloodLock Puzzle Tool", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1200, 800, SDL_WINDOW_SHOWN);
        SDL_Renderer* renderer = window ? SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC) : nullptr;
        if (!renderer) {
            logError("SDL", "window/renderer creation failed: %s", SDL_GetError());
            if (window) SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::StyleColorsDark();

        ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
        ImGui_ImplSDLRenderer2_Init(renderer);

        bool running = true; SDL_Event e;
        while (running) {
            while (SDL_PollEvent(&e)) {
                ImGui_ImplSDL2_ProcessEvent(&e);
                if (e.type == SDL_QUIT) running = false;
            }
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            drawTopBar();
            drawBoard();
            drawViewer();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace fl
