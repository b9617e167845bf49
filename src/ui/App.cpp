// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include "../core/Replay.hpp"
#include "../util/Log.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <algorithm> // for std::clamp
#include <cstdint>
#include <cstdio>
#include <string>

namespace wss {

    AppUI::AppUI() :p{ 7,4 }, opt{} {
        opt.numColors = 5;
        opt.solve.maxStates = 200000;
    }

    AppUI::~AppUI() {
        joinWorker();
    }

    void AppUI::joinWorker() {
        if (worker.joinable()) worker.join();
    }

    void AppUI::setStatus(const std::string& msg) {
        std::lock_guard<std::mutex> lock(statusMutex);
        statusMessage = msg;
    }

    std::string AppUI::getStatus() {
        std::lock_guard<std::mutex> lock(statusMutex);
        return statusMessage;
    }

    void AppUI::ensureIndex(int idx) {
        if (idx >= 0 && idx < (int)entries.size()) {
            currentIndex = idx;
            viewIndexInput = idx + 1;
            playbackStep = 0;
        }
    }

    void AppUI::collectPending() {
        if (!busy.load() && worker.joinable()) {
            worker.join();
            jobTotal = 0;
            jobCompleted.store(0);
        }

        std::vector<Entry> newly;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            if (!pendingGenerated.empty()) newly.swap(pendingGenerated);
            if (pendingSolveReady) {
                pendingSolveReady = false;
                // drop the result if the puzzle was edited or the pour policy switched while solving
                if (pendingSolveIndex >= 0 && pendingSolveIndex < (int)entries.size() &&
                    entries[pendingSolveIndex].state == pendingSolveState &&
                    pendingSolveResult.pour == solveOpt.pour) {
                    entries[pendingSolveIndex].result = std::move(pendingSolveResult);
                    entries[pendingSolveIndex].hasResult = true;
                    if (pendingSolveIndex == currentIndex) playbackStep = 0;
                }
                pendingSolveIndex = -1;
            }
        }

        if (!newly.empty()) {
            bool hadAny = !entries.empty();
            for (auto& g : newly) {
                if (g.result.pour != solveOpt.pour) g.hasResult = false;
                entries.push_back(std::move(g));
            }
            if (currentIndex < 0 || !hadAny) ensureIndex(0);
        }
    }

    static bool InputIntClamped(const char* label, int* value, int minValue, int maxValue, int step = 1, int stepFast = 5) {
        if (minValue > maxValue) std::swap(minValue, maxValue);
        int before = *value;
        bool interacted = ImGui::InputInt(label, value, step, stepFast);
        if (*value < minValue) *value = minValue;
        if (*value > maxValue) *value = maxValue;

        return interacted || *value != before;
    }

    void AppUI::startGenerate() {
        Params pCopy = p;
        GenOptions optCopy = opt;
        optCopy.solve.mode = solveOpt.mode;
        optCopy.solve.pour = solveOpt.pour;
        int count = NtoGenerate;

        std::string why;
        if (!Generator(pCopy, optCopy).checkParams(&why)) {
            setStatus(why);
            return;
        }
        setStatus("");
        joinWorker();
        jobTotal = count;
        jobCompleted.store(0);
        busy.store(true);

        worker = std::thread([this, pCopy, optCopy, count]() {
            Generator localGen(pCopy, optCopy);
            const Palette palette = Palette::numbered(optCopy.numColors);
            std::vector<Entry> local;
            int failed = 0;
            for (int i = 0; i < count; ++i) {
                auto g = localGen.makeOne();
                if (g) {
                    Entry e;
                    e.state = std::move(g->state);
                    e.palette = palette;
                    e.result = std::move(g->result);
                    e.hasResult = optCopy.validate;
                    local.push_back(std::move(e));
                }
                else ++failed;
                jobCompleted.fetch_add(1);
            }
            {
                std::lock_guard<std::mutex> lock(pendingMutex);
                for (auto& item : local) pendingGenerated.push_back(std::move(item));
            }
            if (failed > 0) setStatus(std::to_string(failed) + " deal(s) found no solvable puzzle within budget.");
            else setStatus("Generated " + std::to_string(local.size()) + " puzzle(s).");
            busy.store(false);
        });
    }

    void AppUI::startSolve() {
        if (currentIndex < 0 || currentIndex >= (int)entries.size()) return;
        State start = entries[currentIndex].state;
        int index = currentIndex;
        SolveOptions optCopy = solveOpt;

        joinWorker();
        jobTotal = 1;
        jobCompleted.store(0);
        busy.store(true);
        setStatus("Solving...");

        worker = std::thread([this, start, index, optCopy]() {
            Solver solver(optCopy);
            SolveResult res = solver.solve(start);
            std::string msg = std::string("Result: ") + toString(res.outcome);
            if (res.solved()) msg += " in " + std::to_string(res.moves.size()) + " moves";
            if (!res.message.empty()) msg += " (" + res.message + ")";
            log::info("puzzle {}: {} ({} states, {:.1f} ms)", index + 1, msg, res.statesVisited, res.elapsedMs);
            {
                std::lock_guard<std::mutex> lock(pendingMutex);
                pendingSolveIndex = index;
                pendingSolveState = start;
                pendingSolveResult = std::move(res);
                pendingSolveReady = true;
            }
            setStatus(msg);
            jobCompleted.fetch_add(1);
            busy.store(false);
        });
    }

    void AppUI::loadCsv() {
        std::vector<CsvRow> rows;
        std::vector<std::string> skipped;
        std::string err;
        if (!CsvIO::load(loadPath, rows, &skipped, &err)) {
            setStatus(err);
            return;
        }
        entries.clear(); currentIndex = -1; viewIndexInput = 1;
        int rejected = (int)skipped.size();
        for (const auto& r : rows) {
            PuzzleInput in;
            Entry e;
            if (!CsvIO::decode(r, in, &err) || !buildState(in, e.palette, e.state, &err)) {
                log::warn("{}: puzzle {} rejected: {}", loadPath, r.index, err);
                ++rejected;
                continue;
            }
            std::vector<Move> moves;
            if (r.Outcome == "solved" && CsvIO::decodeMoves(r.Solution, moves)) {
                ReplayResult rr = replay(e.state, moves, solveOpt.pour);
                if (rr.ok && rr.last().isSolved()) {
                    e.result.outcome = SolveOutcome::Solved;
                    e.result.pour = solveOpt.pour;
                    e.result.moves = rr.applied;
                    e.hasResult = true;
                }
            }
            entries.push_back(std::move(e));
        }
        if (!entries.empty()) ensureIndex(0);
        setStatus("Loaded " + std::to_string(entries.size()) + " puzzle(s)" +
            (rejected ? ", rejected " + std::to_string(rejected) : std::string()) + ".");
    }

    void AppUI::saveCsv() {
        // continue indices from an existing file
        std::vector<CsvRow> existing;
        int startIdx = 0;
        if (CsvIO::load(savePath, existing) && !existing.empty()) startIdx = existing.back().index + 1;
        std::vector<CsvRow> rows;
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& e = entries[i];
            rows.push_back(CsvIO::encode(startIdx + (int)i, e.state, e.palette, e.hasResult ? &e.result : nullptr));
        }
        std::string err;
        if (!CsvIO::save(savePath, rows, true, &err)) setStatus(err);
        else setStatus("Saved " + std::to_string(rows.size()) + " puzzle(s) to " + savePath);
    }

    void AppUI::drawTopBar() {
        collectPending();

        ImGui::Begin("Controls");
        ImGui::Text("Params");
        InputIntClamped("Colors", &opt.numColors, 1, 18);
        InputIntClamped("Tubes", &p.numTubes, 2, 30);
        InputIntClamped("Capacity", &p.capacity, 1, 50);
        ImGui::Separator();

        ImGui::Text("Solver");
        int mode = (int)solveOpt.mode;
        if (ImGui::RadioButton("BFS (shortest)", mode == 0)) mode = 0; ImGui::SameLine();
        if (ImGui::RadioButton("A* (heuristic)", mode == 1)) mode = 1;
        solveOpt.mode = (SearchMode)mode;
        int pour = (int)solveOpt.pour;
        if (ImGui::RadioButton("Pour all-or-nothing", pour == 0)) pour = 0; ImGui::SameLine();
        if (ImGui::RadioButton("Pour partial", pour == 1)) pour = 1;
        if ((PourPolicy)pour != solveOpt.pour) {
            // recorded solutions belong to the old policy
            solveOpt.pour = (PourPolicy)pour;
            for (auto& e : entries) e.hasResult = false;
            playbackStep = 0;
        }
        int maxStates = (int)std::min<int64_t>(solveOpt.maxStates, 100000000);
        if (InputIntClamped("Max states", &maxStates, 0, 100000000, 1000, 100000)) solveOpt.maxStates = maxStates;
        InputIntClamped("Time budget ms (0 = none)", &solveOpt.timeBudgetMs, 0, 600000, 100, 1000);

        ImGui::Separator();
        ImGui::Text("Generator");
        InputIntClamped("Reserved empty tubes", &opt.reservedEmpty, 0, std::max(0, p.numTubes - 1));
        InputIntClamped("Max same-color run", &opt.maxRunPerTube, 0, p.capacity);
        InputIntClamped("Count (N)", &NtoGenerate, 1, 50);
        ImGui::Checkbox("Keep only solvable deals", &opt.validate);
        uint64_t seedValue = opt.seed;
        if (ImGui::InputScalar("Generator seed", ImGuiDataType_U64, &seedValue)) {
            opt.seed = seedValue;
        }
        int validateStates = (int)std::min<int64_t>(opt.solve.maxStates, 100000000);
        if (InputIntClamped("Validation max states", &validateStates, 1000, 100000000, 1000, 100000)) opt.solve.maxStates = validateStates;

        bool currentlyBusy = busy.load();
        if (currentlyBusy) ImGui::BeginDisabled();
        if (ImGui::Button("Generate N")) startGenerate();
        ImGui::SameLine();
        if (ImGui::Button("New empty puzzle")) {
            Entry e;
            e.state.p = p;
            e.state.T.resize(p.numTubes);
            e.palette = Palette::numbered(opt.numColors);
            entries.push_back(std::move(e));
            ensureIndex((int)entries.size() - 1);
        }
        bool hasCurrent = currentIndex >= 0 && currentIndex < (int)entries.size();
        if (!hasCurrent) ImGui::BeginDisabled();
        if (ImGui::Button("Solve current")) startSolve();
        if (!hasCurrent) ImGui::EndDisabled();
        if (currentlyBusy) ImGui::EndDisabled();

        if (busy.load()) {
            ImGui::SameLine();
            int total = std::max(1, jobTotal);
            int done = std::min(jobCompleted.load(), total);
            ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Working... %d/%d", done, total);
        }

        std::string status = getStatus();
        if (!status.empty()) {
            ImGui::TextColored(ImVec4(0.9f, 0.6f, 0.5f, 1.0f), "%s", status.c_str());
        }

        if (currentlyBusy) ImGui::BeginDisabled();
        if (ImGui::Button("Clear Memory")) {
            entries.clear();
            currentIndex = -1;
            viewIndexInput = 1;
            playbackStep = 0;
        }

        ImGui::Separator();
        char pathBuf[256];
        std::snprintf(pathBuf, sizeof(pathBuf), "%s", savePath.c_str());
        if (ImGui::InputText("Save CSV", pathBuf, sizeof(pathBuf))) savePath = pathBuf;
        if (ImGui::Button("Save")) saveCsv();

        std::snprintf(pathBuf, sizeof(pathBuf), "%s", loadPath.c_str());
        if (ImGui::InputText("Load CSV", pathBuf, sizeof(pathBuf))) loadPath = pathBuf;
        if (ImGui::Button("Load")) loadCsv();
        if (currentlyBusy) ImGui::EndDisabled();

        ImGui::Separator();
        ImGui::Text("View by index");
        bool hasMaps = !entries.empty();
        int maxIndex = hasMaps ? (int)entries.size() : 1;
        viewIndexInput = std::clamp(viewIndexInput, 1, maxIndex);
        int inputValue = viewIndexInput;
        if (!hasMaps) ImGui::BeginDisabled();
        if (InputIntClamped("Puzzle #", &inputValue, 1, maxIndex)) {
            viewIndexInput = inputValue;
            if (hasMaps) ensureIndex(viewIndexInput - 1);
        }
        if (!hasMaps) ImGui::EndDisabled();

        ImGui::End();
    }

    static ImU32 colorFor(Color c) {
        static ImU32 table[21] = {
            IM_COL32(40,40,40,255),
            IM_COL32(230, 80, 80,255), IM_COL32(80,180,250,255), IM_COL32(90,200,120,255), IM_COL32(240,210,70,255),
            IM_COL32(200,120,240,255), IM_COL32(255,160,120,255), IM_COL32(120,120,240,255), IM_COL32(90,160,160,255), IM_COL32(250,130,180,255),
            IM_COL32(150,100,80,255), IM_COL32(100,150,100,255), IM_COL32(80,160,200,255), IM_COL32(200,80,200,255), IM_COL32(100,100,220,255),
            IM_COL32(220,120,60,255), IM_COL32(160,220,60,255), IM_COL32(60,220,160,255), IM_COL32(60,160,220,255), IM_COL32(200,200,200,255),
            IM_COL32(30,30,30,255)
        };
        if (c > 20) c = 20; return table[c];
    }

    void AppUI::drawViewer() {
        ImGui::Begin("Viewer");
        if (currentIndex < 0 || currentIndex >= (int)entries.size()) { ImGui::Text("No puzzle selected"); ImGui::End(); return; }
        const auto& e = entries[currentIndex];

        ImGui::Text("Tubes=%d  Capacity=%d  Empty=%d  h=%d", (int)e.state.T.size(), e.state.p.capacity, e.state.emptyCount(), heuristic(e.state));
        for (const auto& w : colorWarnings(e.state, e.palette)) {
            ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "%s", w.c_str());
        }

        std::vector<Move> moves;
        if (e.hasResult) {
            ImGui::Text("Outcome: %s  States=%lld  Time=%.1f ms", toString(e.result.outcome),
                (long long)e.result.statesVisited, e.result.elapsedMs);
            if (!e.result.message.empty()) ImGui::TextDisabled("%s", e.result.message.c_str());
            moves = e.result.moves;
        }

        ReplayResult rr = replay(e.state, moves, e.result.pour);
        int maxStep = (int)rr.states.size() - 1;
        playbackStep = std::clamp(playbackStep, 0, maxStep);
        if (!rr.ok) {
            ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Replay stopped: %s", rr.error.c_str());
        }
        if (moves.empty()) {
            ImGui::TextDisabled("No solution path recorded.");
        }
        else {
            ImGui::Separator();
            ImGui::Text("Solution step: %d / %d", playbackStep, maxStep);
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
                const auto& lastMove = rr.applied[playbackStep - 1];
                ImGui::Text("Move %d: %d -> %d (amount %d)", playbackStep, lastMove.from, lastMove.to, lastMove.amount);
            }
        }

        const State& s = rr.states[playbackStep];

        // draw tubes
        float cell = 18.0f; // cell height
        float tubeW = 28.0f; float gap = 12.0f; float baseY = 40.0f + s.p.capacity * cell;
        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();

        for (size_t i = 0; i < s.T.size(); ++i) {
            const auto& t = s.T[i];
            float x = origin.x + i * (tubeW + gap);
            float y = origin.y + baseY;
            // outline
            ImU32 outline = t.isSettled() ? IM_COL32(120, 220, 120, 255) : IM_COL32(200, 200, 200, 255);
            dl->AddRect(ImVec2(x, y - s.p.capacity * cell), ImVec2(x + tubeW, y), outline);
            // units bottom->top
            for (int k = 0; k < s.p.capacity; ++k) {
                float yTop = y - (k + 1) * cell;
                ImU32 col = k < t.size() ? colorFor(t.units[k]) : IM_COL32(60, 60, 60, 255);
                dl->AddRectFilled(ImVec2(x + 2, yTop + 2), ImVec2(x + tubeW - 2, yTop + cell - 2), col, 3.0f);
            }
            std::string tubeLabel = std::to_string(i);
            dl->AddText(ImVec2(x, y + 6), IM_COL32(200, 200, 200, 255), tubeLabel.c_str());
        }
        ImGui::Dummy(ImVec2(s.T.size() * (tubeW + gap), baseY + 24.0f));

        ImGui::End();
    }

    void AppUI::drawEditor() {
        ImGui::Begin("Editor (per tube)");
        if (currentIndex < 0 || currentIndex >= (int)entries.size()) { ImGui::Text("No puzzle selected"); ImGui::End(); return; }
        auto& e = entries[currentIndex];
        auto& s = e.state;
        bool edited = false;

        static int selTube = 0;
        selTube = std::clamp(selTube, 0, (int)s.T.size() - 1);
        InputIntClamped("Tube", &selTube, 0, (int)s.T.size() - 1);
        auto& t = s.T[selTube];
        ImGui::Text("Capacity=%d  Size=%d  Block=%d", s.p.capacity, t.size(), t.blockSize());

        ImGui::Separator();
        ImGui::Text("Paint / Edit Units");
        if (ImGui::Button("Add color")) {
            e.palette.intern("c" + std::to_string(e.palette.size() + 1));
        }
        int colors = std::max(1, e.palette.size());
        static int paintColor = 1; paintColor = std::clamp(paintColor, 1, colors);
        InputIntClamped("Paint Color", &paintColor, 1, colors);
        ImGui::SameLine();
        ImGui::ColorButton("##paint", ImGui::ColorConvertU32ToFloat4(colorFor((Color)paintColor)));
        ImGui::TextDisabled("%s", e.palette.name((Color)paintColor).c_str());

        bool hasColors = e.palette.size() > 0;
        if (!hasColors) ImGui::BeginDisabled();
        if (ImGui::Button("Push Top")) {
            if (!t.isFull(s.p.capacity)) { t.units.push_back((Color)paintColor); edited = true; }
        }
        if (!hasColors) ImGui::EndDisabled();
        ImGui::SameLine();
        if (ImGui::Button("Pop Top")) {
            if (!t.isEmpty()) { t.units.pop_back(); edited = true; }
        }
        ImGui::SameLine();
        if (ImGui::Button("Clear Tube")) {
            if (!t.isEmpty()) { t.units.clear(); edited = true; }
        }

        static int editIndex = 0; editIndex = std::clamp(editIndex, 0, std::max(0, s.p.capacity - 1));
        InputIntClamped("Edit Unit Index (0 = bottom)", &editIndex, 0, std::max(0, s.p.capacity - 1));
        if (editIndex < t.size()) {
            int ec = std::clamp((int)t.units[editIndex], 1, colors);
            if (InputIntClamped("Edit Unit Color", &ec, 1, colors)) { t.units[editIndex] = (Color)ec; edited = true; }
        }
        else {
            ImGui::TextDisabled("(Index beyond current height)");
        }

        if (edited) {
            e.hasResult = false;
            playbackStep = 0;
        }

        ImGui::End();
    }

    int AppUI::run() {
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            log::error("SDL_Init failed: {}", SDL_GetError());
            return 1;
        }
        SDL_Window* window = SDL_CreateWindow("WaterSort Solver Workbench", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1400, 900, SDL_WINDOW_SHOWN);
        if (!window) {
            log::error("SDL_CreateWindow failed: {}", SDL_GetError());
            SDL_Quit();
            return 1;
        }
        SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
            log::error("SDL_CreateRenderer failed: {}", SDL_GetError());
            SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::StyleColorsDark();

        ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
        ImGui_ImplSDLRenderer2_Init(renderer);

        bool running = true; SDL_Event ev;
        while (running) {
            while (SDL_PollEvent(&ev)) {
                ImGui_ImplSDL2_ProcessEvent(&ev);
                if (ev.type == SDL_QUIT) running = false;
            }
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            drawTopBar();
            drawViewer();
            drawEditor();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        joinWorker();
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace wss
