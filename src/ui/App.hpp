// ========================= src/ui/App.hpp =========================
#pragma once
#include "../core/Generator.hpp"
#include "../io/Csv.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace wss {

    // One puzzle in the workbench pool.
    struct Entry {
        State state;
        Palette palette;
        SolveResult result;
        bool hasResult{ false };
    };

    class AppUI {
    public:
        AppUI();
        ~AppUI();
        int run(); // SDL2 + ImGui main loop

    private:
        Params p; GenOptions opt; SolveOptions solveOpt; int NtoGenerate{ 5 };
        std::vector<Entry> entries; // in-memory pool
        int currentIndex{ -1 };
        int viewIndexInput{ 1 };
        int playbackStep{ 0 };
        std::string savePath{ "puzzles.csv" };
        std::string loadPath{ "puzzles.csv" };

        // background job (generate or solve), one at a time
        std::thread worker;
        std::atomic<bool> busy{ false };
        std::atomic<int> jobCompleted{ 0 };
        int jobTotal{ 0 };
        std::mutex pendingMutex;
        std::vector<Entry> pendingGenerated;
        int pendingSolveIndex{ -1 };
        State pendingSolveState;
        SolveResult pendingSolveResult;
        bool pendingSolveReady{ false };

        std::mutex statusMutex;
        std::string statusMessage;
        void setStatus(const std::string& msg);
        std::string getStatus();

        // UI helpers
        void drawTopBar();
        void drawEditor();
        void drawViewer();

        void startGenerate();
        void startSolve();
        void collectPending();
        void loadCsv();
        void saveCsv();
        void ensureIndex(int idx);
        void joinWorker();
    };

} // namespace wss
