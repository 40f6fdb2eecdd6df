#pragma once

#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/MazeBuilder.hpp"
#include "Exploer/Exploer.hpp"
#include "App/Config.hpp"

#include <chrono>
#include <random>

class Viewer {
public:
    static Viewer& getInstance();

    // Opens the window and runs until it is closed. Returns an ExitCode.
    int run(const AppConfig& cfg);
    void onFramebufferResized(int width, int height);

private:
    Viewer();
    ~Viewer();

private:
    // window/gl
    void initWindowAndGL();
    void shutdownGL();
    void initInputCallbacks();
    void updateWindowTitle();

    // render
    void drawMaze();
    void rebuildMesh();

    // work
    bool loadOrCreateMaze();
    void regenerate(uint32_t seed);
    void restartSolver(PathAlgo algo);
    void advance();
    void runSteps(uint32_t n);
    void saveMaze();

private:
    // -------- window / gl state --------
    void* window = nullptr;
    int fbW = 576;
    int fbH = 576;

    uint32_t program = 0;
    uint32_t vao = 0;
    uint32_t vbo = 0;
    int vertexCount = 0;
    bool meshDirty = true;

    // -------- maze state --------
    AppConfig cfg{};
    Maze maze{};
    uint32_t seed = 0;
    std::mt19937 seedRng{};
    std::optional<MazeGenerator> generator;
    std::optional<Exploer> solver;
    bool generated = false;
    bool live = false;

    // live pacing: fractional steps carried between frames
    double stepBudget = 0.0;
    std::chrono::steady_clock::time_point lastTick{};
};
