#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"
#include "Exploer/Exploer.hpp"

#include <array>
#include <atomic>
#include <chrono>

class ThreadPool;

class PathFinder
{
public:
    struct Result
    {
        PathAlgo algo{PathAlgo::DFS};
        bool found{false};
        std::vector<Point> path;
        size_t visited{0};
        uint32_t steps{0};
        std::chrono::microseconds elapsed{0};
        std::string error;
    };

    // Drives one solver over maze until it finds (0,0) -> (W-1,H-1) or gives up.
    // onStep sees the solver every updateEvery steps; a non-zero delay sleeps
    // between steps, which turns this into a paced driver.
    static bool FindPath(
        const Maze& maze,
        PathAlgo algo,
        std::vector<Point>& outSteps,
        std::string& outError,
        const std::function<void(const Exploer&)>& onStep = nullptr,
        std::atomic<bool>* cancel = nullptr,
        uint32_t updateEvery = 1,
        std::chrono::milliseconds delay = std::chrono::milliseconds{0},
        size_t* outVisited = nullptr,
        uint32_t* outStepCount = nullptr
    );

    static Result Run(const Maze& maze, PathAlgo algo, std::atomic<bool>* cancel = nullptr);

    // DFS, BFS and A* side by side on pool workers; maze is only read.
    static std::array<Result, 3> FindAll(const Maze& maze, ThreadPool& pool, std::atomic<bool>* cancel = nullptr);
};
