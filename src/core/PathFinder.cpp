#include "core/PathFinder.hpp"
#include "Thread/ThreadPool.hpp"

#include <future>
#include <thread>

static bool cancelled_(std::atomic<bool>* cancel)
{
    return cancel && cancel->load(std::memory_order_relaxed);
}

bool PathFinder::FindPath(
    const Maze& maze,
    PathAlgo algo,
    std::vector<Point>& outSteps,
    std::string& outError,
    const std::function<void(const Exploer&)>& onStep,
    std::atomic<bool>* cancel,
    uint32_t updateEvery,
    std::chrono::milliseconds delay,
    size_t* outVisited,
    uint32_t* outStepCount)
{
    outSteps.clear();
    outError.clear();

    if (maze.CellCount() == 0) {
        outError = "Empty grid.";
        return false;
    }

    if (updateEvery == 0) updateEvery = 1;

    Exploer ex(algo, maze.GetBounds());
    const std::vector<Point>* path = nullptr;
    uint32_t n = 0;

    while (!path)
    {
        if (cancelled_(cancel)) {
            outError = "Cancelled.";
            break;
        }

        path = ex.Step(maze);
        ++n;

        if (onStep && (path || n % updateEvery == 0))
            onStep(ex);

        if (ex.State() == ExploreState::NoPath) {
            outError = ex.Error();
            break;
        }

        if (!path && delay.count() > 0)
            std::this_thread::sleep_for(delay);
    }

    if (outVisited) *outVisited = ex.VisitedCount();
    if (outStepCount) *outStepCount = ex.TimeStep();

    if (!path) return false;

    outSteps = *path;
    return true;
}

PathFinder::Result PathFinder::Run(const Maze& maze, PathAlgo algo, std::atomic<bool>* cancel)
{
    Result r;
    r.algo = algo;

    auto startTime = std::chrono::steady_clock::now();
    r.found = FindPath(maze, algo, r.path, r.error, nullptr, cancel, 1,
                       std::chrono::milliseconds{0}, &r.visited, &r.steps);
    auto endTime = std::chrono::steady_clock::now();

    r.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);
    return r;
}

std::array<PathFinder::Result, 3> PathFinder::FindAll(const Maze& maze, ThreadPool& pool, std::atomic<bool>* cancel)
{
    constexpr std::array<PathAlgo, 3> algos = { PathAlgo::DFS, PathAlgo::BFS, PathAlgo::AStar };

    std::array<std::future<Result>, 3> futures;
    for (size_t i = 0; i < algos.size(); ++i)
    {
        const PathAlgo algo = algos[i];
        futures[i] = pool.enqueue([&maze, algo, cancel] { return Run(maze, algo, cancel); });
    }

    std::array<Result, 3> out;
    for (size_t i = 0; i < futures.size(); ++i)
        out[i] = futures[i].get();
    return out;
}
