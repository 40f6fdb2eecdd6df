#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"
#include "App/App.hpp"

#include <stdexcept>
#include <algorithm>

Viewer& Viewer::getInstance()
{
    static Viewer inst;
    return inst;
}

Viewer::Viewer() = default;

Viewer::~Viewer()
{
    shutdownGL();
}

bool Viewer::loadOrCreateMaze()
{
    if (!cfg.mazePath.empty())
    {
        std::string error;
        try
        {
            if (!LoadMaze(cfg, maze, error)) {
                std::cerr << error << "\n";
                return false;
            }
        }
        catch (const MalformedEncoding& e)
        {
            std::cerr << "Could not decode " << cfg.mazePath << ": " << e.what() << "\n";
            return false;
        }

        generator.reset();
        generated = true;
        restartSolver(cfg.pathAlgo);
        return true;
    }

    regenerate(seed);
    return true;
}

void Viewer::regenerate(uint32_t newSeed)
{
    const std::string sizeError = CheckMazeSize(cfg.width, cfg.height);
    if (!sizeError.empty()) {
        std::cerr << sizeError << "\n";
        return;
    }

    seed = newSeed;

    maze = Maze(cfg.width, cfg.height);
    generator.emplace(cfg.genAlgo, maze.GetBounds(), seed);
    solver.reset();
    generated = false;

    // instant mode: finish before the first frame
    if (!live)
    {
        while (!generator->Step(maze)) {}
        generated = true;
        restartSolver(cfg.pathAlgo);
    }

    meshDirty = true;
    updateWindowTitle();
}

void Viewer::restartSolver(PathAlgo algo)
{
    cfg.pathAlgo = algo;
    if (!generated) return;

    solver.emplace(algo, maze.GetBounds());

    if (!live)
    {
        while (!solver->Step(maze) && solver->State() == ExploreState::Exploring) {}
    }

    meshDirty = true;
    updateWindowTitle();
}

void Viewer::runSteps(uint32_t n)
{
    for (uint32_t i = 0; i < n; ++i)
    {
        if (!generated)
        {
            if (generator && generator->Step(maze))
            {
                generated = true;
                std::cout << "Generated " << maze.Width() << "x" << maze.Height()
                          << " maze, seed=" << seed << "\n";
                restartSolver(cfg.pathAlgo);
            }
            meshDirty = true;
            continue;
        }

        if (!solver || solver->State() != ExploreState::Exploring)
            return;

        if (solver->Step(maze))
        {
            std::cout << PathAlgoName(solver->Algo()) << ": path " << solver->Path().size()
                      << " cells, visited " << solver->VisitedCount() << "\n";
            updateWindowTitle();
        }
        else if (solver->State() == ExploreState::NoPath)
        {
            std::cout << PathAlgoName(solver->Algo()) << ": " << solver->Error() << "\n";
            updateWindowTitle();
        }
        meshDirty = true;
    }
}

void Viewer::advance()
{
    const auto now = std::chrono::steady_clock::now();
    const double dt = std::chrono::duration<double>(now - lastTick).count();
    lastTick = now;

    if (!live) return;

    // pace by wall clock so the speed does not depend on the refresh rate
    stepBudget += dt * (double)cfg.stepsPerSecond;
    stepBudget = std::min(stepBudget, (double)cfg.stepsPerSecond);

    const uint32_t n = (uint32_t)stepBudget;
    stepBudget -= (double)n;
    runSteps(n);
}

void Viewer::saveMaze()
{
    if (!generated)
    {
        std::cout << "Maze not finished, nothing written\n";
        return;
    }

    std::string error;
    if (SaveMaze(cfg.outPath, maze, error))
        std::cout << "Wrote maze data to " << cfg.outPath << "\n";
    else
        std::cerr << "Could not write to file: " << error << "\n";
}

int Viewer::run(const AppConfig& config)
{
    cfg = config;
    live = cfg.live;
    seed = ResolveSeed(cfg);
    seedRng.seed(seed);

    if (!loadOrCreateMaze())
        return kExitMaze;

    initWindowAndGL();

    auto* win = static_cast<GLFWwindow*>(window);
    lastTick = std::chrono::steady_clock::now();

    while (win && !glfwWindowShouldClose(win))
    {
        advance();

        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        drawMaze();

        glfwSwapBuffers(win);
        glfwPollEvents();
    }

    saveMaze();
    shutdownGL();
    return kExitOk;
}

void Viewer::updateWindowTitle()
{
    if (!window) return;

    std::string title = "Maze  |  seed=" + std::to_string(seed);
    if (!generated)
    {
        title += "  |  generating";
    }
    else if (solver)
    {
        title += "  |  " + std::string(PathAlgoName(solver->Algo()));
        switch (solver->State())
        {
        case ExploreState::Exploring: title += "  |  solving"; break;
        case ExploreState::Found:     title += "  |  len=" + std::to_string(solver->Path().size()); break;
        case ExploreState::NoPath:    title += "  |  no path"; break;
        }
    }
    if (live) title += "  |  live";

    glfwSetWindowTitle(static_cast<GLFWwindow*>(window), title.c_str());
}

void Viewer::onFramebufferResized(int width, int height)
{
    fbW = std::max(1, width);
    fbH = std::max(1, height);
    meshDirty = true;
}
