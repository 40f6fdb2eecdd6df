#include "Exploer/Exploer.hpp"
#include "core/MazeBuilder.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

namespace
{
    // steps until a path comes back or the solver gives up
    std::vector<Point> solve(Exploer& ex, const Maze& m, size_t limit = 1000000)
    {
        for (size_t i = 0; i < limit; ++i)
        {
            if (const auto* path = ex.Step(m))
                return *path;
            if (ex.State() == ExploreState::NoPath)
                break;
        }
        return {};
    }

    std::vector<Point> solve(PathAlgo algo, const Maze& m)
    {
        Exploer ex(algo, m.GetBounds());
        return solve(ex, m);
    }

    const PathAlgo kAlgos[] = { PathAlgo::DFS, PathAlgo::BFS, PathAlgo::AStar };
}

TEST(Exploer, OpenGridEverySolverArrives)
{
    const Maze m = OpenMaze(3, 3);
    for (PathAlgo algo : kAlgos)
    {
        const auto path = solve(algo, m);
        ASSERT_FALSE(path.empty()) << PathAlgoName(algo);
        EXPECT_EQ(path.front(), (Point{ 0, 0 })) << PathAlgoName(algo);
        EXPECT_EQ(path.back(), (Point{ 2, 2 })) << PathAlgoName(algo);
        EXPECT_TRUE(WalksOpenPassages(m, path)) << PathAlgoName(algo);
    }

    EXPECT_EQ(solve(PathAlgo::BFS, m).size(), 5u);
    EXPECT_EQ(solve(PathAlgo::AStar, m).size(), 5u);
}

TEST(Exploer, DfsPrefersUpRightDownLeft)
{
    const Maze m = OpenMaze(2, 2);
    const std::vector<Point> expected = { { 0, 0 }, { 1, 0 }, { 1, 1 } };
    EXPECT_EQ(solve(PathAlgo::DFS, m), expected);
}

TEST(Exploer, DfsBacktracksOutOfDeadEnds)
{
    // (0,0) - (1,0) dead end, real route goes down the left column
    //   [0,0]-[1,0]
    //     |
    //   [0,1]-[1,1]
    Maze m(2, 2);
    m.Carve(0, 0, Direction::Right);
    m.Carve(0, 0, Direction::Down);
    m.Carve(0, 1, Direction::Right);

    DFSExploer dfs(m.GetBounds());
    const std::vector<Point>* path = nullptr;
    size_t steps = 0;
    while (!path && steps++ < 100)
        path = dfs.Step(m);

    ASSERT_NE(path, nullptr);
    const std::vector<Point> expected = { { 0, 0 }, { 0, 1 }, { 1, 1 } };
    EXPECT_EQ(*path, expected);
    EXPECT_EQ(dfs.VisitedCount(), 3u);
}

TEST(Exploer, GeneratedMazeBfsNeverLongerThanDfs)
{
    for (uint32_t seed = 1; seed <= 6; ++seed)
    {
        const Maze m = MazeBuilder::Build(15, 11, seed, seed % 2 ? GenAlgo::Wilson : GenAlgo::Backtrack);

        const auto dfs = solve(PathAlgo::DFS, m);
        const auto bfs = solve(PathAlgo::BFS, m);
        const auto astar = solve(PathAlgo::AStar, m);

        ASSERT_FALSE(dfs.empty());
        ASSERT_FALSE(bfs.empty());
        ASSERT_FALSE(astar.empty());

        EXPECT_LE(bfs.size(), dfs.size());
        EXPECT_TRUE(WalksOpenPassages(m, dfs));
        EXPECT_TRUE(WalksOpenPassages(m, bfs));
        EXPECT_TRUE(WalksOpenPassages(m, astar));

        // a perfect maze has exactly one simple route
        EXPECT_EQ(dfs, bfs);
        EXPECT_EQ(astar, bfs);
    }
}

TEST(Exploer, BfsIsShortestOnGridWithLoops)
{
    const Maze m = OpenMaze(6, 4);
    const auto bfs = solve(PathAlgo::BFS, m);
    const auto dfs = solve(PathAlgo::DFS, m);
    EXPECT_EQ(bfs.size(), 6u + 4u - 1u);
    EXPECT_LE(bfs.size(), dfs.size());
}

TEST(Exploer, StepAfterFinishKeepsReturningThePath)
{
    const Maze m = MazeBuilder::Build(8, 8, 11);
    for (PathAlgo algo : kAlgos)
    {
        Exploer ex(algo, m.GetBounds());
        const auto first = solve(ex, m);
        ASSERT_FALSE(first.empty());
        const uint32_t steps = ex.TimeStep();

        for (int i = 0; i < 3; ++i)
        {
            const auto* again = ex.Step(m);
            ASSERT_NE(again, nullptr);
            EXPECT_EQ(*again, first);
        }
        EXPECT_EQ(ex.TimeStep(), steps);
        EXPECT_EQ(ex.State(), ExploreState::Found);
    }
}

TEST(Exploer, UnreachableGoalEndsWithNoPath)
{
    Maze m(3, 3);
    m.Carve(0, 0, Direction::Right);
    m.Carve(1, 0, Direction::Down);

    for (PathAlgo algo : kAlgos)
    {
        Exploer ex(algo, m.GetBounds());
        EXPECT_TRUE(solve(ex, m).empty()) << PathAlgoName(algo);
        EXPECT_EQ(ex.State(), ExploreState::NoPath) << PathAlgoName(algo);
        EXPECT_FALSE(ex.Error().empty());
        EXPECT_EQ(ex.Step(m), nullptr);
        EXPECT_EQ(ex.VisitedCount(), 3u) << PathAlgoName(algo);
    }
}

TEST(Exploer, SingleCellMaze)
{
    const Maze m(1, 1);
    for (PathAlgo algo : kAlgos)
    {
        const auto path = solve(algo, m);
        ASSERT_EQ(path.size(), 1u) << PathAlgoName(algo);
        EXPECT_EQ(path.front(), (Point{ 0, 0 }));
    }
}

TEST(Exploer, BfsFrontierAndVisited)
{
    const Maze m = OpenMaze(3, 3);
    BFSExploer bfs(m.GetBounds());
    EXPECT_EQ(bfs.Step(m), nullptr);

    // (0,0) expanded into its right and lower neighbours
    ASSERT_EQ(bfs.Queue().size(), 2u);
    EXPECT_EQ(bfs.Queue()[0], (Point{ 1, 0 }));
    EXPECT_EQ(bfs.Queue()[1], (Point{ 0, 1 }));
    EXPECT_EQ(bfs.VisitedCount(), 3u);
    EXPECT_TRUE(bfs.Path().empty());
}

TEST(Exploer, AStarFrontierKeepsFirstDiscovery)
{
    const Maze m = OpenMaze(3, 3);
    AStarExploer astar(m.GetBounds());

    ASSERT_EQ(astar.Open().size(), 1u);
    EXPECT_EQ(astar.Open().begin()->second.heuristic, 4);

    EXPECT_EQ(astar.Step(m), nullptr);
    ASSERT_EQ(astar.Open().size(), 2u);
    for (const auto& kv : astar.Open())
    {
        EXPECT_EQ(kv.second.cost, 1);
        // measured from (0,0), the cell that discovered them
        EXPECT_EQ(kv.second.heuristic, 4);
        ASSERT_TRUE(kv.second.from.has_value());
        EXPECT_EQ(*kv.second.from, (Point{ 0, 0 }));
    }

    // (0,1) comes first in (x, y) order and reaches (1,1) before (1,0) does
    EXPECT_EQ(astar.Step(m), nullptr);
    EXPECT_EQ(astar.Step(m), nullptr);
    const auto it = astar.Open().find({ 1, 1 });
    ASSERT_NE(it, astar.Open().end());
    EXPECT_EQ(it->second.cost, 2);
    EXPECT_EQ(*it->second.from, (Point{ 0, 1 }));
    EXPECT_EQ(it->second.heuristic, 3);
}

TEST(Exploer, UnionReportsAlgo)
{
    const Maze m(2, 2);
    EXPECT_EQ(Exploer(PathAlgo::BFS, m.GetBounds()).Algo(), PathAlgo::BFS);
    EXPECT_STREQ(PathAlgoName(PathAlgo::AStar), "a-star");
    EXPECT_THROW(Exploer(PathAlgo::DFS, { 0, 2 }), InvalidSize);
}
