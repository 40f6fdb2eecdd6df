#include "core/Maze.hpp"
#include "TestUtil.hpp"

#include <algorithm>
#include <gtest/gtest.h>

static bool contains_(const std::vector<Point>& v, const Point& p)
{
    return std::find(v.begin(), v.end(), p) != v.end();
}

TEST(Maze, StartsFullyWalled)
{
    Maze m(4, 3);
    EXPECT_EQ(m.Width(), 4);
    EXPECT_EQ(m.Height(), 3);
    EXPECT_EQ(m.GetBounds(), std::make_pair(4, 3));
    EXPECT_EQ(m.CellCount(), 12u);
    for (int y = 0; y < 3; ++y)
        for (int x = 0; x < 4; ++x)
            EXPECT_EQ(m.Get(x, y), 0);
    EXPECT_EQ(m.PassageCount(), 0u);
}

TEST(Maze, RejectsNonPositiveSize)
{
    EXPECT_THROW(Maze(0, 3), InvalidSize);
    EXPECT_THROW(Maze(3, 0), InvalidSize);
    EXPECT_THROW(Maze(-1, 2), InvalidSize);
    EXPECT_THROW(Maze(2, 2, std::vector<uint8_t>(3, 0)), InvalidSize);
}

TEST(Maze, GetOutOfBounds)
{
    Maze m(3, 2);
    EXPECT_THROW(m.Get(3, 0), OutOfBounds);
    EXPECT_THROW(m.Get(0, 2), OutOfBounds);
    EXPECT_THROW(m.Get(-1, 0), OutOfBounds);
    EXPECT_THROW(m.GetIndex(6), OutOfBounds);
    EXPECT_NO_THROW(m.Get(2, 1));

    try {
        m.Get(5, 0);
        FAIL() << "expected OutOfBounds";
    }
    catch (const MazeError& e) {
        EXPECT_EQ(e.code(), MazeErrc::OutOfBounds);
    }
}

TEST(Maze, RowMajorIndexing)
{
    Maze m(5, 3);
    EXPECT_EQ(m.IndexOf(0, 0), 0u);
    EXPECT_EQ(m.IndexOf(4, 0), 4u);
    EXPECT_EQ(m.IndexOf(0, 1), 5u);
    EXPECT_EQ(m.IndexOf(3, 2), 13u);
    EXPECT_EQ(m.PointOf(13), (Point{ 3, 2 }));
    EXPECT_THROW(m.PointOf(15), OutOfBounds);
}

TEST(Maze, OpenAndCloseTouchOneCell)
{
    Maze m(2, 2);
    m.Open(0, 0, Direction::Right);
    EXPECT_EQ(m.Get(0, 0), Bit(Direction::Right));
    EXPECT_EQ(m.Get(1, 0), 0);

    m.Open(0, 0, Direction::Down);
    m.Close(0, 0, Direction::Right);
    EXPECT_EQ(m.Get(0, 0), Bit(Direction::Down));

    // one-sided openings are not passages
    EXPECT_EQ(m.PassageCount(), 0u);

    m.Clear(0, 0);
    EXPECT_EQ(m.Get(0, 0), 0);
    EXPECT_THROW(m.Open(2, 0, Direction::Up), OutOfBounds);
}

TEST(Maze, CarveIsSymmetric)
{
    Maze m(3, 3);
    const Point a{ 1, 1 };
    for (Direction d : kDirections)
    {
        m.Carve(a, d);
        const Point b = Travel(d, a);
        EXPECT_TRUE(contains_(m.GetTravellableNeighbors(a), b));
        EXPECT_TRUE(contains_(m.GetTravellableNeighbors(b), a));
        EXPECT_EQ(m.Get(b) & Bit(Opposite(d)), Bit(Opposite(d)));
    }
    EXPECT_EQ(m.Get(a), kAllSides);
    EXPECT_EQ(m.PassageCount(), 4u);
}

TEST(Maze, CarveOffGridLeavesGridUntouched)
{
    Maze m(2, 2);
    EXPECT_THROW(m.Carve(0, 0, Direction::Up), OutOfBounds);
    EXPECT_THROW(m.Carve(1, 1, Direction::Right), OutOfBounds);
    EXPECT_THROW(m.Carve(0, 0, Direction::Left), OutOfBounds);
    EXPECT_EQ(m, Maze(2, 2));
}

TEST(Maze, RawNeighborsIgnoreWalls)
{
    Maze m(3, 3);

    const auto corner = m.GetNeighbors({ 0, 0 });
    ASSERT_EQ(corner.size(), 2u);
    EXPECT_EQ(corner[0].pos, (Point{ 1, 0 }));
    EXPECT_EQ(corner[0].dir, Direction::Right);
    EXPECT_EQ(corner[1].pos, (Point{ 0, 1 }));
    EXPECT_EQ(corner[1].dir, Direction::Down);

    const auto center = m.GetNeighbors({ 1, 1 });
    ASSERT_EQ(center.size(), 4u);
    EXPECT_EQ(center[0].dir, Direction::Up);
    EXPECT_EQ(center[1].dir, Direction::Right);
    EXPECT_EQ(center[2].dir, Direction::Down);
    EXPECT_EQ(center[3].dir, Direction::Left);

    EXPECT_THROW(m.GetNeighbors({ 3, 0 }), OutOfBounds);
}

TEST(Maze, TravellableNeighborsStayInside)
{
    Maze m = OpenMaze(2, 2);
    const auto n = m.GetTravellableNeighbors({ 0, 0 });
    ASSERT_EQ(n.size(), 2u);
    EXPECT_EQ(n[0], (Point{ 1, 0 }));
    EXPECT_EQ(n[1], (Point{ 0, 1 }));

    Maze walled(2, 2);
    EXPECT_TRUE(walled.GetTravellableNeighbors({ 1, 1 }).empty());
}

TEST(Maze, PerfectnessCheck)
{
    Maze m(2, 2);
    EXPECT_FALSE(m.IsPerfect());

    m.Carve(0, 0, Direction::Right);
    m.Carve(1, 0, Direction::Down);
    m.Carve(1, 1, Direction::Left);
    EXPECT_TRUE(m.IsPerfect());

    // closing the loop adds a cycle
    m.Carve(0, 1, Direction::Up);
    EXPECT_FALSE(m.IsPerfect());

    EXPECT_TRUE(Maze(1, 1).IsPerfect());
}
