#include "core/Direction.hpp"

#include <gtest/gtest.h>

TEST(Direction, BitValues)
{
    EXPECT_EQ(Bit(Direction::Up), 1);
    EXPECT_EQ(Bit(Direction::Right), 2);
    EXPECT_EQ(Bit(Direction::Down), 4);
    EXPECT_EQ(Bit(Direction::Left), 8);
}

TEST(Direction, OppositeIsAnInvolution)
{
    EXPECT_EQ(Opposite(Direction::Up), Direction::Down);
    EXPECT_EQ(Opposite(Direction::Left), Direction::Right);
    for (Direction d : kDirections)
        EXPECT_EQ(Opposite(Opposite(d)), d);
}

TEST(Direction, TravelMovesOneCell)
{
    const Point p{ 3, 5 };
    EXPECT_EQ(Travel(Direction::Up, p), (Point{ 3, 4 }));
    EXPECT_EQ(Travel(Direction::Right, p), (Point{ 4, 5 }));
    EXPECT_EQ(Travel(Direction::Down, p), (Point{ 3, 6 }));
    EXPECT_EQ(Travel(Direction::Left, p), (Point{ 2, 5 }));
}

TEST(Direction, BetweenAdjacentCells)
{
    const Point p{ 1, 1 };
    for (Direction d : kDirections)
    {
        auto got = DirectionBetween(p, Travel(d, p));
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(*got, d);
    }

    EXPECT_FALSE(DirectionBetween(p, p).has_value());
    EXPECT_FALSE(DirectionBetween(p, Point{ 2, 2 }).has_value());
    EXPECT_FALSE(DirectionBetween(p, Point{ 3, 1 }).has_value());
}

TEST(Direction, TraceLetters)
{
    EXPECT_EQ(DirectionChar(Direction::Up), 'U');
    EXPECT_EQ(DirectionChar(Direction::Down), 'D');
    EXPECT_EQ(DirectionChar(Direction::Left), 'L');
    EXPECT_EQ(DirectionChar(Direction::Right), 'R');
    EXPECT_EQ(*DirectionFromChar('R'), Direction::Right);
    EXPECT_FALSE(DirectionFromChar('x').has_value());
    EXPECT_FALSE(DirectionFromChar('u').has_value());
}
