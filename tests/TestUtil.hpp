#pragma once
#include "core/Maze.hpp"

#include <gtest/gtest.h>

// every cell open on all four sides
inline Maze OpenMaze(int32_t w, int32_t h)
{
    return Maze(w, h, std::vector<uint8_t>((size_t)w * (size_t)h, kAllSides));
}

// consecutive cells are adjacent and joined by a passage open on both sides
inline ::testing::AssertionResult WalksOpenPassages(const Maze& maze, const std::vector<Point>& path)
{
    for (size_t i = 0; i + 1 < path.size(); ++i)
    {
        const auto dir = DirectionBetween(path[i], path[i + 1]);
        if (!dir)
            return ::testing::AssertionFailure() << "step " << i << " jumps from " << path[i] << " to " << path[i + 1];
        if (!(maze.Get(path[i]) & Bit(*dir)) || !(maze.Get(path[i + 1]) & Bit(Opposite(*dir))))
            return ::testing::AssertionFailure() << "step " << i << " goes through a wall at " << path[i];
    }
    return ::testing::AssertionSuccess();
}
