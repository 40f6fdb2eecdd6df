#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

#include <array>

// One bit per side of a cell; a cell value is the OR of its open sides.
enum class Direction : uint8_t
{
    Up    = 0b0001,
    Right = 0b0010,
    Down  = 0b0100,
    Left  = 0b1000,
};

// enumeration order used everywhere a cell's sides are walked
constexpr std::array<Direction, 4> kDirections = {
    Direction::Up, Direction::Right, Direction::Down, Direction::Left
};

constexpr uint8_t kAllSides = 0b1111;

inline uint8_t Bit(Direction d)
{
    return static_cast<uint8_t>(d);
}

Direction Opposite(Direction d);

// Shift p one cell toward d. Going up from row 0 or left from column 0 yields a
// negative coordinate; the grid rejects those, callers must not rely on them.
Point Travel(Direction d, const Point& p);

// Direction leading from a to an orthogonally adjacent b.
std::optional<Direction> DirectionBetween(const Point& a, const Point& b);

char DirectionChar(Direction d);
std::optional<Direction> DirectionFromChar(char c);
