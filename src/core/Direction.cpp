#include "core/Direction.hpp"

Direction Opposite(Direction d)
{
    switch (d)
    {
    case Direction::Up:    return Direction::Down;
    case Direction::Right: return Direction::Left;
    case Direction::Down:  return Direction::Up;
    case Direction::Left:  return Direction::Right;
    }
    return d;
}

Point Travel(Direction d, const Point& p)
{
    switch (d)
    {
    case Direction::Up:    return { p.x, p.y - 1 };
    case Direction::Right: return { p.x + 1, p.y };
    case Direction::Down:  return { p.x, p.y + 1 };
    case Direction::Left:  return { p.x - 1, p.y };
    }
    return p;
}

std::optional<Direction> DirectionBetween(const Point& a, const Point& b)
{
    if (a.x == b.x)
    {
        if (b.y == a.y + 1) return Direction::Down;
        if (b.y == a.y - 1) return Direction::Up;
    }
    else if (a.y == b.y)
    {
        if (b.x == a.x + 1) return Direction::Right;
        if (b.x == a.x - 1) return Direction::Left;
    }
    return std::nullopt;
}

char DirectionChar(Direction d)
{
    switch (d)
    {
    case Direction::Up:    return 'U';
    case Direction::Right: return 'R';
    case Direction::Down:  return 'D';
    case Direction::Left:  return 'L';
    }
    return '?';
}

std::optional<Direction> DirectionFromChar(char c)
{
    switch (c)
    {
    case 'U': return Direction::Up;
    case 'R': return Direction::Right;
    case 'D': return Direction::Down;
    case 'L': return Direction::Left;
    default:  return std::nullopt;
    }
}
