#pragma once
#include "core/Common.hpp"

// Grid coordinate: x = column, y = row, (0,0) is the top-left cell.
struct Point
{
    int32_t x{0};
    int32_t y{0};

    bool operator==(const Point& other) const
    {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point& other) const
    {
        return !(*this == other);
    }

    // column-major, same iteration order as an ordered (x, y) tuple
    bool operator<(const Point& other) const
    {
        return x != other.x ? x < other.x : y < other.y;
    }
};

// 曼哈顿距离
inline int32_t Manhattan(const Point& a, const Point& b)
{
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline std::ostream& operator<<(std::ostream& os, const Point& p)
{
    return os << '(' << p.x << ',' << p.y << ')';
}
