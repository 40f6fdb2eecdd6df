#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Direction.hpp"
#include "core/MazeError.hpp"

struct Neighbor
{
    Point pos;
    Direction dir; // direction leading from the queried cell to pos
};

// Rectangular grid of 4-bit passage masks, row-major.
// Passages stay symmetric as long as they are created through Carve().
class Maze
{
public:
    Maze() = default;

    // all cells walled; throws InvalidSize unless both dimensions are positive
    Maze(int32_t width, int32_t height);

    // throws InvalidSize when cells.size() != width * height
    Maze(int32_t width, int32_t height, std::vector<uint8_t> cells);

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    std::pair<int32_t, int32_t> GetBounds() const { return { width_, height_ }; }
    size_t CellCount() const { return cells_.size(); }
    const std::vector<uint8_t>& Cells() const { return cells_; }

    bool InBounds(int32_t x, int32_t y) const
    {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    bool InBounds(const Point& p) const { return InBounds(p.x, p.y); }

    // throws OutOfBounds
    uint8_t Get(int32_t x, int32_t y) const;
    uint8_t Get(const Point& p) const { return Get(p.x, p.y); }
    uint8_t GetIndex(size_t i) const;

    size_t IndexOf(int32_t x, int32_t y) const;
    size_t IndexOf(const Point& p) const { return IndexOf(p.x, p.y); }
    Point PointOf(size_t i) const;

    // Single-cell edits, no symmetry guarantee.
    void Open(int32_t x, int32_t y, Direction dir);
    void Close(int32_t x, int32_t y, Direction dir);
    void Clear(int32_t x, int32_t y);

    // Opens dir on (x,y) and the opposite side on the neighbour behind it.
    // Throws OutOfBounds without touching the grid if either cell is outside.
    void Carve(int32_t x, int32_t y, Direction dir);
    void Carve(const Point& p, Direction dir) { Carve(p.x, p.y, dir); }

    // Grid-adjacent cells regardless of walls, in Up, Right, Down, Left order.
    std::vector<Neighbor> GetNeighbors(const Point& p) const;

    // Cells reachable through an open side of p, in Up, Right, Down, Left order.
    std::vector<Point> GetTravellableNeighbors(const Point& p) const;

    // number of open passage pairs (a one-sided opening does not count)
    size_t PassageCount() const;

    // connected, acyclic and symmetric: exactly CellCount() - 1 passages
    bool IsPerfect() const;

    bool operator==(const Maze& other) const
    {
        return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
    }
    bool operator!=(const Maze& other) const { return !(*this == other); }

private:
    void check_(int32_t x, int32_t y) const;

    int32_t width_{0};
    int32_t height_{0};
    std::vector<uint8_t> cells_{};
};
