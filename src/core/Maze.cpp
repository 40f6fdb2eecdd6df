#include "core/Maze.hpp"

#include <queue>
#include <sstream>

Maze::Maze(int32_t width, int32_t height)
{
    if (width <= 0 || height <= 0)
    {
        std::ostringstream ss;
        ss << "maze size " << width << "x" << height << " is not positive";
        throw InvalidSize(ss.str());
    }

    width_ = width;
    height_ = height;
    cells_.assign((size_t)width * (size_t)height, 0);
}

Maze::Maze(int32_t width, int32_t height, std::vector<uint8_t> cells)
    : Maze(width, height)
{
    if (cells.size() != cells_.size())
    {
        std::ostringstream ss;
        ss << "expected " << cells_.size() << " cells, got " << cells.size();
        throw InvalidSize(ss.str());
    }

    for (auto& c : cells) c &= kAllSides;
    cells_ = std::move(cells);
}

void Maze::check_(int32_t x, int32_t y) const
{
    if (x < 0 || x >= width_)
    {
        std::ostringstream ss;
        ss << "x " << x << " outside width " << width_;
        throw OutOfBounds(ss.str());
    }
    if (y < 0 || y >= height_)
    {
        std::ostringstream ss;
        ss << "y " << y << " outside height " << height_;
        throw OutOfBounds(ss.str());
    }
}

uint8_t Maze::Get(int32_t x, int32_t y) const
{
    check_(x, y);
    return cells_[(size_t)y * (size_t)width_ + (size_t)x];
}

uint8_t Maze::GetIndex(size_t i) const
{
    if (i >= cells_.size())
    {
        std::ostringstream ss;
        ss << "index " << i << " outside " << cells_.size() << " cells";
        throw OutOfBounds(ss.str());
    }
    return cells_[i];
}

size_t Maze::IndexOf(int32_t x, int32_t y) const
{
    check_(x, y);
    return (size_t)y * (size_t)width_ + (size_t)x;
}

Point Maze::PointOf(size_t i) const
{
    GetIndex(i);
    return { (int32_t)(i % (size_t)width_), (int32_t)(i / (size_t)width_) };
}

void Maze::Open(int32_t x, int32_t y, Direction dir)
{
    cells_[IndexOf(x, y)] |= Bit(dir);
}

void Maze::Close(int32_t x, int32_t y, Direction dir)
{
    cells_[IndexOf(x, y)] &= (uint8_t)(~Bit(dir) & kAllSides);
}

void Maze::Clear(int32_t x, int32_t y)
{
    cells_[IndexOf(x, y)] = 0;
}

void Maze::Carve(int32_t x, int32_t y, Direction dir)
{
    const Point next = Travel(dir, { x, y });

    // validate both ends first so a failed carve never leaves half a passage
    check_(x, y);
    check_(next.x, next.y);

    Open(x, y, dir);
    Open(next.x, next.y, Opposite(dir));
}

std::vector<Neighbor> Maze::GetNeighbors(const Point& p) const
{
    check_(p.x, p.y);

    std::vector<Neighbor> out;
    out.reserve(4);
    for (Direction d : kDirections)
    {
        const Point n = Travel(d, p);
        if (InBounds(n)) out.push_back({ n, d });
    }
    return out;
}

std::vector<Point> Maze::GetTravellableNeighbors(const Point& p) const
{
    const uint8_t value = Get(p);

    std::vector<Point> out;
    out.reserve(4);
    for (Direction d : kDirections)
    {
        if ((value & Bit(d)) == 0) continue;
        const Point n = Travel(d, p);
        if (InBounds(n)) out.push_back(n);
    }
    return out;
}

size_t Maze::PassageCount() const
{
    size_t count = 0;
    for (int32_t y = 0; y < height_; ++y)
    {
        for (int32_t x = 0; x < width_; ++x)
        {
            const uint8_t v = cells_[(size_t)y * (size_t)width_ + (size_t)x];

            // count each pair once, from its left / upper cell
            if ((v & Bit(Direction::Right)) && x + 1 < width_ &&
                (Get(x + 1, y) & Bit(Direction::Left)))
                ++count;
            if ((v & Bit(Direction::Down)) && y + 1 < height_ &&
                (Get(x, y + 1) & Bit(Direction::Up)))
                ++count;
        }
    }
    return count;
}

bool Maze::IsPerfect() const
{
    if (cells_.empty()) return false;
    if (PassageCount() != cells_.size() - 1) return false;

    std::vector<uint8_t> seen(cells_.size(), 0);
    std::queue<Point> q;
    q.push({ 0, 0 });
    seen[0] = 1;
    size_t reached = 1;

    while (!q.empty())
    {
        const Point cur = q.front();
        q.pop();

        for (const Point& n : GetTravellableNeighbors(cur))
        {
            // one-sided openings do not connect anything
            const auto back = DirectionBetween(n, cur);
            if (!back || (Get(n) & Bit(*back)) == 0) continue;

            const size_t k = IndexOf(n);
            if (seen[k]) continue;
            seen[k] = 1;
            ++reached;
            q.push(n);
        }
    }

    return reached == cells_.size();
}
