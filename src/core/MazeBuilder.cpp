#include "core/MazeBuilder.hpp"

// ---------------- Wilson ----------------
WilsonGenerator::WilsonGenerator(std::pair<int32_t, int32_t> bounds, uint32_t seed)
    : width_(bounds.first), height_(bounds.second), rng_(seed)
{
    if (width_ <= 0 || height_ <= 0)
        throw InvalidSize("generator bounds must be positive");
    strip_ = width_ == 1 || height_ == 1;

    // a single cell is already a complete maze
    if ((size_t)width_ * (size_t)height_ < 2) return;

    std::uniform_int_distribution<int32_t> dx(0, width_ - 1);
    std::uniform_int_distribution<int32_t> dy(0, height_ - 1);

    const Point start{ dx(rng_), dy(rng_) };
    Point target = start;
    while (target == start)
        target = { dx(rng_), dy(rng_) };

    pushWalk_(start);
    firstWalkTarget_ = target;
}

void WilsonGenerator::pushWalk_(const Point& p)
{
    walkIndex_[key_(p)] = walk_.size();
    walk_.push_back(p);
}

void WilsonGenerator::truncateWalk_(size_t keep)
{
    for (size_t i = keep; i < walk_.size(); ++i)
        walkIndex_.erase(key_(walk_[i]));
    walk_.resize(keep);

    // after an erasure every neighbour is a fair draw again
    lastDirection_.reset();
}

void WilsonGenerator::commitWalk_(Maze& maze)
{
    for (size_t i = 0; i + 1 < walk_.size(); ++i)
    {
        const auto dir = DirectionBetween(walk_[i], walk_[i + 1]);
        if (!dir)
            throw std::logic_error("walk is not a chain of adjacent cells");
        maze.Carve(walk_[i], *dir);
    }
}

bool WilsonGenerator::startNewWalk_(const Maze& maze)
{
    walk_.clear();
    walkIndex_.clear();
    lastDirection_.reset();

    std::vector<size_t> uncarved;
    const auto& cells = maze.Cells();
    for (size_t i = 0; i < cells.size(); ++i)
        if (cells[i] == 0) uncarved.push_back(i);

    if (uncarved.empty())
        return true;

    std::uniform_int_distribution<size_t> pick(0, uncarved.size() - 1);
    pushWalk_(maze.PointOf(uncarved[pick(rng_)]));
    return false;
}

bool WilsonGenerator::Step(Maze& maze)
{
    if (walk_.empty())
        return true;

    const Point pos = walk_.back();
    const auto neighbors = maze.GetNeighbors(pos);
    if (neighbors.empty())
        return startNewWalk_(maze);

    std::uniform_int_distribution<size_t> pick(0, neighbors.size() - 1);
    Neighbor next = neighbors[pick(rng_)];

    // Turning straight back is redrawn once, a second reverse draw stands.
    // Strips one cell wide skip this: there it only drives the walk into the dead end.
    if (!strip_ && lastDirection_ && next.dir == Opposite(*lastDirection_))
        next = neighbors[pick(rng_)];

    // loop erasure: cut the walk back to the earlier visit
    auto it = walkIndex_.find(key_(next.pos));
    if (it != walkIndex_.end())
    {
        truncateWalk_(it->second + 1);
        return false;
    }

    lastDirection_ = next.dir;
    pushWalk_(next.pos);

    const bool reachedTree = maze.Get(next.pos) != 0 ||
        (firstWalkTarget_ && *firstWalkTarget_ == next.pos);
    if (!reachedTree)
        return false;

    firstWalkTarget_.reset();
    commitWalk_(maze);
    return startNewWalk_(maze);
}

// ---------------- Backtrack ----------------
BacktrackGenerator::BacktrackGenerator(std::pair<int32_t, int32_t> bounds, uint32_t seed)
    : rng_(seed)
{
    if (bounds.first <= 0 || bounds.second <= 0)
        throw InvalidSize("generator bounds must be positive");

    std::uniform_int_distribution<int32_t> dx(0, bounds.first - 1);
    std::uniform_int_distribution<int32_t> dy(0, bounds.second - 1);
    stack_.push_back({ dx(rng_), dy(rng_) });
}

bool BacktrackGenerator::Step(Maze& maze)
{
    if (stack_.empty())
        return true;

    const Point cur = stack_.back();

    std::vector<Neighbor> fresh;
    for (const auto& n : maze.GetNeighbors(cur))
        if (maze.Get(n.pos) == 0) fresh.push_back(n);

    if (fresh.empty())
    {
        stack_.pop_back();
        return stack_.empty();
    }

    std::uniform_int_distribution<size_t> pick(0, fresh.size() - 1);
    const Neighbor next = fresh[pick(rng_)];

    maze.Carve(cur, next.dir);
    stack_.push_back(next.pos);
    return false;
}

// ---------------- tagged union ----------------
static std::variant<WilsonGenerator, BacktrackGenerator>
MakeGenerator_(GenAlgo algo, std::pair<int32_t, int32_t> bounds, uint32_t seed)
{
    switch (algo)
    {
    case GenAlgo::Backtrack:
        return BacktrackGenerator(bounds, seed);
    case GenAlgo::Wilson:
    default:
        return WilsonGenerator(bounds, seed);
    }
}

MazeGenerator::MazeGenerator(GenAlgo algo, std::pair<int32_t, int32_t> bounds, uint32_t seed)
    : algo_(algo), impl_(MakeGenerator_(algo, bounds, seed))
{
}

bool MazeGenerator::Step(Maze& maze)
{
    switch (algo_)
    {
    case GenAlgo::Backtrack: return std::get<BacktrackGenerator>(impl_).Step(maze);
    case GenAlgo::Wilson:
    default:                 return std::get<WilsonGenerator>(impl_).Step(maze);
    }
}

const std::vector<Point>& MazeGenerator::Trail() const
{
    switch (algo_)
    {
    case GenAlgo::Backtrack: return std::get<BacktrackGenerator>(impl_).Stack();
    case GenAlgo::Wilson:
    default:                 return std::get<WilsonGenerator>(impl_).Walk();
    }
}

std::optional<Point> MazeGenerator::Target() const
{
    if (algo_ == GenAlgo::Wilson)
        return std::get<WilsonGenerator>(impl_).FirstWalkTarget();
    return std::nullopt;
}

// ---------------- driver ----------------
Maze MazeBuilder::Build(
    int32_t width,
    int32_t height,
    uint32_t seed,
    GenAlgo algo,
    const std::function<void(const Maze&, const MazeGenerator&)>& onUpdate,
    size_t* outSteps)
{
    Maze maze(width, height);
    MazeGenerator gen(algo, maze.GetBounds(), seed);

    size_t steps = 0;
    bool done = false;
    while (!done)
    {
        done = gen.Step(maze);
        ++steps;
        if (onUpdate) onUpdate(maze, gen);
    }

    if (outSteps) *outSteps = steps;
    return maze;
}
