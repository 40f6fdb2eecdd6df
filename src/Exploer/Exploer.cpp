#include "core/Common.hpp"
#include "Exploer/Exploer.hpp"

// key helpers
static uint32_t keyOf(const Point& p, int32_t W) { return (uint32_t)p.y * (uint32_t)W + (uint32_t)p.x; }
static Point xyOf(uint32_t k, int32_t W) { return { (int32_t)(k % (uint32_t)W), (int32_t)(k / (uint32_t)W) }; }

static Point endOf_(std::pair<int32_t, int32_t> bounds)
{
    if (bounds.first <= 0 || bounds.second <= 0)
        throw InvalidSize("solver bounds must be positive");
    return { bounds.first - 1, bounds.second - 1 };
}

const char* PathAlgoName(PathAlgo algo)
{
    switch (algo)
    {
    case PathAlgo::DFS:   return "dfs";
    case PathAlgo::BFS:   return "bfs";
    case PathAlgo::AStar: return "a-star";
    }
    return "?";
}

// ---------------- DFS ----------------
DFSExploer::DFSExploer(std::pair<int32_t, int32_t> bounds)
    : path_{ Point{ 0, 0 } }, end_(endOf_(bounds)), width_(bounds.first)
{
}

const std::vector<Point>* DFSExploer::Step(const Maze& maze)
{
    if (state_ == ExploreState::Found) return &path_;
    if (state_ == ExploreState::NoPath) return nullptr;

    if (path_.empty()) {
        state_ = ExploreState::NoPath;
        error_ = "No path.";
        return nullptr;
    }

    ++timeStep_;

    const Point pos = path_.back();
    if (pos == end_) {
        state_ = ExploreState::Found;
        return &path_;
    }

    // the tail is marked on every visit, otherwise the next cell would walk straight back
    visited_.insert(keyOf(pos, width_));

    for (const Point& n : maze.GetTravellableNeighbors(pos))
    {
        if (visited_.count(keyOf(n, width_))) continue;
        path_.push_back(n);
        return nullptr;
    }

    // dead end, backtrack
    path_.pop_back();
    if (path_.empty()) {
        state_ = ExploreState::NoPath;
        error_ = "No path.";
    }
    return nullptr;
}

std::vector<Point> DFSExploer::Visited() const
{
    std::vector<Point> out;
    out.reserve(visited_.size());
    for (uint32_t k : visited_) out.push_back(xyOf(k, width_));
    return out;
}

// ---------------- BFS ----------------
BFSExploer::BFSExploer(std::pair<int32_t, int32_t> bounds)
    : end_(endOf_(bounds)), width_(bounds.first)
{
    const Point start{ 0, 0 };
    queue_.push_back(start);
    visited_.emplace(keyOf(start, width_), std::nullopt);
}

const std::vector<Point>* BFSExploer::Step(const Maze& maze)
{
    if (finished_) return &path_;
    if (state_ == ExploreState::NoPath) return nullptr;

    if (queue_.empty()) {
        state_ = ExploreState::NoPath;
        error_ = "No path.";
        return nullptr;
    }

    ++timeStep_;

    const Point pos = queue_.front();
    queue_.pop_front();

    if (pos == end_) {
        finished_ = true;
        state_ = ExploreState::Found;

        std::optional<Point> cur = pos;
        while (cur) {
            path_.push_back(*cur);
            cur = visited_.at(keyOf(*cur, width_));
        }
        std::reverse(path_.begin(), path_.end());
        return &path_;
    }

    for (const Point& n : maze.GetTravellableNeighbors(pos))
    {
        const uint32_t nk = keyOf(n, width_);
        if (visited_.count(nk)) continue;

        visited_.emplace(nk, pos);
        queue_.push_back(n);
    }

    return nullptr;
}

std::vector<Point> BFSExploer::Visited() const
{
    std::vector<Point> out;
    out.reserve(visited_.size());
    for (const auto& kv : visited_) out.push_back(xyOf(kv.first, width_));
    return out;
}

// ---------------- A* ----------------
AStarExploer::AStarExploer(std::pair<int32_t, int32_t> bounds)
    : end_(endOf_(bounds)), width_(bounds.first)
{
    const Point start{ 0, 0 };
    open_.emplace(start, CellInfo{ 0, Manhattan(start, end_), std::nullopt });
}

const std::vector<Point>* AStarExploer::Step(const Maze& maze)
{
    if (!path_.empty()) return &path_;
    if (state_ == ExploreState::NoPath) return nullptr;

    if (open_.empty()) {
        state_ = ExploreState::NoPath;
        error_ = "No path.";
        return nullptr;
    }

    ++timeStep_;

    // cheapest entry; ties go to the smaller heuristic, then to the first in (x, y) order
    auto best = open_.begin();
    for (auto it = std::next(open_.begin()); it != open_.end(); ++it)
    {
        const CellInfo& a = it->second;
        const CellInfo& b = best->second;
        if (a.cost < b.cost || (a.cost == b.cost && a.heuristic < b.heuristic))
            best = it;
    }

    const Point pos = best->first;
    const CellInfo current = best->second;
    open_.erase(best);
    closed_[keyOf(pos, width_)] = { pos, current };

    if (pos == end_) {
        state_ = ExploreState::Found;

        std::optional<Point> cur = pos;
        while (cur) {
            path_.push_back(*cur);
            cur = closed_.at(keyOf(*cur, width_)).second.from;
        }
        std::reverse(path_.begin(), path_.end());
        return &path_;
    }

    const int32_t cost = current.cost + 1;
    const int32_t heuristic = Manhattan(pos, end_);

    for (const Point& n : maze.GetTravellableNeighbors(pos))
    {
        // settled cells are never reopened
        if (closed_.count(keyOf(n, width_))) continue;

        // no decrease-key: the first discovery of a cell keeps its entry
        open_.emplace(n, CellInfo{ cost, heuristic, pos });
    }

    return nullptr;
}

std::vector<Point> AStarExploer::Closed() const
{
    std::vector<Point> out;
    out.reserve(closed_.size());
    for (const auto& kv : closed_) out.push_back(kv.second.first);
    return out;
}

// ---------------- tagged union ----------------
static std::variant<DFSExploer, BFSExploer, AStarExploer>
MakeExploer_(PathAlgo algo, std::pair<int32_t, int32_t> bounds)
{
    switch (algo)
    {
    case PathAlgo::BFS:   return BFSExploer(bounds);
    case PathAlgo::AStar: return AStarExploer(bounds);
    case PathAlgo::DFS:
    default:              return DFSExploer(bounds);
    }
}

Exploer::Exploer(PathAlgo algo, std::pair<int32_t, int32_t> bounds)
    : algo_(algo), impl_(MakeExploer_(algo, bounds))
{
}

const std::vector<Point>* Exploer::Step(const Maze& maze)
{
    switch (algo_)
    {
    case PathAlgo::BFS:   return std::get<BFSExploer>(impl_).Step(maze);
    case PathAlgo::AStar: return std::get<AStarExploer>(impl_).Step(maze);
    case PathAlgo::DFS:
    default:              return std::get<DFSExploer>(impl_).Step(maze);
    }
}

ExploreState Exploer::State() const
{
    switch (algo_)
    {
    case PathAlgo::BFS:   return std::get<BFSExploer>(impl_).State();
    case PathAlgo::AStar: return std::get<AStarExploer>(impl_).State();
    case PathAlgo::DFS:
    default:              return std::get<DFSExploer>(impl_).State();
    }
}

const std::string& Exploer::Error() const
{
    switch (algo_)
    {
    case PathAlgo::BFS:   return std::get<BFSExploer>(impl_).Error();
    case PathAlgo::AStar: return std::get<AStarExploer>(impl_).Error();
    case PathAlgo::DFS:
    default:              return std::get<DFSExploer>(impl_).Error();
    }
}

uint32_t Exploer::TimeStep() const
{
    switch (algo_)
    {
    case PathAlgo::BFS:   return std::get<BFSExploer>(impl_).TimeStep();
    case PathAlgo::AStar: return std::get<AStarExploer>(impl_).TimeStep();
    case PathAlgo::DFS:
    default:              return std::get<DFSExploer>(impl_).TimeStep();
    }
}

size_t Exploer::VisitedCount() const
{
    switch (algo_)
    {
    case PathAlgo::BFS:   return std::get<BFSExploer>(impl_).VisitedCount();
    case PathAlgo::AStar: return std::get<AStarExploer>(impl_).VisitedCount();
    case PathAlgo::DFS:
    default:              return std::get<DFSExploer>(impl_).VisitedCount();
    }
}

const std::vector<Point>& Exploer::Path() const
{
    switch (algo_)
    {
    case PathAlgo::BFS:   return std::get<BFSExploer>(impl_).Path();
    case PathAlgo::AStar: return std::get<AStarExploer>(impl_).Path();
    case PathAlgo::DFS:
    default:              return std::get<DFSExploer>(impl_).Path();
    }
}

std::vector<Point> Exploer::Explored() const
{
    switch (algo_)
    {
    case PathAlgo::BFS:   return std::get<BFSExploer>(impl_).Visited();
    case PathAlgo::AStar: return std::get<AStarExploer>(impl_).Closed();
    case PathAlgo::DFS:
    default:              return std::get<DFSExploer>(impl_).Visited();
    }
}

std::vector<Point> Exploer::Frontier() const
{
    switch (algo_)
    {
    case PathAlgo::BFS:
    {
        const auto& q = std::get<BFSExploer>(impl_).Queue();
        return { q.begin(), q.end() };
    }
    case PathAlgo::AStar:
    {
        std::vector<Point> out;
        for (const auto& kv : std::get<AStarExploer>(impl_).Open()) out.push_back(kv.first);
        return out;
    }
    case PathAlgo::DFS:
    default:
        return std::get<DFSExploer>(impl_).Path();
    }
}
