#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

#include <deque>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <variant>

enum class ExploreState
{
    Exploring,
    Found,
    NoPath
};

enum class PathAlgo : int
{
    DFS = 0,
    BFS = 1,
    AStar = 2
};

const char* PathAlgoName(PathAlgo algo);

// All solvers walk from (0,0) to (width-1, height-1) and only read the maze.
// Step() returns the finished path, or nullptr while the search is pending.
// Once found, every further Step() returns the same path.

// DFS
class DFSExploer
{
public:
    explicit DFSExploer(std::pair<int32_t, int32_t> bounds);

    const std::vector<Point>* Step(const Maze& maze);

    ExploreState State() const { return state_; }
    const std::string& Error() const { return error_; }
    uint32_t TimeStep() const { return timeStep_; }
    size_t VisitedCount() const { return visited_.size(); }

    // current route from the start; the final path once found
    const std::vector<Point>& Path() const { return path_; }
    std::vector<Point> Visited() const;

private:
    std::unordered_set<uint32_t> visited_;
    std::vector<Point> path_;
    Point end_;
    int32_t width_{0};

    ExploreState state_{ExploreState::Exploring};
    std::string error_;
    uint32_t timeStep_{0};
};

// BFS
class BFSExploer
{
public:
    explicit BFSExploer(std::pair<int32_t, int32_t> bounds);

    const std::vector<Point>* Step(const Maze& maze);

    ExploreState State() const { return state_; }
    const std::string& Error() const { return error_; }
    uint32_t TimeStep() const { return timeStep_; }
    size_t VisitedCount() const { return visited_.size(); }

    const std::deque<Point>& Queue() const { return queue_; }
    const std::vector<Point>& Path() const { return path_; }
    std::vector<Point> Visited() const;

private:
    std::deque<Point> queue_;
    std::unordered_map<uint32_t, std::optional<Point>> visited_; // cell -> predecessor
    std::vector<Point> path_;
    bool finished_{false};
    Point end_;
    int32_t width_{0};

    ExploreState state_{ExploreState::Exploring};
    std::string error_;
    uint32_t timeStep_{0};
};

// A*
//
// The frontier is ordered by (cost, heuristic). The heuristic of a candidate is the
// Manhattan distance from the cell it was discovered from, not from the candidate
// itself, and entries already in the frontier are never re-costed.
class AStarExploer
{
public:
    struct CellInfo
    {
        int32_t cost;
        int32_t heuristic;
        std::optional<Point> from;
    };

    explicit AStarExploer(std::pair<int32_t, int32_t> bounds);

    const std::vector<Point>* Step(const Maze& maze);

    ExploreState State() const { return state_; }
    const std::string& Error() const { return error_; }
    uint32_t TimeStep() const { return timeStep_; }
    size_t VisitedCount() const { return closed_.size(); }

    const std::map<Point, CellInfo>& Open() const { return open_; }
    const std::vector<Point>& Path() const { return path_; }
    std::vector<Point> Closed() const;

private:
    std::map<Point, CellInfo> open_;
    std::unordered_map<uint32_t, std::pair<Point, CellInfo>> closed_;
    std::vector<Point> path_;
    Point end_;
    int32_t width_{0};

    ExploreState state_{ExploreState::Exploring};
    std::string error_;
    uint32_t timeStep_{0};
};

// Closed set of solvers, dispatched with a switch on the algorithm.
class Exploer
{
public:
    Exploer(PathAlgo algo, std::pair<int32_t, int32_t> bounds);

    const std::vector<Point>* Step(const Maze& maze);

    PathAlgo Algo() const { return algo_; }
    ExploreState State() const;
    const std::string& Error() const;
    uint32_t TimeStep() const;
    size_t VisitedCount() const;
    const std::vector<Point>& Path() const;

    // cells the solver has settled, for drawing
    std::vector<Point> Explored() const;
    // cells waiting to be expanded, for drawing
    std::vector<Point> Frontier() const;

private:
    PathAlgo algo_;
    std::variant<DFSExploer, BFSExploer, AStarExploer> impl_;
};
