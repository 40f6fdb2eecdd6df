#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

#include <random>
#include <unordered_map>
#include <variant>

enum class GenAlgo
{
    Wilson = 0,    // loop-erased random walk, uniform spanning tree
    Backtrack = 1, // randomized depth-first backtracker
};

// Wilson's algorithm, one walk move per Step().
class WilsonGenerator
{
public:
    WilsonGenerator(std::pair<int32_t, int32_t> bounds, uint32_t seed);

    // Returns true once every cell is part of the tree; stays true afterwards.
    bool Step(Maze& maze);

    const std::vector<Point>& Walk() const { return walk_; }
    const std::optional<Point>& FirstWalkTarget() const { return firstWalkTarget_; }

private:
    void commitWalk_(Maze& maze);
    bool startNewWalk_(const Maze& maze); // true when no uncarved cell is left
    void truncateWalk_(size_t keep);
    void pushWalk_(const Point& p);
    uint32_t key_(const Point& p) const { return (uint32_t)p.y * (uint32_t)width_ + (uint32_t)p.x; }

    int32_t width_{0};
    int32_t height_{0};
    bool strip_{false}; // one cell wide in either direction
    std::mt19937 rng_;

    std::vector<Point> walk_;
    std::unordered_map<uint32_t, size_t> walkIndex_; // cell -> offset in walk_
    std::optional<Point> firstWalkTarget_;
    std::optional<Direction> lastDirection_;
};

// Recursive backtracker on an explicit stack, one carve or pop per Step().
class BacktrackGenerator
{
public:
    BacktrackGenerator(std::pair<int32_t, int32_t> bounds, uint32_t seed);

    bool Step(Maze& maze);

    const std::vector<Point>& Stack() const { return stack_; }

private:
    std::mt19937 rng_;
    std::vector<Point> stack_;
};

class MazeGenerator
{
public:
    MazeGenerator(GenAlgo algo, std::pair<int32_t, int32_t> bounds, uint32_t seed);

    // Advances generation by one move; true when the maze is complete.
    bool Step(Maze& maze);

    GenAlgo Algo() const { return algo_; }

    // cells of the walk (Wilson) or stack (Backtrack) in progress
    const std::vector<Point>& Trail() const;
    std::optional<Point> Target() const;

private:
    GenAlgo algo_;
    std::variant<WilsonGenerator, BacktrackGenerator> impl_;
};

class MazeBuilder
{
public:
    // Runs a generator to completion on a fresh width x height grid.
    // onUpdate, when set, sees the grid after every step.
    static Maze Build(
        int32_t width,
        int32_t height,
        uint32_t seed,
        GenAlgo algo = GenAlgo::Wilson,
        const std::function<void(const Maze&, const MazeGenerator&)>& onUpdate = nullptr,
        size_t* outSteps = nullptr
    );
};
