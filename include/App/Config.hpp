#pragma once
#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"
#include "Exploer/Exploer.hpp"

struct AppConfig
{
    int32_t width{24};
    int32_t height{24};
    std::optional<uint32_t> seed; // random_device when unset

    GenAlgo genAlgo{GenAlgo::Wilson};
    PathAlgo pathAlgo{PathAlgo::DFS};

    std::string mazePath;          // load instead of generating
    std::string outPath{"maze.dat"};
    std::string tracePath;         // solution trace, skipped when empty

    bool live{false};              // one step per frame in the viewer
    bool compare{false};           // run every solver
    bool verbose{false};
    bool help{false};

    // viewer only
    int32_t cellSize{24};
    uint32_t stepsPerSecond{288};
};

// upper bound on width * height for generated mazes (4096 x 4096)
constexpr size_t kMaxCells = size_t(1) << 24;

// empty when the size can be generated, otherwise the reason
std::string CheckMazeSize(int32_t width, int32_t height);

bool ParsePathAlgo(const std::string& s, PathAlgo& out);
bool ParseGenAlgo(const std::string& s, GenAlgo& out);

// Reads argv[1..]. Unknown flags and bad values leave a message in outError.
bool ParseArgs(int argc, const char* const* argv, AppConfig& out, std::string& outError);

std::string Usage(const std::string& program);

uint32_t ResolveSeed(const AppConfig& cfg);
