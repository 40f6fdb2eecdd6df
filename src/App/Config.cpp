#include "App/Config.hpp"

#include <cctype>
#include <random>
#include <sstream>

static std::string lower_(const std::string& s)
{
    std::string t;
    t.reserve(s.size());
    for (unsigned char ch : s) t.push_back((char)std::tolower(ch));
    return t;
}

std::string CheckMazeSize(int32_t width, int32_t height)
{
    std::ostringstream ss;
    if (width <= 0 || height <= 0) {
        ss << "maze size " << width << "x" << height << " must be positive";
        return ss.str();
    }
    if ((size_t)width * (size_t)height > kMaxCells) {
        ss << "maze size " << width << "x" << height << " exceeds " << kMaxCells << " cells";
        return ss.str();
    }
    return {};
}

bool ParsePathAlgo(const std::string& s, PathAlgo& out)
{
    const std::string t = lower_(s);
    if (t == "dfs") { out = PathAlgo::DFS; return true; }
    if (t == "bfs") { out = PathAlgo::BFS; return true; }
    if (t == "a-star" || t == "astar" || t == "a*") { out = PathAlgo::AStar; return true; }
    return false;
}

bool ParseGenAlgo(const std::string& s, GenAlgo& out)
{
    const std::string t = lower_(s);
    if (t == "wilson") { out = GenAlgo::Wilson; return true; }
    if (t == "backtrack" || t == "dfs") { out = GenAlgo::Backtrack; return true; }
    return false;
}

static bool parseInt_(const std::string& s, long long lo, long long hi, long long& out)
{
    if (s.empty()) return false;
    try {
        size_t used = 0;
        const long long v = std::stoll(s, &used);
        if (used != s.size() || v < lo || v > hi) return false;
        out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

bool ParseArgs(int argc, const char* const* argv, AppConfig& out, std::string& outError)
{
    outError.clear();

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        auto value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                outError = "missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        auto number = [&](long long lo, long long hi, long long& dst) -> bool {
            std::string v;
            if (!value(v)) return false;
            if (!parseInt_(v, lo, hi, dst)) {
                std::ostringstream ss;
                ss << "bad value '" << v << "' for " << arg << " (expected " << lo << ".." << hi << ")";
                outError = ss.str();
                return false;
            }
            return true;
        };

        long long n = 0;
        std::string v;

        if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else if (arg == "-m" || arg == "--maze") {
            if (!value(out.mazePath)) return false;
        } else if (arg == "-o" || arg == "--out") {
            if (!value(out.outPath)) return false;
        } else if (arg == "--trace") {
            if (!value(out.tracePath)) return false;
        } else if (arg == "-d" || arg == "--debug") {
            out.live = true;
        } else if (arg == "--compare") {
            out.compare = true;
        } else if (arg == "-v" || arg == "--verbose") {
            out.verbose = true;
        } else if (arg == "--alg") {
            if (!value(v)) return false;
            if (!ParsePathAlgo(v, out.pathAlgo)) {
                outError = "unknown algorithm '" + v + "' (dfs, bfs, a-star)";
                return false;
            }
        } else if (arg == "--gen") {
            if (!value(v)) return false;
            if (!ParseGenAlgo(v, out.genAlgo)) {
                outError = "unknown generator '" + v + "' (wilson, backtrack)";
                return false;
            }
        } else if (arg == "-W" || arg == "--width") {
            if (!number(1, 0xFFFF, n)) return false;
            out.width = (int32_t)n;
        } else if (arg == "-H" || arg == "--height") {
            if (!number(1, 0xFFFF, n)) return false;
            out.height = (int32_t)n;
        } else if (arg == "--seed") {
            if (!number(0, 0xFFFFFFFFLL, n)) return false;
            out.seed = (uint32_t)n;
        } else if (arg == "--cell-size") {
            if (!number(2, 256, n)) return false;
            out.cellSize = (int32_t)n;
        } else if (arg == "--sps") {
            if (!number(1, 100000, n)) return false;
            out.stepsPerSecond = (uint32_t)n;
        } else {
            outError = "unknown option '" + arg + "'";
            return false;
        }
    }

    // a loaded maze brings its own size
    if (out.mazePath.empty()) {
        outError = CheckMazeSize(out.width, out.height);
        if (!outError.empty()) return false;
    }
    return true;
}

std::string Usage(const std::string& program)
{
    std::ostringstream ss;
    ss << "usage: " << program << " [options]\n"
       << "  -m, --maze <file>     load an encoded maze instead of generating one\n"
       << "  -o, --out <file>      where to write the encoded maze (default maze.dat)\n"
       << "      --trace <file>    write the solution as U/D/L/R moves\n"
       << "  -W, --width <n>       maze width in cells (default 24)\n"
       << "  -H, --height <n>      maze height in cells (default 24)\n"
       << "      --seed <n>        generator seed\n"
       << "      --gen <name>      wilson | backtrack\n"
       << "      --alg <name>      dfs | bfs | a-star\n"
       << "      --compare         run dfs, bfs and a-star\n"
       << "  -d, --debug           show generation and solving live (viewer)\n"
       << "      --cell-size <px>  viewer cell size\n"
       << "      --sps <n>         live steps per second (viewer)\n"
       << "  -v, --verbose         print step counts and timings\n"
       << "  -h, --help            show this text\n";
    return ss.str();
}

uint32_t ResolveSeed(const AppConfig& cfg)
{
    if (cfg.seed) return *cfg.seed;
    std::random_device rd;
    return rd();
}
