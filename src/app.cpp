#include "core/Common.hpp"
#include "core/MazeBuilder.hpp"
#include "core/MazeCodec.hpp"
#include "core/PathFinder.hpp"
#include "Thread/ThreadPool.hpp"
#include "App/App.hpp"

#include <chrono>
#include <fstream>
#include <iterator>

bool ReadFileBytes(const std::string& path, std::vector<uint8_t>& out, std::string& outError)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        outError = "cannot open " + path;
        return false;
    }

    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        outError = "read failed: " + path;
        return false;
    }
    return true;
}

bool WriteFileBytes(const std::string& path, const std::vector<uint8_t>& data, std::string& outError)
{
    std::ofstream o(path, std::ios::binary | std::ios::trunc);
    if (!o) {
        outError = "cannot open " + path + " for writing";
        return false;
    }

    o.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
    if (!o) {
        outError = "write failed: " + path;
        return false;
    }
    return true;
}

bool LoadMaze(const AppConfig& cfg, Maze& out, std::string& outError)
{
    std::vector<uint8_t> bytes;
    if (!ReadFileBytes(cfg.mazePath, bytes, outError))
        return false;

    out = MazeCodec::Decode(bytes);
    return true;
}

bool SaveMaze(const std::string& path, const Maze& maze, std::string& outError)
{
    return WriteFileBytes(path, MazeCodec::Encode(maze), outError);
}

static void printResult_(std::ostream& out, const PathFinder::Result& r, bool verbose)
{
    out << PathAlgoName(r.algo) << ": ";
    if (r.found)
        out << "path " << r.path.size() << " cells, visited " << r.visited;
    else
        out << r.error;

    if (verbose)
        out << ", " << r.steps << " steps in " << r.elapsed.count() << " us";
    out << "\n";
}

int runApp(const AppConfig& cfg, std::ostream& out, std::ostream& err)
{
    Maze maze;
    std::string error;

    try
    {
        if (!cfg.mazePath.empty())
        {
            if (!LoadMaze(cfg, maze, error)) {
                err << error << "\n";
                return kExitUsage;
            }
            out << "Loaded " << maze.Width() << "x" << maze.Height() << " maze from " << cfg.mazePath << "\n";
        }
        else
        {
            const std::string sizeError = CheckMazeSize(cfg.width, cfg.height);
            if (!sizeError.empty()) {
                err << sizeError << "\n";
                return kExitUsage;
            }

            const uint32_t seed = ResolveSeed(cfg);
            size_t steps = 0;

            auto startTime = std::chrono::steady_clock::now();
            maze = MazeBuilder::Build(cfg.width, cfg.height, seed, cfg.genAlgo, nullptr, &steps);
            auto endTime = std::chrono::steady_clock::now();

            out << "Generated " << maze.Width() << "x" << maze.Height() << " maze, seed=" << seed << "\n";
            if (cfg.verbose)
            {
                out << "  " << steps << " generator steps in "
                    << std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count()
                    << " ms, " << maze.PassageCount() << " passages\n";
            }
        }
    }
    catch (const MalformedEncoding& e)
    {
        err << "Could not decode " << cfg.mazePath << ": " << e.what() << "\n";
        return kExitMaze;
    }
    catch (const MazeError& e)
    {
        err << e.what() << "\n";
        return kExitUsage;
    }

    PathFinder::Result chosen;

    if (cfg.compare)
    {
        ThreadPool pool(3);
        const auto all = PathFinder::FindAll(maze, pool);
        for (const auto& r : all)
        {
            printResult_(out, r, cfg.verbose);
            if (r.algo == cfg.pathAlgo) chosen = r;
        }
    }
    else
    {
        chosen = PathFinder::Run(maze, cfg.pathAlgo);
        printResult_(out, chosen, cfg.verbose);
    }

    if (!SaveMaze(cfg.outPath, maze, error)) {
        err << "Could not write maze data: " << error << "\n";
        return kExitUsage;
    }
    out << "Wrote maze data to " << cfg.outPath << "\n";

    if (!chosen.found)
        return kExitMaze;

    if (!cfg.tracePath.empty())
    {
        const std::string trace = MazeCodec::EncodeTrace(chosen.path);
        if (!WriteFileBytes(cfg.tracePath, std::vector<uint8_t>(trace.begin(), trace.end()), error)) {
            err << "Could not write solution: " << error << "\n";
            return kExitUsage;
        }
        out << "Wrote solution to " << cfg.tracePath << "\n";
    }

    return kExitOk;
}
