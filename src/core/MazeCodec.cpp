#include "core/MazeCodec.hpp"

#include <sstream>

std::vector<uint8_t> MazeCodec::Encode(const Maze& maze)
{
    if (maze.Width() > 0xFFFF)
        throw InvalidSize("maze width " + std::to_string(maze.Width()) + " too large to encode");

    const auto& cells = maze.Cells();
    const uint16_t width = (uint16_t)maze.Width();

    std::vector<uint8_t> data;
    data.reserve(2 + (cells.size() + 1) / 2);
    data.push_back((uint8_t)(width >> 8));
    data.push_back((uint8_t)(width & 0xFF));

    for (size_t i = 0; i < cells.size(); i += 2)
    {
        const uint8_t hi = cells[i] & 0x0F;
        const uint8_t lo = (i + 1 < cells.size()) ? (cells[i + 1] & 0x0F) : 0;
        data.push_back((uint8_t)(hi << 4 | lo));
    }

    return data;
}

Maze MazeCodec::Decode(const std::vector<uint8_t>& bytes)
{
    if (bytes.size() < 3)
        throw MalformedEncoding("maze data truncated: " + std::to_string(bytes.size()) + " bytes");

    const size_t width = ((size_t)bytes[0] << 8) | (size_t)bytes[1];
    if (width == 0)
        throw MalformedEncoding("maze width is zero");

    const size_t packed = bytes.size() - 2;
    const size_t full = packed * 2;
    const bool lastNibbleZero = (bytes.back() & 0x0F) == 0;

    size_t cellCount = full;
    if (lastNibbleZero && (full - 1) % width == 0)
        cellCount = full - 1;

    if (cellCount % width != 0)
    {
        std::ostringstream ss;
        ss << cellCount << " cells do not fill rows of width " << width;
        throw MalformedEncoding(ss.str());
    }

    std::vector<uint8_t> cells;
    cells.reserve(cellCount);
    for (size_t i = 0; i < packed; ++i)
    {
        const uint8_t pair = bytes[2 + i];
        cells.push_back(pair >> 4);
        if (i * 2 + 1 < cellCount)
            cells.push_back(pair & 0x0F);
    }

    return Maze((int32_t)width, (int32_t)(cellCount / width), std::move(cells));
}

std::string MazeCodec::EncodeTrace(const std::vector<Point>& path)
{
    std::string out;
    if (path.size() < 2) return out;

    out.reserve(path.size() - 1);
    for (size_t i = 0; i + 1 < path.size(); ++i)
    {
        const auto dir = DirectionBetween(path[i], path[i + 1]);
        if (!dir)
        {
            std::ostringstream ss;
            ss << "path step " << i << " from " << path[i] << " to " << path[i + 1]
               << " is not a single move";
            throw MalformedEncoding(ss.str());
        }
        out.push_back(DirectionChar(*dir));
    }
    return out;
}

std::vector<Point> MazeCodec::DecodeTrace(const std::string& trace, Point start)
{
    std::vector<Point> path;
    path.reserve(trace.size() + 1);
    path.push_back(start);

    for (size_t i = 0; i < trace.size(); ++i)
    {
        const auto dir = DirectionFromChar(trace[i]);
        if (!dir)
        {
            std::ostringstream ss;
            ss << "unknown trace character '" << trace[i] << "' at " << i;
            throw MalformedEncoding(ss.str());
        }
        path.push_back(Travel(*dir, path.back()));
    }
    return path;
}
