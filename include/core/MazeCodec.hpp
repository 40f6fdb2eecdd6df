#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

#include <string>

// Binary maze format:
//   [width: u16 big-endian][cells, two per byte, first in the high nibble]
// An odd cell count leaves the final low nibble zero.
//
// Solution trace: one ASCII letter (U, D, L, R) per move along a path.
class MazeCodec
{
public:
    // throws InvalidSize when the width does not fit in 16 bits
    static std::vector<uint8_t> Encode(const Maze& maze);

    // Throws MalformedEncoding on a buffer shorter than 3 bytes, a zero width or
    // a cell count that is not a whole number of rows.
    //
    // A zero final low nibble is read as padding only when that is the reading
    // that yields whole rows. Both readings yield whole rows only for width 1;
    // there the nibble is taken as padding, so a one-column maze whose cell count
    // is even and whose last cell is fully walled comes back one row shorter.
    static Maze Decode(const std::vector<uint8_t>& bytes);

    // throws MalformedEncoding when two consecutive points are not adjacent
    static std::string EncodeTrace(const std::vector<Point>& path);

    // throws MalformedEncoding on a character outside U, D, L, R
    static std::vector<Point> DecodeTrace(const std::string& trace, Point start = { 0, 0 });
};
