#pragma once
#include "core/Common.hpp"

enum class MazeErrc
{
    OutOfBounds,
    MalformedEncoding,
    InvalidSize,
};

class MazeError : public std::runtime_error
{
public:
    MazeError(MazeErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    MazeErrc code() const noexcept { return code_; }

private:
    MazeErrc code_;
};

// coordinate >= dimension (or negative)
class OutOfBounds : public MazeError
{
public:
    explicit OutOfBounds(const std::string& what)
        : MazeError(MazeErrc::OutOfBounds, what) {}
};

// truncated buffer, zero width, cell count not a whole number of rows, bad trace
class MalformedEncoding : public MazeError
{
public:
    explicit MalformedEncoding(const std::string& what)
        : MazeError(MazeErrc::MalformedEncoding, what) {}
};

class InvalidSize : public MazeError
{
public:
    explicit InvalidSize(const std::string& what)
        : MazeError(MazeErrc::InvalidSize, what) {}
};
