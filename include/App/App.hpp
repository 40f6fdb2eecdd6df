#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"
#include "App/Config.hpp"

enum ExitCode : int
{
    kExitOk = 0,
    kExitUsage = 1,   // bad arguments or file I/O
    kExitMaze = 2,    // undecodable maze or no route
};

bool ReadFileBytes(const std::string& path, std::vector<uint8_t>& out, std::string& outError);
bool WriteFileBytes(const std::string& path, const std::vector<uint8_t>& data, std::string& outError);

// Decodes cfg.mazePath; throws MalformedEncoding on bad content.
bool LoadMaze(const AppConfig& cfg, Maze& out, std::string& outError);

bool SaveMaze(const std::string& path, const Maze& maze, std::string& outError);

// Headless run: load or generate, solve, write outputs. Returns an ExitCode.
int runApp(const AppConfig& cfg, std::ostream& out = std::cout, std::ostream& err = std::cerr);
