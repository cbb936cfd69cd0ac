#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

#include <random>

enum class MazeAlgorithm
{
    DFS,
};

class MazeBuilder
{
public:
    // Exact, case-sensitive match. Returns false for unknown names.
    static bool ParseAlgorithm(const std::string& name, MazeAlgorithm& out);

    // Allocates, carves from the top-left cell, opens the entrance (north
    // side of the top-left cell) and exit (south side of the bottom-right
    // cell) and finalizes. The algorithm name is checked before anything is
    // allocated.
    static Maze GenerateMaze(int32_t width, int32_t height,
                             const std::string& algorithm, uint32_t seed);

    static Maze GenerateMaze(int32_t width, int32_t height,
                             const std::string& algorithm, std::mt19937& rng);
};
