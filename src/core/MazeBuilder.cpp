#include "core/MazeBuilder.hpp"
#include "core/MazeCarver.hpp"
#include "core/MazeError.hpp"

bool MazeBuilder::ParseAlgorithm(const std::string& name, MazeAlgorithm& out)
{
    if (name == "dfs") { out = MazeAlgorithm::DFS; return true; }
    return false;
}

Maze MazeBuilder::GenerateMaze(int32_t width, int32_t height,
                               const std::string& algorithm, uint32_t seed)
{
    std::mt19937 rng(seed);
    Maze maze = GenerateMaze(width, height, algorithm, rng);
    maze.seed_ = seed;
    return maze;
}

Maze MazeBuilder::GenerateMaze(int32_t width, int32_t height,
                               const std::string& algorithm, std::mt19937& rng)
{
    MazeAlgorithm algo{};
    if (!ParseAlgorithm(algorithm, algo))
        throw UnsupportedAlgorithm("unknown maze algorithm '" + algorithm + "'");

    Maze maze;
    MazeCarver carver(rng);

    carver.Allocate(maze, width, height);

    switch (algo)
    {
    case MazeAlgorithm::DFS:
        carver.Carve(maze);
        break;
    }

    carver.OpenBoundary(maze, Direction::North);
    carver.OpenBoundary(maze, Direction::South);
    carver.Finalize(maze);

    return maze;
}
