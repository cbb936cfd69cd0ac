#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Grid.hpp"
#include "core/Maze.hpp"

#include <random>

// Called once for every passage opened while carving, in carve order.
using CarveCallback = std::function<void(const CellCoord& from, const CellCoord& to)>;

// Uniform integer in [0, n) drawn from raw 32-bit engine outputs by
// rejection, so results do not depend on the standard library in use.
// n == 1 returns 0 without consuming the engine. Throws std::invalid_argument
// for n == 0.
size_t RandomIndex(std::mt19937& rng, size_t n);

class MazeCarver
{
public:
    explicit MazeCarver(std::mt19937& rng) : rng_(rng) {}

    MazeCarver(const MazeCarver&) = delete;
    MazeCarver& operator=(const MazeCarver&) = delete;

    // Randomized depth-first carve over every cell of grid, starting at start.
    // Leaves exactly CellCount()-1 passages forming a spanning tree.
    // Throws AlreadyCarved if any cell is visited, std::out_of_range for a
    // bad start cell.
    static void Carve(Grid& grid, const CellCoord& start, std::mt19937& rng,
                      const CarveCallback& onCarve = {});

    // Empty -> Building
    void Allocate(Maze& maze, int32_t width, int32_t height);

    // Building -> Carving -> Carved. The default start is the top-left cell.
    void Carve(Maze& maze, const CellCoord& start = CellCoord{0, 0},
               const CarveCallback& onCarve = {});

    // The first call places the entrance, the second the exit (Carved ->
    // Bounded). For a bare side, North/West use the cell nearest the
    // top-left corner and South/East the cell nearest the bottom-right.
    // On a 1x1 grid the exit is the entrance opening: the side-only overload
    // reuses it, the explicit overload throws InvalidBoundary unless cell and
    // side both match the entrance.
    BoundaryOpening OpenBoundary(Maze& maze, Direction side);
    BoundaryOpening OpenBoundary(Maze& maze, const CellCoord& cell, Direction side);

    // Bounded -> Finalized
    void Finalize(Maze& maze);

    // Side-based placement used by OpenBoundary(maze, side).
    static CellCoord PolicyCell(const Grid& grid, Direction side);

private:
    std::mt19937& rng_;
};
