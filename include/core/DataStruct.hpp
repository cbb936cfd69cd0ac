#pragma once
#include "core/Common.hpp"

enum class Direction : uint8_t
{
    North = 0,
    East = 1,
    South = 2,
    West = 3,
};

constexpr std::array<Direction, 4> kAllDirections = {
    Direction::North, Direction::East, Direction::South, Direction::West
};

inline constexpr int DirIndex(Direction d)
{
    return static_cast<int>(d);
}

inline constexpr Direction Opposite(Direction d)
{
    switch (d)
    {
    case Direction::North: return Direction::South;
    case Direction::East:  return Direction::West;
    case Direction::South: return Direction::North;
    case Direction::West:  return Direction::East;
    }
    return d;
}

// row/col step taken when leaving a cell through the given edge
inline constexpr int32_t RowDelta(Direction d)
{
    return d == Direction::North ? -1 : (d == Direction::South ? 1 : 0);
}

inline constexpr int32_t ColDelta(Direction d)
{
    return d == Direction::West ? -1 : (d == Direction::East ? 1 : 0);
}

const char* DirectionName(Direction d);

struct CellCoord
{
    int32_t row;
    int32_t col;

    bool operator==(const CellCoord& other) const
    {
        return row == other.row && col == other.col;
    }

    bool operator!=(const CellCoord& other) const
    {
        return !(*this == other);
    }
};

std::ostream& operator<<(std::ostream& os, const CellCoord& c);

struct Cell
{
    // indexed by DirIndex(); true = wall, false = passage
    std::array<bool, 4> walls{ true, true, true, true };
    bool visited{false};

    bool HasWall(Direction d) const { return walls[DirIndex(d)]; }

    bool operator==(const Cell& other) const
    {
        return walls == other.walls && visited == other.visited;
    }
};

// An opening through the outer border: the perimeter cell and the side of it
// that faces outside.
struct BoundaryOpening
{
    CellCoord cell{0, 0};
    Direction side{Direction::North};

    bool operator==(const BoundaryOpening& other) const
    {
        return cell == other.cell && side == other.side;
    }

    bool operator!=(const BoundaryOpening& other) const
    {
        return !(*this == other);
    }
};

std::ostream& operator<<(std::ostream& os, const BoundaryOpening& b);
