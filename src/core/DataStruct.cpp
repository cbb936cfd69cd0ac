#include "core/DataStruct.hpp"

const char* DirectionName(Direction d)
{
    switch (d)
    {
    case Direction::North: return "north";
    case Direction::East:  return "east";
    case Direction::South: return "south";
    case Direction::West:  return "west";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& os, const CellCoord& c)
{
    return os << "(" << c.row << ", " << c.col << ")";
}

std::ostream& operator<<(std::ostream& os, const BoundaryOpening& b)
{
    return os << b.cell << " " << DirectionName(b.side);
}
