#include "core/Grid.hpp"
#include "core/MazeError.hpp"

#include <algorithm>
#include <sstream>

Grid::Grid(int32_t width, int32_t height)
{
    if (width <= 0 || height <= 0)
    {
        std::ostringstream msg;
        msg << "grid dimensions must be positive, got " << width << "x" << height;
        throw InvalidDimension(msg.str());
    }

    width_ = width;
    height_ = height;
    cells_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), Cell{});
}

size_t Grid::Index_(const CellCoord& c) const
{
    if (!InBounds(c))
    {
        std::ostringstream msg;
        msg << "cell " << c << " outside " << width_ << "x" << height_ << " grid";
        throw std::out_of_range(msg.str());
    }
    return static_cast<size_t>(c.row) * static_cast<size_t>(width_) + static_cast<size_t>(c.col);
}

const Cell& Grid::At(const CellCoord& c) const
{
    return cells_[Index_(c)];
}

Cell& Grid::MutableAt_(const CellCoord& c)
{
    return cells_[Index_(c)];
}

bool Grid::Neighbor(const CellCoord& c, Direction d, CellCoord& out) const
{
    const CellCoord n{ c.row + RowDelta(d), c.col + ColDelta(d) };
    if (!InBounds(n)) return false;
    out = n;
    return true;
}

bool Grid::IsPerimeter(const CellCoord& c, Direction d) const
{
    if (!InBounds(c)) return false;
    CellCoord unused{};
    return !Neighbor(c, d, unused);
}

void Grid::OpenPassage(const CellCoord& c, Direction d)
{
    CellCoord n{};
    if (!InBounds(c) || !Neighbor(c, d, n))
    {
        std::ostringstream msg;
        msg << "no neighbour " << DirectionName(d) << " of " << c;
        throw std::out_of_range(msg.str());
    }

    MutableAt_(c).walls[DirIndex(d)] = false;
    MutableAt_(n).walls[DirIndex(Opposite(d))] = false;
}

void Grid::OpenBoundaryWall(const CellCoord& c, Direction d)
{
    if (!IsPerimeter(c, d))
    {
        std::ostringstream msg;
        msg << DirectionName(d) << " edge of " << c << " is not on the outer border";
        throw std::out_of_range(msg.str());
    }
    MutableAt_(c).walls[DirIndex(d)] = false;
}

void Grid::MarkVisited(const CellCoord& c)
{
    MutableAt_(c).visited = true;
}

bool Grid::AnyVisited() const
{
    return std::any_of(cells_.begin(), cells_.end(), [](const Cell& cell) { return cell.visited; });
}

size_t Grid::CountPassages() const
{
    // east and south edges only, so every interior edge is seen once
    size_t count = 0;
    for (int32_t r = 0; r < height_; ++r)
    {
        for (int32_t c = 0; c < width_; ++c)
        {
            const Cell& cell = cells_[static_cast<size_t>(r) * width_ + c];
            if (c + 1 < width_ && !cell.HasWall(Direction::East)) ++count;
            if (r + 1 < height_ && !cell.HasWall(Direction::South)) ++count;
        }
    }
    return count;
}

Grid GridBuilder::Build(int32_t width, int32_t height)
{
    return Grid(width, height);
}
