#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

// Fixed-size rectangular lattice of cells stored row-major. All wall edits go
// through OpenPassage / OpenBoundaryWall so the two sides of a shared wall
// never disagree.
class Grid
{
public:
    Grid() = default;

    // Fully walled, nothing visited. Throws InvalidDimension unless both
    // sizes are >= 1.
    Grid(int32_t width, int32_t height);

    int32_t Width() const noexcept { return width_; }
    int32_t Height() const noexcept { return height_; }
    size_t CellCount() const noexcept { return cells_.size(); }
    bool Empty() const noexcept { return cells_.empty(); }

    bool InBounds(int32_t row, int32_t col) const
    {
        return row >= 0 && col >= 0 && row < height_ && col < width_;
    }

    bool InBounds(const CellCoord& c) const { return InBounds(c.row, c.col); }

    // throws std::out_of_range
    const Cell& At(const CellCoord& c) const;
    const Cell& At(int32_t row, int32_t col) const { return At(CellCoord{row, col}); }

    bool HasWall(const CellCoord& c, Direction d) const { return At(c).HasWall(d); }

    // false when stepping through d leaves the grid
    bool Neighbor(const CellCoord& c, Direction d, CellCoord& out) const;

    // true when the edge d of c is part of the outer border
    bool IsPerimeter(const CellCoord& c, Direction d) const;

    // Removes the wall between c and its neighbour across d on both cells.
    // Throws std::out_of_range for a border edge.
    void OpenPassage(const CellCoord& c, Direction d);

    // Removes an outward-facing border wall. Throws std::out_of_range when
    // the edge is interior.
    void OpenBoundaryWall(const CellCoord& c, Direction d);

    void MarkVisited(const CellCoord& c);
    bool AnyVisited() const;

    // number of open interior edges, each counted once
    size_t CountPassages() const;

    bool operator==(const Grid& other) const
    {
        return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
    }

private:
    size_t Index_(const CellCoord& c) const;
    Cell& MutableAt_(const CellCoord& c);

    int32_t width_{0};
    int32_t height_{0};
    std::vector<Cell> cells_;
};

class GridBuilder
{
public:
    static Grid Build(int32_t width, int32_t height);
};
