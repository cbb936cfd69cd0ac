#include "core/MazeCarver.hpp"
#include "core/MazeError.hpp"

#include <cstdlib>
#include <sstream>

size_t RandomIndex(std::mt19937& rng, size_t n)
{
    if (n == 0)
        throw std::invalid_argument("RandomIndex: empty range");
    if (n == 1)
        return 0;

    constexpr uint64_t kRange = uint64_t{1} << 32;
    const uint64_t limit = kRange - (kRange % n);

    uint64_t v = 0;
    do {
        v = static_cast<uint64_t>(rng()) & 0xFFFFFFFFull;
    } while (v >= limit);

    return static_cast<size_t>(v % n);
}

void MazeCarver::Carve(Grid& grid, const CellCoord& start, std::mt19937& rng,
                       const CarveCallback& onCarve)
{
    if (grid.AnyVisited())
        throw AlreadyCarved("grid already has visited cells");

    // throws std::out_of_range for a bad start
    (void)grid.At(start);

    std::vector<CellCoord> st;
    st.reserve(grid.CellCount());

    grid.MarkVisited(start);
    st.push_back(start);

    std::array<Direction, 4> open{};

    while (!st.empty())
    {
        const CellCoord cur = st.back();

        // unvisited neighbours, always collected in N, E, S, W order
        size_t count = 0;
        for (Direction d : kAllDirections)
        {
            CellCoord n{};
            if (grid.Neighbor(cur, d, n) && !grid.At(n).visited)
                open[count++] = d;
        }

        if (count == 0)
        {
            st.pop_back();
            continue;
        }

        const Direction dir = open[RandomIndex(rng, count)];
        const CellCoord next{ cur.row + RowDelta(dir), cur.col + ColDelta(dir) };

        grid.OpenPassage(cur, dir);
        grid.MarkVisited(next);
        if (onCarve) onCarve(cur, next);

        st.push_back(next);
    }
}

void MazeCarver::Allocate(Maze& maze, int32_t width, int32_t height)
{
    if (maze.state_ != MazeState::Empty)
    {
        throw InvalidState(std::string("cannot allocate a grid for a maze in state ")
                           + MazeStateName(maze.state_));
    }

    maze.grid_ = GridBuilder::Build(width, height);
    maze.state_ = MazeState::Building;
}

void MazeCarver::Carve(Maze& maze, const CellCoord& start, const CarveCallback& onCarve)
{
    if (maze.state_ == MazeState::Finalized)
        throw InvalidState("cannot carve a finalized maze");
    if (maze.grid_.AnyVisited())
        throw AlreadyCarved("maze has already been carved");
    if (maze.state_ != MazeState::Building)
    {
        throw InvalidState(std::string("cannot carve a maze in state ")
                           + MazeStateName(maze.state_));
    }
    (void)maze.grid_.At(start);

    maze.state_ = MazeState::Carving;
    Carve(maze.grid_, start, rng_, onCarve);
    maze.state_ = MazeState::Carved;
}

CellCoord MazeCarver::PolicyCell(const Grid& grid, Direction side)
{
    if (grid.Empty())
        throw InvalidState("grid has no cells");

    switch (side)
    {
    case Direction::North:
    case Direction::West:
        return CellCoord{ 0, 0 };
    case Direction::South:
    case Direction::East:
        break;
    }
    return CellCoord{ grid.Height() - 1, grid.Width() - 1 };
}

BoundaryOpening MazeCarver::OpenBoundary(Maze& maze, Direction side)
{
    if (maze.state_ != MazeState::Carved)
    {
        throw InvalidState(std::string("boundaries can only be opened on a carved maze, state is ")
                           + MazeStateName(maze.state_));
    }
    // 1x1: the exit reuses the entrance, whatever side was asked for
    if (maze.hasEntrance_ && maze.grid_.CellCount() == 1)
        return OpenBoundary(maze, maze.entrance_.cell, maze.entrance_.side);

    return OpenBoundary(maze, PolicyCell(maze.grid_, side), side);
}

BoundaryOpening MazeCarver::OpenBoundary(Maze& maze, const CellCoord& cell, Direction side)
{
    if (maze.state_ != MazeState::Carved)
    {
        throw InvalidState(std::string("boundaries can only be opened on a carved maze, state is ")
                           + MazeStateName(maze.state_));
    }

    Grid& grid = maze.grid_;
    if (!grid.IsPerimeter(cell, side))
    {
        std::ostringstream msg;
        msg << DirectionName(side) << " edge of " << cell << " is not an outer wall";
        throw InvalidBoundary(msg.str());
    }

    const BoundaryOpening opening{ cell, side };

    if (!maze.hasEntrance_)
    {
        grid.OpenBoundaryWall(cell, side);
        maze.entrance_ = opening;
        maze.hasEntrance_ = true;
        return opening;
    }

    const CellCoord& in = maze.entrance_.cell;
    const size_t cells = grid.CellCount();

    if (cell == in)
    {
        if (cells > 1)
        {
            std::ostringstream msg;
            msg << "exit " << opening << " shares the entrance cell";
            throw InvalidBoundary(msg.str());
        }
        // 1x1: the single opening serves as both entrance and exit
        if (side != maze.entrance_.side)
        {
            std::ostringstream msg;
            msg << "exit " << opening << " on a single-cell grid must reuse the entrance "
                << maze.entrance_;
            throw InvalidBoundary(msg.str());
        }
        maze.exit_ = maze.entrance_;
    }
    else
    {
        const int32_t dist = std::abs(cell.row - in.row) + std::abs(cell.col - in.col);
        if (dist == 1 && cells > 2)
        {
            std::ostringstream msg;
            msg << "exit " << opening << " is adjacent to the entrance " << maze.entrance_;
            throw InvalidBoundary(msg.str());
        }
        grid.OpenBoundaryWall(cell, side);
        maze.exit_ = opening;
    }

    maze.hasExit_ = true;
    maze.state_ = MazeState::Bounded;
    return maze.exit_;
}

void MazeCarver::Finalize(Maze& maze)
{
    if (maze.state_ != MazeState::Bounded)
    {
        throw InvalidState(std::string("only a bounded maze can be finalized, state is ")
                           + MazeStateName(maze.state_));
    }
    maze.state_ = MazeState::Finalized;
}
