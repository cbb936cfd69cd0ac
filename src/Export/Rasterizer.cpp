#include "Export/Rasterizer.hpp"
#include "core/MazeError.hpp"

#include <sstream>

static void RequireFinalized_(const Maze& maze)
{
    if (!maze.IsFinalized())
    {
        throw InvalidState(std::string("cannot render a maze in state ")
                           + MazeStateName(maze.State()));
    }
}

Raster Rasterizer::Rasterize(const Maze& maze, int32_t cellSize)
{
    RequireFinalized_(maze);
    if (cellSize < kMinCellSize)
    {
        std::ostringstream msg;
        msg << "cell size must be at least " << kMinCellSize << ", got " << cellSize;
        throw std::invalid_argument(msg.str());
    }

    const Grid& grid = maze.GetGrid();
    const int32_t W = grid.Width();
    const int32_t H = grid.Height();

    const int64_t imgW = static_cast<int64_t>(W) * cellSize + 1;
    const int64_t imgH = static_cast<int64_t>(H) * cellSize + 1;
    if (imgW > kMaxImageSide || imgH > kMaxImageSide)
    {
        std::ostringstream msg;
        msg << W << "x" << H << " maze at " << cellSize << " px per cell needs a "
            << imgW << "x" << imgH << " image, larger than " << kMaxImageSide << " px per side";
        throw std::length_error(msg.str());
    }

    // every coordinate below is <= imgW / imgH, so int32_t arithmetic is safe
    Raster img;
    img.width = static_cast<int32_t>(imgW);
    img.height = static_cast<int32_t>(imgH);
    img.pixels.assign(static_cast<size_t>(img.width) * static_cast<size_t>(img.height), kPassagePixel);

    auto put = [&](int32_t x, int32_t y) {
        img.pixels[static_cast<size_t>(y) * static_cast<size_t>(img.width) + static_cast<size_t>(x)] = kWallPixel;
    };

    // corner posts
    for (int32_t r = 0; r <= H; ++r)
        for (int32_t c = 0; c <= W; ++c)
            put(c * cellSize, r * cellSize);

    for (int32_t r = 0; r < H; ++r)
    {
        for (int32_t c = 0; c < W; ++c)
        {
            const Cell& cell = grid.At(r, c);
            const int32_t x0 = c * cellSize;
            const int32_t y0 = r * cellSize;
            const int32_t x1 = x0 + cellSize;
            const int32_t y1 = y0 + cellSize;

            if (cell.HasWall(Direction::North))
                for (int32_t x = x0; x <= x1; ++x) put(x, y0);
            if (cell.HasWall(Direction::South))
                for (int32_t x = x0; x <= x1; ++x) put(x, y1);
            if (cell.HasWall(Direction::West))
                for (int32_t y = y0; y <= y1; ++y) put(x0, y);
            if (cell.HasWall(Direction::East))
                for (int32_t y = y0; y <= y1; ++y) put(x1, y);
        }
    }

    return img;
}

std::string Rasterizer::RenderAscii(const Maze& maze)
{
    RequireFinalized_(maze);

    const Grid& grid = maze.GetGrid();
    std::string out;

    for (int32_t r = 0; r < grid.Height(); ++r)
    {
        std::string top = "+";
        std::string mid;
        for (int32_t c = 0; c < grid.Width(); ++c)
        {
            const Cell& cell = grid.At(r, c);
            top += cell.HasWall(Direction::North) ? "---+" : "   +";
            if (c == 0) mid += cell.HasWall(Direction::West) ? "|" : " ";
            mid += "   ";
            mid += cell.HasWall(Direction::East) ? "|" : " ";
        }
        out += top + "\n" + mid + "\n";
    }

    std::string bottom = "+";
    for (int32_t c = 0; c < grid.Width(); ++c)
        bottom += grid.At(grid.Height() - 1, c).HasWall(Direction::South) ? "---+" : "   +";
    out += bottom + "\n";

    return out;
}
