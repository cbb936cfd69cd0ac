#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

#include <limits>

// 8-bit grayscale image, row-major, one byte per pixel.
struct Raster
{
    int32_t width{0};
    int32_t height{0};
    std::vector<uint8_t> pixels;

    uint8_t At(int32_t x, int32_t y) const
    {
        return pixels[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)];
    }
};

constexpr uint8_t kWallPixel = 0;
constexpr uint8_t kPassagePixel = 255;
constexpr int32_t kDefaultCellSize = 10;
constexpr int32_t kMinCellSize = 2;

// largest image side in pixels; also the PNG format limit (2^31 - 1)
constexpr int64_t kMaxImageSide = std::numeric_limits<int32_t>::max();

class Rasterizer
{
public:
    // Cell (row, col) covers the pixel square [col*cellSize, (col+1)*cellSize]
    // x [row*cellSize, (row+1)*cellSize]; its border lines are black where a
    // wall is closed. Lattice corners are always black. The result is
    // (width*cellSize+1) x (height*cellSize+1) pixels; cellSize 2 gives one
    // pixel per cell and per wall.
    // Throws InvalidState for an unfinished maze, std::invalid_argument for
    // cellSize < kMinCellSize and std::length_error when a side would exceed
    // kMaxImageSide. Nothing is allocated before these checks.
    static Raster Rasterize(const Maze& maze, int32_t cellSize = kDefaultCellSize);

    // "+---+" style text drawing, one text row per wall line and cell row.
    static std::string RenderAscii(const Maze& maze);
};
