#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"
#include "Export/Rasterizer.hpp"

class PngWriter
{
public:
    // Renders a finalized maze and writes it as an 8-bit grayscale PNG.
    // ".png" is appended to path when it does not already end with it.
    // Returns the path actually written. Throws InvalidState for an
    // unfinished maze, std::length_error (from Rasterize) for an image side
    // above kMaxImageSide and std::runtime_error when the file cannot be written;
    // a partially written file is removed.
    static std::string SavePNG(const Maze& maze, const std::string& path,
                               int32_t cellSize = kDefaultCellSize);

    static void WriteRaster(const Raster& img, const std::string& path);

    static std::string WithPngExtension(const std::string& path);
};
