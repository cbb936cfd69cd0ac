#include "Export/PngWriter.hpp"

#include <png.h>

#include <cerrno>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <memory>

std::string PngWriter::WithPngExtension(const std::string& path)
{
    static const std::string ext = ".png";
    if (path.size() >= ext.size()
        && path.compare(path.size() - ext.size(), ext.size(), ext) == 0)
        return path;
    return path + ext;
}

// libpng error/warning hooks; the error text is kept for the exception
static void OnPngError_(png_structp png, png_const_charp msg)
{
    if (auto* out = static_cast<std::string*>(png_get_error_ptr(png)))
        *out = msg;
    png_longjmp(png, 1);
}

static void OnPngWarning_(png_structp, png_const_charp msg)
{
    std::cerr << "mazegen: libpng warning: " << msg << "\n";
}

void PngWriter::WriteRaster(const Raster& img, const std::string& path)
{
    if (img.width <= 0 || img.height <= 0
        || img.pixels.size() != static_cast<size_t>(img.width) * static_cast<size_t>(img.height))
        throw std::invalid_argument("raster size does not match its pixel buffer");

    FILE* fp = std::fopen(path.c_str(), "wb");
    if (!fp)
        throw std::runtime_error("cannot open '" + path + "' for writing: " + std::strerror(errno));

    // heap-held: automatic objects must not change between setjmp and longjmp
    const auto pngError = std::make_unique<std::string>();
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, pngError.get(),
                                              OnPngError_, OnPngWarning_);
    if (!png)
    {
        std::fclose(fp);
        throw std::runtime_error("png_create_write_struct failed");
    }

    png_infop info = png_create_info_struct(png);
    if (!info)
    {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        throw std::runtime_error("png_create_info_struct failed");
    }

    std::vector<png_bytep> rows(static_cast<size_t>(img.height));
    for (int32_t y = 0; y < img.height; ++y)
    {
        rows[static_cast<size_t>(y)] = const_cast<png_bytep>(
            img.pixels.data() + static_cast<size_t>(y) * static_cast<size_t>(img.width));
    }

    // libpng reports errors by longjmp back here
    if (setjmp(png_jmpbuf(png)))
    {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        std::remove(path.c_str());
        throw std::runtime_error("libpng error while writing '" + path + "': "
                                 + (pngError->empty() ? std::string("unknown") : *pngError));
    }

    png_init_io(png, fp);
    // the default user limit is 1000000 px per side; allow the full format range
    png_set_user_limits(png, static_cast<png_uint_32>(kMaxImageSide), static_cast<png_uint_32>(kMaxImageSide));
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(img.width), static_cast<png_uint_32>(img.height),
                 8, PNG_COLOR_TYPE_GRAY, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);

    png_destroy_write_struct(&png, &info);

    if (std::fclose(fp) != 0)
    {
        const std::string reason = std::strerror(errno);
        std::remove(path.c_str());
        throw std::runtime_error("error closing '" + path + "': " + reason);
    }
}

std::string PngWriter::SavePNG(const Maze& maze, const std::string& path, int32_t cellSize)
{
    const Raster img = Rasterizer::Rasterize(maze, cellSize);
    const std::string out = WithPngExtension(path);
    WriteRaster(img, out);
    return out;
}
