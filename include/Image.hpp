#pragma once
#include <cstdint>
#include <memory>
#include <vector>

// Decoded raster in packed 0xAARRGGBB pixels, row-major.
struct Image
{
    int width = 0;
    int height = 0;
    std::vector<std::uint32_t> pixels;

    Image() = default;
    Image(int w, int h, std::uint32_t fill = 0)
        : width(w), height(h), pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), fill)
    {
    }

    std::uint32_t at(int x, int y) const { return pixels[static_cast<std::size_t>(y) * width + x]; }
    void set(int x, int y, std::uint32_t argb) { pixels[static_cast<std::size_t>(y) * width + x] = argb; }
};

// Images are shared read-only between the submitter and the worker that scales them.
using ImagePtr = std::shared_ptr<const Image>;
