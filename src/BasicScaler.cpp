#include "BasicScaler.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace
{
    constexpr int QUALITY_THRESHOLD = 800;
    constexpr int BALANCED_THRESHOLD = 1600;

    std::uint32_t channel(std::uint32_t argb, int shift) { return (argb >> shift) & 0xFFu; }

    std::uint32_t pack(std::uint32_t a, std::uint32_t r, std::uint32_t g, std::uint32_t b)
    {
        return (a << 24) | (r << 16) | (g << 8) | b;
    }
}

ImagePtr BasicScaler::scale(const ImagePtr &src, const ScaleOptions &options) const
{
    if (!src)
        throw std::invalid_argument("src cannot be null");
    if (!isValidDimension(src->width) || !isValidDimension(src->height))
        throw std::invalid_argument("src must have positive dimensions");
    if (src->pixels.size() != static_cast<std::size_t>(src->width) * static_cast<std::size_t>(src->height))
        throw std::invalid_argument("src has " + std::to_string(src->pixels.size()) + " pixels, expected " +
                                    std::to_string(src->width) + "x" + std::to_string(src->height));
    if (!isValidDimension(options.targetWidth))
        throw std::invalid_argument("targetWidth must be > 0, got " + std::to_string(options.targetWidth));
    if (!isValidDimension(options.targetHeight))
        throw std::invalid_argument("targetHeight must be > 0, got " + std::to_string(options.targetHeight));
    for (const auto &op : options.ops)
    {
        if (!op)
            throw std::invalid_argument("ops cannot contain null entries");
    }

    auto [width, height] = targetDimensions(src->width, src->height, options);
    Method method = resolveMethod(options.method, width, height);

    Image result = (method == Method::Speed) ? resizeNearest(*src, width, height)
                                             : resizeArea(*src, width, height);

    for (const auto &op : options.ops)
        result = op->apply(result);

    return std::make_shared<const Image>(std::move(result));
}

std::pair<int, int> BasicScaler::targetDimensions(int srcWidth, int srcHeight, const ScaleOptions &options)
{
    Mode mode = options.mode;
    if (mode == Mode::FitExact)
        return {options.targetWidth, options.targetHeight};

    double ratio = static_cast<double>(srcHeight) / static_cast<double>(srcWidth);
    if (mode == Mode::Automatic)
        mode = (ratio <= 1.0) ? Mode::FitToWidth : Mode::FitToHeight;

    if (mode == Mode::FitToWidth)
    {
        int height = static_cast<int>(std::lround(options.targetWidth * ratio));
        return {options.targetWidth, std::max(1, height)};
    }

    int width = static_cast<int>(std::lround(options.targetHeight / ratio));
    return {std::max(1, width), options.targetHeight};
}

Method BasicScaler::resolveMethod(Method method, int targetWidth, int targetHeight)
{
    if (method != Method::Automatic)
        return method;

    int edge = std::max(targetWidth, targetHeight);
    if (edge <= QUALITY_THRESHOLD)
        return Method::Quality;
    if (edge <= BALANCED_THRESHOLD)
        return Method::Balanced;
    return Method::Speed;
}

Image BasicScaler::resizeNearest(const Image &src, int width, int height)
{
    Image dst(width, height);
    for (int y = 0; y < height; ++y)
    {
        int sy = static_cast<int>(static_cast<long long>(y) * src.height / height);
        for (int x = 0; x < width; ++x)
        {
            int sx = static_cast<int>(static_cast<long long>(x) * src.width / width);
            dst.set(x, y, src.at(sx, sy));
        }
    }
    return dst;
}

Image BasicScaler::resizeArea(const Image &src, int width, int height)
{
    Image dst(width, height);
    for (int y = 0; y < height; ++y)
    {
        int y0 = static_cast<int>(static_cast<long long>(y) * src.height / height);
        int y1 = std::max(y0 + 1, static_cast<int>(static_cast<long long>(y + 1) * src.height / height));
        for (int x = 0; x < width; ++x)
        {
            int x0 = static_cast<int>(static_cast<long long>(x) * src.width / width);
            int x1 = std::max(x0 + 1, static_cast<int>(static_cast<long long>(x + 1) * src.width / width));

            std::uint64_t a = 0, r = 0, g = 0, b = 0;
            for (int sy = y0; sy < y1; ++sy)
            {
                for (int sx = x0; sx < x1; ++sx)
                {
                    std::uint32_t p = src.at(sx, sy);
                    a += channel(p, 24);
                    r += channel(p, 16);
                    g += channel(p, 8);
                    b += channel(p, 0);
                }
            }
            std::uint64_t n = static_cast<std::uint64_t>(y1 - y0) * static_cast<std::uint64_t>(x1 - x0);
            dst.set(x, y, pack(static_cast<std::uint32_t>(a / n), static_cast<std::uint32_t>(r / n),
                               static_cast<std::uint32_t>(g / n), static_cast<std::uint32_t>(b / n)));
        }
    }
    return dst;
}

Image GrayscaleOp::apply(const Image &src) const
{
    Image dst = src;
    for (auto &p : dst.pixels)
    {
        // ITU-R BT.601 luma weights in fixed point.
        std::uint32_t luma = (299 * channel(p, 16) + 587 * channel(p, 8) + 114 * channel(p, 0)) / 1000;
        p = pack(channel(p, 24), luma, luma, luma);
    }
    return dst;
}

Image BrightnessOp::apply(const Image &src) const
{
    auto adjust = [this](std::uint32_t c)
    {
        long v = std::lround(static_cast<float>(c) * factor_);
        return static_cast<std::uint32_t>(std::clamp(v, 0L, 255L));
    };

    Image dst = src;
    for (auto &p : dst.pixels)
        p = pack(channel(p, 24), adjust(channel(p, 16)), adjust(channel(p, 8)), adjust(channel(p, 0)));
    return dst;
}
