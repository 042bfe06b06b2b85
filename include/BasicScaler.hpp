#pragma once
#include <utility>

#include "Scaler.hpp"

// Reference scaler: nearest-neighbour for Method::Speed, area averaging otherwise.
class BasicScaler : public Scaler
{
public:
    ImagePtr scale(const ImagePtr &src, const ScaleOptions &options) const override;

    // Resolves the output size for a source of srcWidth x srcHeight.
    static std::pair<int, int> targetDimensions(int srcWidth, int srcHeight, const ScaleOptions &options);

    // Method::Automatic picks a kernel from the largest target edge.
    static Method resolveMethod(Method method, int targetWidth, int targetHeight);

private:
    static Image resizeNearest(const Image &src, int width, int height);
    static Image resizeArea(const Image &src, int width, int height);
};

// Converts every pixel to its luma, keeping alpha.
class GrayscaleOp : public ImageOp
{
public:
    Image apply(const Image &src) const override;
    std::string name() const override { return "grayscale"; }
};

// Multiplies colour channels by a factor, clamped to 0..255.
class BrightnessOp : public ImageOp
{
public:
    explicit BrightnessOp(float factor) : factor_(factor) {}

    Image apply(const Image &src) const override;
    std::string name() const override { return factor_ >= 1.0f ? "brighter" : "darker"; }

private:
    float factor_;
};
