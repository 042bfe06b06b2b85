#pragma once
#include "Image.hpp"
#include "ScaleOptions.hpp"

// Synchronous scaling routine driven by AsyncScaler.
// Implementations throw std::invalid_argument for bad input and must be safe
// to call from several worker threads at once.
class Scaler
{
public:
    virtual ~Scaler() = default;

    virtual ImagePtr scale(const ImagePtr &src, const ScaleOptions &options) const = 0;
};
