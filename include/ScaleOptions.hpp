#pragma once
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "Image.hpp"

// Quality/speed trade-off requested from the scaling routine.
enum class Method
{
    Automatic,
    Speed,
    Balanced,
    Quality,
    UltraQuality
};

// How target dimensions are honoured relative to the source aspect ratio.
enum class Mode
{
    Automatic,
    FitExact,
    FitToWidth,
    FitToHeight
};

const char *to_string(Method method);
const char *to_string(Mode mode);

// Post-processing step applied to the scaled image.
class ImageOp
{
public:
    virtual ~ImageOp() = default;

    // Returns a new image; must not modify the input.
    virtual Image apply(const Image &src) const = 0;
    virtual std::string name() const = 0;
};

using ImageOpPtr = std::shared_ptr<const ImageOp>;

// Immutable argument bundle for one scale request.
//
// Every combination the scaling routine accepts is reachable from the two
// factories: a single target size (bounding box) or explicit width/height,
// each optionally refined by a method, a mode and an ordered op chain.
struct ScaleOptions
{
    int targetWidth = 0;
    int targetHeight = 0;
    Method method = Method::Automatic;
    Mode mode = Mode::Automatic;
    std::vector<ImageOpPtr> ops;

    // Fits the image into a targetSize x targetSize box.
    static ScaleOptions toSize(int targetSize);
    static ScaleOptions toDimensions(int targetWidth, int targetHeight);

    ScaleOptions withMethod(Method m) const;
    ScaleOptions withMode(Mode m) const;
    // Appends an op; ops run in the order they were added.
    ScaleOptions thenApply(ImageOpPtr op) const;

    // Serializes the options for structured logs.
    nlohmann::json to_json() const;
};
