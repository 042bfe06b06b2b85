#include "ScaleOptions.hpp"

const char *to_string(Method method)
{
    switch (method)
    {
    case Method::Automatic:
        return "automatic";
    case Method::Speed:
        return "speed";
    case Method::Balanced:
        return "balanced";
    case Method::Quality:
        return "quality";
    case Method::UltraQuality:
        return "ultra_quality";
    }
    return "unknown";
}

const char *to_string(Mode mode)
{
    switch (mode)
    {
    case Mode::Automatic:
        return "automatic";
    case Mode::FitExact:
        return "fit_exact";
    case Mode::FitToWidth:
        return "fit_to_width";
    case Mode::FitToHeight:
        return "fit_to_height";
    }
    return "unknown";
}

ScaleOptions ScaleOptions::toSize(int targetSize)
{
    return toDimensions(targetSize, targetSize);
}

ScaleOptions ScaleOptions::toDimensions(int targetWidth, int targetHeight)
{
    ScaleOptions options;
    options.targetWidth = targetWidth;
    options.targetHeight = targetHeight;
    return options;
}

ScaleOptions ScaleOptions::withMethod(Method m) const
{
    ScaleOptions copy = *this;
    copy.method = m;
    return copy;
}

ScaleOptions ScaleOptions::withMode(Mode m) const
{
    ScaleOptions copy = *this;
    copy.mode = m;
    return copy;
}

ScaleOptions ScaleOptions::thenApply(ImageOpPtr op) const
{
    ScaleOptions copy = *this;
    copy.ops.push_back(std::move(op));
    return copy;
}

nlohmann::json ScaleOptions::to_json() const
{
    nlohmann::json ops_json = nlohmann::json::array();
    for (const auto &op : ops)
        ops_json.push_back(op ? op->name() : "null");

    return {{"width", targetWidth},
            {"height", targetHeight},
            {"method", to_string(method)},
            {"mode", to_string(mode)},
            {"ops", ops_json}};
}
