#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "AsyncScaler.hpp"
#include "BasicScaler.hpp"
#include "Config.hpp"
#include "Logging.hpp"
#include "utils.hpp"

namespace
{
    constexpr auto DRAIN_TIMEOUT = std::chrono::seconds(10);

    // Synthetic gradient so the demo needs no image codec.
    ImagePtr make_gradient(int width, int height)
    {
        auto img = std::make_shared<Image>(width, height);
        for (int y = 0; y < height; ++y)
        {
            for (int x = 0; x < width; ++x)
            {
                std::uint32_t r = static_cast<std::uint32_t>(x * 255 / width);
                std::uint32_t g = static_cast<std::uint32_t>(y * 255 / height);
                img->set(x, y, 0xFF000000u | (r << 16) | (g << 8) | 0x40u);
            }
        }
        return img;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 3 || argc > 4)
    {
        std::cerr << "Usage: " << argv[0] << " <COUNT> <TARGET_SIZE> [CONFIG_JSON]\n";
        return EXIT_FAILURE;
    }

    Logger::init_from_env();

    auto count = parseInteger(argv[1]);
    auto target = parseInteger(argv[2]);
    if (!count || *count <= 0 || !target)
    {
        std::cerr << "COUNT must be a positive integer and TARGET_SIZE an integer\n";
        return EXIT_FAILURE;
    }

    ScalerConfig config;
    try
    {
        config = ScalerConfig::fromEnvironment(argc == 4 ? ScalerConfig::load(argv[3]) : ScalerConfig{});
    }
    catch (const ConfigError &e)
    {
        Logger::log_event(LogLevel::Error, "config_error", e.what());
        return EXIT_FAILURE;
    }

    AsyncScaler scaler(std::make_shared<BasicScaler>(), config);

    auto grayscale = std::make_shared<GrayscaleOp>();
    std::vector<ScaleFuture> futures;
    futures.reserve(static_cast<std::size_t>(*count));
    for (long i = 0; i < *count; ++i)
    {
        int width = 640 + static_cast<int>(i % 5) * 320;
        int height = 480 + static_cast<int>(i % 3) * 240;
        ScaleOptions options = ScaleOptions::toSize(static_cast<int>(*target));
        if (i % 2 == 1)
            options = options.withMethod(Method::Speed).thenApply(grayscale);

        try
        {
            futures.push_back(scaler.submit(make_gradient(width, height), options));
        }
        catch (const RejectedSubmission &e)
        {
            Logger::log_event(LogLevel::Warn, "demo_rejected", e.what(), {{"index", i}});
        }
    }

    int failures = 0;
    for (auto &future : futures)
    {
        try
        {
            ImagePtr result = future.get();
            Logger::log_event(LogLevel::Info, "scale_done", "Scale completed",
                              {{"task_id", future.id()}, {"width", result->width}, {"height", result->height}});
        }
        catch (const std::invalid_argument &e)
        {
            ++failures;
            Logger::log_event(LogLevel::Warn, "scale_error", e.what(), {{"task_id", future.id()}});
        }
        catch (const TaskCancelled &e)
        {
            ++failures;
            Logger::log_event(LogLevel::Warn, "scale_cancelled", e.what(), {{"task_id", future.id()}});
        }
        catch (const std::exception &e)
        {
            ++failures;
            Logger::log_event(LogLevel::Error, "scale_error", e.what(), {{"task_id", future.id()}});
        }
    }

    Logger::log_event(LogLevel::Info, "metrics_dump", "Final metrics snapshot", scaler.metrics().snapshot());

    scaler.shutdown();
    if (!scaler.awaitTermination(DRAIN_TIMEOUT))
    {
        std::size_t dropped = scaler.shutdownNow();
        Logger::log_event(LogLevel::Warn, "drain_timeout", "Pool did not drain in time", {{"dropped", dropped}});
    }

    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
