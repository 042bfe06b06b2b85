#include "Config.hpp"
#include "utils.hpp"

#include <climits>
#include <cstdint>
#include <fstream>

namespace
{
    int readIntOverride(const char *name, int fallback)
    {
        auto raw = readEnv(name);
        if (!raw)
            return fallback;

        auto value = parseInteger(*raw);
        if (!value)
            throw ConfigError(std::string("Environment variable '") + name + "' is not an integer: '" + *raw + "'");
        return static_cast<int>(*value);
    }

    // JSON integers wider than int are rejected instead of being truncated.
    int readIntField(const nlohmann::json &j, const char *key)
    {
        const auto &value = j.at(key);
        if (!value.is_number_integer())
            throw ConfigError(std::string("Config field '") + key + "' must be an integer");

        if (value.is_number_unsigned())
        {
            auto u = value.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(INT_MAX))
                throw ConfigError(std::string("Config field '") + key + "' is out of range: " + std::to_string(u));
            return static_cast<int>(u);
        }

        auto v = value.get<std::int64_t>();
        if (v < INT_MIN || v > INT_MAX)
            throw ConfigError(std::string("Config field '") + key + "' is out of range: " + std::to_string(v));
        return static_cast<int>(v);
    }
}

void ScalerConfig::validate() const
{
    if (thread_count <= 0)
        throw ConfigError("thread_count is " + std::to_string(thread_count) + ", but it must be > 0");
    if (queue_capacity < 0)
        throw ConfigError("queue_capacity is " + std::to_string(queue_capacity) + ", but it must be >= 0");
}

ScalerConfig ScalerConfig::fromEnvironment(ScalerConfig base)
{
    base.thread_count = readIntOverride(THREAD_COUNT_ENV, base.thread_count);
    base.queue_capacity = readIntOverride(QUEUE_CAPACITY_ENV, base.queue_capacity);
    base.validate();
    return base;
}

ScalerConfig ScalerConfig::fromEnvironment()
{
    return fromEnvironment(ScalerConfig{});
}

ScalerConfig ScalerConfig::load(const std::string &filename)
{
    std::ifstream in(filename);
    if (!in.is_open())
        throw ConfigError("Failed to open config file " + filename);

    nlohmann::json j = nlohmann::json::object();
    try
    {
        if (in.peek() != std::ifstream::traits_type::eof())
            in >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigError("Failed to parse " + filename + ": " + e.what());
    }

    ScalerConfig config = from_json(j);
    config.validate();
    return config;
}

nlohmann::json ScalerConfig::to_json() const
{
    return {{"thread_count", thread_count}, {"queue_capacity", queue_capacity}};
}

ScalerConfig ScalerConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw ConfigError("Scaler config must be a JSON object");

    ScalerConfig config;
    if (j.contains("thread_count"))
        config.thread_count = readIntField(j, "thread_count");
    if (j.contains("queue_capacity"))
        config.queue_capacity = readIntField(j, "queue_capacity");
    return config;
}
