#pragma once
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

// Invalid startup configuration; the component must not be used afterwards.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct ScalerConfig
{
    static constexpr int DEFAULT_THREAD_COUNT = 2;
    static constexpr const char *THREAD_COUNT_ENV = "ASYNCSCALE_THREAD_COUNT";
    static constexpr const char *QUEUE_CAPACITY_ENV = "ASYNCSCALE_QUEUE_CAPACITY";

    // Number of scale operations allowed to run at once; must be > 0.
    int thread_count = DEFAULT_THREAD_COUNT;
    // Maximum queued (not yet running) tasks; 0 means unbounded.
    int queue_capacity = 0;

    // Throws ConfigError describing the first invalid field.
    void validate() const;

    // Applies ASYNCSCALE_* environment overrides on top of base, then validates.
    static ScalerConfig fromEnvironment(ScalerConfig base);
    static ScalerConfig fromEnvironment();
    // Loads a JSON config file; missing keys keep their defaults.
    static ScalerConfig load(const std::string &filename);

    nlohmann::json to_json() const;
    static ScalerConfig from_json(const nlohmann::json &j);
};
