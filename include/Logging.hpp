#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>
#include "utils.hpp"

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

inline const char *to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

// Maps "debug"/"info"/"warn"/"error" to a level; falls back to Info.
inline LogLevel parse_log_level(const std::string &name)
{
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "warn")
        return LogLevel::Warn;
    if (name == "error")
        return LogLevel::Error;
    return LogLevel::Info;
}

// Thread-safe structured logger that prints one JSON object per line.
class Logger
{
public:
    // Emits a structured log event as a single JSON line.
    static void log_event(LogLevel level, const std::string &action, const std::string &message, const nlohmann::json &extra = nlohmann::json::object())
    {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed))
            return;

        nlohmann::json j = extra;
        j["ts"] = current_timestamp();
        j["level"] = to_string(level);
        j["action"] = action;
        j["message"] = message;

        // Invalid UTF-8 in messages is replaced rather than thrown.
        std::string line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        // Serialize output to avoid interleaved JSON lines.
        std::lock_guard<std::mutex> lock(mutex());
        std::cout << line << std::endl;
    }

    // Events below this level are dropped.
    static void set_min_level(LogLevel level)
    {
        min_level().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    // Applies ASYNCSCALE_LOG_LEVEL when set.
    static void init_from_env()
    {
        if (auto value = readEnv("ASYNCSCALE_LOG_LEVEL"))
            set_min_level(parse_log_level(*value));
    }

private:
    static std::mutex &mutex()
    {
        static std::mutex m;
        return m;
    }

    static std::atomic<int> &min_level()
    {
        static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
        return level;
    }
};
