// Utility helpers for timestamps and configuration value parsing.
#pragma once
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <optional>

// Returns local time in "YYYY-MM-DD HH:MM:SS" format.
inline std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t_c = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&t_c), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// Parses a whole decimal integer, allowing surrounding whitespace.
// Returns nullopt on garbage, trailing characters or overflow.
inline std::optional<long> parseInteger(const std::string &text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    if (begin == end)
        return std::nullopt;

    std::string trimmed = text.substr(begin, end - begin);
    char *parsed_end = nullptr;
    errno = 0;
    long value = std::strtol(trimmed.c_str(), &parsed_end, 10);
    if (errno == ERANGE || parsed_end != trimmed.c_str() + trimmed.size())
        return std::nullopt;
    if (value > INT_MAX || value < INT_MIN)
        return std::nullopt;
    return value;
}

// Reads an environment variable; nullopt when unset.
inline std::optional<std::string> readEnv(const char *name)
{
    const char *value = std::getenv(name);
    if (!value)
        return std::nullopt;
    return std::string(value);
}

inline bool isValidDimension(int value)
{
    return value > 0;
}
