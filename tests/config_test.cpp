#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "Config.hpp"

namespace
{
    // Sets an environment variable for the lifetime of the object.
    class ScopedEnv
    {
    public:
        ScopedEnv(const char *name, const char *value) : name_(name) { ::setenv(name, value, 1); }
        ~ScopedEnv() { ::unsetenv(name_); }

    private:
        const char *name_;
    };

    std::filesystem::path write_temp(const std::string &name, const std::string &body)
    {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << body;
        return path;
    }
}

TEST(ConfigTest, DefaultsMatchDocumentedValues)
{
    ScalerConfig config;
    EXPECT_EQ(config.thread_count, 2);
    EXPECT_EQ(config.queue_capacity, 0);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, NonPositiveThreadCountIsRejected)
{
    // Zero and negative pool sizes are configuration errors.
    ScalerConfig config;
    config.thread_count = 0;
    EXPECT_THROW(config.validate(), ConfigError);
    config.thread_count = -2;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, NegativeQueueCapacityIsRejected)
{
    ScalerConfig config;
    config.queue_capacity = -1;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ConfigTest, EnvironmentOverridesBase)
{
    // ASYNCSCALE_* variables win over whatever the caller passed in.
    ScopedEnv threads(ScalerConfig::THREAD_COUNT_ENV, " 6 ");
    ScopedEnv capacity(ScalerConfig::QUEUE_CAPACITY_ENV, "32");

    ScalerConfig base;
    base.thread_count = 3;
    ScalerConfig config = ScalerConfig::fromEnvironment(base);
    EXPECT_EQ(config.thread_count, 6);
    EXPECT_EQ(config.queue_capacity, 32);
}

TEST(ConfigTest, EnvironmentUnsetKeepsBase)
{
    ::unsetenv(ScalerConfig::THREAD_COUNT_ENV);
    ::unsetenv(ScalerConfig::QUEUE_CAPACITY_ENV);
    ScalerConfig base;
    base.thread_count = 5;
    EXPECT_EQ(ScalerConfig::fromEnvironment(base).thread_count, 5);
}

TEST(ConfigTest, InvalidEnvironmentValuesAreFatal)
{
    // Garbage and non-positive thread counts both fail at load time.
    {
        ScopedEnv threads(ScalerConfig::THREAD_COUNT_ENV, "four");
        EXPECT_THROW(ScalerConfig::fromEnvironment(), ConfigError);
    }
    {
        ScopedEnv threads(ScalerConfig::THREAD_COUNT_ENV, "0");
        EXPECT_THROW(ScalerConfig::fromEnvironment(), ConfigError);
    }
    {
        ScopedEnv threads(ScalerConfig::THREAD_COUNT_ENV, "-3");
        EXPECT_THROW(ScalerConfig::fromEnvironment(), ConfigError);
    }
}

TEST(ConfigTest, LoadReadsJsonFile)
{
    // Keys present in the file override defaults; absent keys keep them.
    auto path = write_temp("asyncscale_config_test.json", R"({"thread_count": 4})");
    ScalerConfig config = ScalerConfig::load(path.string());
    EXPECT_EQ(config.thread_count, 4);
    EXPECT_EQ(config.queue_capacity, 0);
    std::filesystem::remove(path);
}

TEST(ConfigTest, LoadRejectsBadFiles)
{
    // Missing files, broken JSON, wrong types and invalid values all raise ConfigError.
    EXPECT_THROW(ScalerConfig::load("/nonexistent/asyncscale.json"), ConfigError);

    auto broken = write_temp("asyncscale_broken.json", "{ thread_count: ");
    EXPECT_THROW(ScalerConfig::load(broken.string()), ConfigError);
    std::filesystem::remove(broken);

    auto wrong_type = write_temp("asyncscale_wrong_type.json", R"({"thread_count": "many"})");
    EXPECT_THROW(ScalerConfig::load(wrong_type.string()), ConfigError);
    std::filesystem::remove(wrong_type);

    auto zero = write_temp("asyncscale_zero.json", R"({"thread_count": 0})");
    EXPECT_THROW(ScalerConfig::load(zero.string()), ConfigError);
    std::filesystem::remove(zero);

    auto not_object = write_temp("asyncscale_array.json", "[1, 2]");
    EXPECT_THROW(ScalerConfig::load(not_object.string()), ConfigError);
    std::filesystem::remove(not_object);
}

TEST(ConfigTest, OversizedJsonIntegersAreRejected)
{
    // Values past INT_MAX must not wrap into a small or zero thread count.
    auto wraps_to_one = write_temp("asyncscale_wrap_one.json", R"({"thread_count": 4294967297})");
    EXPECT_THROW(ScalerConfig::load(wraps_to_one.string()), ConfigError);
    std::filesystem::remove(wraps_to_one);

    auto wraps_to_zero = write_temp("asyncscale_wrap_zero.json", R"({"thread_count": 4294967296})");
    EXPECT_THROW(ScalerConfig::load(wraps_to_zero.string()), ConfigError);
    std::filesystem::remove(wraps_to_zero);

    EXPECT_THROW(ScalerConfig::from_json({{"queue_capacity", -9000000000LL}}), ConfigError);
    EXPECT_THROW(ScalerConfig::from_json({{"thread_count", 2.5}}), ConfigError);
    EXPECT_EQ(ScalerConfig::from_json({{"thread_count", 2147483647}}).thread_count, 2147483647);
}

TEST(ConfigTest, JsonRoundTripKeepsFields)
{
    ScalerConfig config;
    config.thread_count = 7;
    config.queue_capacity = 64;
    auto j = config.to_json();
    EXPECT_EQ(j["thread_count"].get<int>(), 7);
    EXPECT_EQ(ScalerConfig::from_json(j).queue_capacity, 64);
}
