#include <cstdlib>
#include <gtest/gtest.h>
#include <lumaplot/logger.hpp>
#include <string>
#include <vector>

using namespace lumaplot;

// Captures entries delivered to the global logger for the duration of a test
class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
        unsetenv("LUMAPLOT_LOG_LEVEL");
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      saved_level_ = LogLevel::Info;
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    Logger::instance().set_level(LogLevel::Trace);
    Logger::instance().log_formatted(LogLevel::Info, "render", "{} markers, {} ok", 12, true);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "12 markers, true ok");
    EXPECT_EQ(entries_[0].category, "render");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, ExtraPlaceholdersStayLiteral)
{
    Logger::instance().set_level(LogLevel::Trace);
    Logger::instance().log_formatted(LogLevel::Info, "layout", "{} then {}", std::string("a"));

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "a then {}");
}

TEST_F(LoggerTest, LevelFiltersEntries)
{
    Logger::instance().set_level(LogLevel::Warning);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Info));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Error));

    LUMAPLOT_LOG_INFO("render", "dropped");
    LUMAPLOT_LOG_WARN("render", "kept {}", 1);
    LUMAPLOT_LOG_ERROR("vulkan", "kept {}", 2);

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].message, "kept 1");
    EXPECT_EQ(entries_[1].category, "vulkan");
}

TEST_F(LoggerTest, NullSinkSwallowsOutput)
{
    Logger::instance().clear_sinks();
    Logger::instance().add_sink(sinks::null_sink());
    Logger::instance().set_level(LogLevel::Trace);
    LUMAPLOT_LOG_CRITICAL("export", "nothing to see");
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggerTest, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

// ─── Configuration ───────────────────────────────────────────────────────────

TEST_F(LoggerTest, ParseLogLevel)
{
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("Info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST_F(LoggerTest, LevelFromEnvironment)
{
    unsetenv("LUMAPLOT_LOG_LEVEL");
    EXPECT_EQ(log_level_from_env(LogLevel::Error), LogLevel::Error);

    setenv("LUMAPLOT_LOG_LEVEL", "debug", 1);
    EXPECT_EQ(log_level_from_env(), LogLevel::Debug);

    setenv("LUMAPLOT_LOG_LEVEL", "nonsense", 1);
    EXPECT_EQ(log_level_from_env(LogLevel::Warning), LogLevel::Warning);
}

TEST_F(LoggerTest, ConfigureReplacesSinksAndLevel)
{
    LogConfig config;
    config.level   = LogLevel::Error;
    config.console = false;
    configure_logging(config);

    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);

    // The capture sink from SetUp was replaced
    LUMAPLOT_LOG_ERROR("render", "not captured");
    EXPECT_TRUE(entries_.empty());
}
