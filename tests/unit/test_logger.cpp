#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <glide/logger.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace glide;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& logger = Logger::instance();
        previous_    = logger.get_level();
        logger.clear_sinks();
        logger.set_level(LogLevel::Trace);
        logger.add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(previous_);
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      previous_ = LogLevel::Info;
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    GLIDE_LOG_INFO("anim", "{} -> {} in {} ms", 1, 2.5f, 300);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "anim");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].message, "1 -> 2.5 in 300 ms");
}

TEST_F(LoggerTest, SubstitutedTextIsNotReScanned)
{
    GLIDE_LOG_INFO("anim", "{} and {}", std::string("{}"), "second");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "{} and second");
}

TEST_F(LoggerTest, ExtraPlaceholdersStayLiteral)
{
    GLIDE_LOG_WARN("driver", "missing {} and {}", "one");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "missing one and {}");
}

TEST_F(LoggerTest, BelowMinimumLevelIsDropped)
{
    Logger::instance().set_level(LogLevel::Warning);
    GLIDE_LOG_DEBUG("settings", "hidden");
    GLIDE_LOG_INFO("settings", "hidden");
    GLIDE_LOG_ERROR("settings", "shown");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Error);
}

TEST_F(LoggerTest, BoolArguments)
{
    GLIDE_LOG_TRACE("highlight", "enabled={}", true);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "enabled=true");
}

TEST_F(LoggerTest, HereVariantAppendsLocation)
{
    GLIDE_LOG_WARN_HERE("anim", "odd state");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_NE(entries_[0].message.find("test_logger.cpp"), std::string::npos);
}

TEST_F(LoggerTest, SinkManagement)
{
    auto& logger = Logger::instance();
    EXPECT_EQ(logger.sink_count(), 1u);
    logger.add_sink(sinks::null_sink());
    EXPECT_EQ(logger.sink_count(), 2u);
    logger.clear_sinks();
    GLIDE_LOG_CRITICAL("anim", "nobody listens");
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggerTest, FileSinkAppendsFormattedLines)
{
    auto path = std::filesystem::temp_directory_path() / "glide_logger_test.log";
    std::filesystem::remove(path);

    Logger::instance().add_sink(sinks::file_sink(path.string()));
    GLIDE_LOG_INFO("driver", "ticked {} transitions", 3);
    GLIDE_LOG_ERROR("settings", "cannot read {}", "animation.json");
    Logger::instance().clear_sinks();

    std::ifstream      in(path);
    std::ostringstream contents;
    contents << in.rdbuf();
    std::string text = contents.str();

    EXPECT_NE(text.find("INFO  [driver] ticked 3 transitions\n"), std::string::npos) << text;
    EXPECT_NE(text.find("ERROR [settings] cannot read animation.json\n"), std::string::npos)
        << text;
    EXPECT_EQ(entries_.size(), 2u);

    in.close();
    std::filesystem::remove(path);
}

TEST(LogLevel, NamesRoundTrip)
{
    for (auto level : {LogLevel::Trace,
                       LogLevel::Debug,
                       LogLevel::Info,
                       LogLevel::Warning,
                       LogLevel::Error,
                       LogLevel::Critical})
    {
        EXPECT_EQ(Logger::level_from_string(Logger::level_to_string(level)), level);
    }
    EXPECT_EQ(Logger::level_from_string("warning"), LogLevel::Warning);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}
