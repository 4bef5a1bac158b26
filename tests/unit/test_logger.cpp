#include <gtest/gtest.h>

#include <termpanel/logger.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace termpanel;

namespace
{

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Trace);
        Logger::instance().add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    LogLevel                      saved_level_ = LogLevel::Info;
    std::vector<Logger::LogEntry> entries_;
};

}   // namespace

TEST_F(LoggerTest, FormatsPlaceholders)
{
    TERMPANEL_LOG_INFO("pty", "Bridged {} via pid={} ({}x{})", std::string("term-main"), 42, 80,
                       24);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "pty");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].message, "Bridged term-main via pid=42 (80x24)");
}

TEST_F(LoggerTest, ExtraPlaceholdersAndArgumentsAreTolerated)
{
    TERMPANEL_LOG_DEBUG("test", "{} and {}", "one");
    TERMPANEL_LOG_DEBUG("test", "only {}", "a", "b");
    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].message, "one and {}");
    EXPECT_EQ(entries_[1].message, "only a");
}

TEST_F(LoggerTest, ArgumentThatLooksLikePlaceholderIsNotReexpanded)
{
    TERMPANEL_LOG_INFO("test", "{} {}", "{}", true);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "{} true");
}

TEST_F(LoggerTest, LevelFiltering)
{
    Logger::instance().set_level(LogLevel::Warning);
    TERMPANEL_LOG_INFO("test", "dropped");
    TERMPANEL_LOG_WARN("test", "kept");
    TERMPANEL_LOG_CRITICAL("test", "kept too");
    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Debug));
}

TEST_F(LoggerTest, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_from_string("WARNING"), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("warn"), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("Trace"), LogLevel::Trace);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}

TEST_F(LoggerTest, FileSinkAppendsLines)
{
    auto path = std::filesystem::temp_directory_path()
                / ("termpanel-log-" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);
    Logger::instance().add_sink(sinks::file_sink(path.string()));

    TERMPANEL_LOG_ERROR("daemon", "first");
    TERMPANEL_LOG_ERROR("daemon", "second");

    std::ifstream in(path);
    std::string   text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("ERROR [daemon] first\n"), std::string::npos);
    EXPECT_NE(text.find("ERROR [daemon] second\n"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(LoggerFormat, EntryLine)
{
    Logger::LogEntry e{std::chrono::system_clock::now(), LogLevel::Warning, "pty", "reader stopped"};
    auto             line = Logger::format_entry(e);
    EXPECT_NE(line.find(" WARN [pty] reader stopped"), std::string::npos);
    EXPECT_NE(line.back(), '\n');
}

TEST_F(LoggerTest, UnopenableFileSinkIsHarmless)
{
    Logger::instance().add_sink(sinks::file_sink("/nonexistent-dir/termpanel.log"));
    TERMPANEL_LOG_INFO("daemon", "still logged");
    ASSERT_EQ(entries_.size(), 1u);
}

TEST_F(LoggerTest, ConcurrentLoggingKeepsEveryEntry)
{
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [t]
            {
                for (int i = 0; i < 50; ++i)
                    TERMPANEL_LOG_TRACE("thread", "t={} i={}", t, i);
            });
    }
    for (auto& th : threads)
        th.join();
    EXPECT_EQ(entries_.size(), 200u);
}
