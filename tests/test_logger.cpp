#include <gtest/gtest.h>
#include "logger.hpp"
#include "test_helpers.hpp"

using namespace picbatch;

TEST(Logger, FansOutToAllSinks) {
    Logger::clear_sinks();
    auto first = std::make_unique<test::CaptureSink>();
    auto second = std::make_unique<test::CaptureSink>();
    const auto* a = first.get();
    const auto* b = second.get();
    Logger::add_sink(std::move(first));
    Logger::add_sink(std::move(second));
    Logger::add_sink(nullptr);
    EXPECT_EQ(Logger::sink_count(), 2u);

    Logger::log(LogLevel::Info, "hello", "test");
    Logger::log(LogLevel::Error, "default tag");

    ASSERT_EQ(a->entries.size(), 2u);
    ASSERT_EQ(b->entries.size(), 2u);
    EXPECT_EQ(a->entries[0].message, "hello");
    EXPECT_EQ(a->entries[0].tag, "test");
    EXPECT_EQ(a->entries[1].level, LogLevel::Error);
    EXPECT_EQ(a->entries[1].tag, "picbatch");

    Logger::clear_sinks();
    EXPECT_EQ(Logger::sink_count(), 0u);
    EXPECT_NO_THROW(Logger::log(LogLevel::Debug, "dropped"));
}

TEST(Logger, LevelNames) {
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("Error"), LogLevel::Error);
    EXPECT_FALSE(Logger::string_to_level("NONE"));
    EXPECT_FALSE(Logger::string_to_level("verbose"));
}

TEST(Logger, LevelsAreOrdered) {
    EXPECT_LT(LogLevel::Debug, LogLevel::Info);
    EXPECT_LT(LogLevel::Info, LogLevel::Warning);
    EXPECT_LT(LogLevel::Warning, LogLevel::Error);
}
