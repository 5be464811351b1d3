#include <gtest/gtest.h>
#include "errors.hpp"
#include "logger.hpp"
#include "test_helpers.hpp"
#include "zip_writer.hpp"
#include <memory>

using namespace picbatch;

TEST(ZipWriter, EntriesReadBackInOrder) {
    ZipWriter zip;
    const std::vector<uint8_t> first(1000, 'a');
    const std::vector<uint8_t> second = {1, 2, 3};
    zip.add_entry("b.jpg", first);
    zip.add_entry("a.jpg", second);
    EXPECT_EQ(zip.entry_count(), 2u);
    EXPECT_TRUE(zip.contains("a.jpg"));
    EXPECT_FALSE(zip.contains("c.jpg"));

    const auto archive = zip.finish();
    ASSERT_GE(archive.size(), 4u);
    EXPECT_EQ(archive[0], 'P');
    EXPECT_EQ(archive[1], 'K');

    const auto entries = test::read_zip(archive);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "b.jpg");
    EXPECT_EQ(entries[0].second, first);
    EXPECT_EQ(entries[1].first, "a.jpg");
    EXPECT_EQ(entries[1].second, second);
}

TEST(ZipWriter, FormatOptionsApplyWithoutWarnings) {
    auto sink = std::make_unique<test::CaptureSink>();
    const auto* capture = sink.get();
    Logger::clear_sinks();
    Logger::add_sink(std::move(sink));

    ZipWriter zip;
    zip.add_entry("zeros.png", std::vector<uint8_t>(100000, 0));
    const auto archive = zip.finish();
    Logger::clear_sinks();

    for (const auto& entry : capture->entries) {
        EXPECT_NE(entry.level, LogLevel::Warning) << entry.message;
    }
    // deflated, not stored
    EXPECT_LT(archive.size(), 2000u);
    EXPECT_EQ(test::read_zip(archive).at(0).second.size(), 100000u);
}

TEST(ZipWriter, EmptyArchive) {
    ZipWriter zip;
    const auto archive = zip.finish();
    // end of central directory record only
    ASSERT_GE(archive.size(), 22u);
    EXPECT_EQ(archive[0], 'P');
    EXPECT_EQ(archive[1], 'K');
    EXPECT_EQ(archive[2], 5);
    EXPECT_EQ(archive[3], 6);
}

TEST(ZipWriter, RejectsDuplicateAndEmptyNames) {
    ZipWriter zip;
    const std::vector<uint8_t> data = {42};
    zip.add_entry("img_1.jpg", data);
    EXPECT_THROW(zip.add_entry("img_1.jpg", data), ArchiveError);
    EXPECT_THROW(zip.add_entry("", data), ArchiveError);
    EXPECT_EQ(zip.entry_count(), 1u);
}

TEST(ZipWriter, CannotBeUsedAfterFinish) {
    ZipWriter zip;
    static_cast<void>(zip.finish());
    const std::vector<uint8_t> data = {42};
    EXPECT_THROW(zip.add_entry("late.jpg", data), ArchiveError);
    EXPECT_THROW(static_cast<void>(zip.finish()), ArchiveError);
}
