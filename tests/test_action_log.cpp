#include <gtest/gtest.h>
#include "action_log.hpp"
#include "event_bus.hpp"
#include <stdexcept>

using namespace picbatch;

TEST(ActionLog, DescribesBatches) {
    EXPECT_EQ(ActionLog::describe({3, 3, 0, ImageFormat::Jpeg}),
              "Processed 3 images → 3 outputs, format=jpg.");
    EXPECT_EQ(ActionLog::describe({4, 3, 1, ImageFormat::Webp}),
              "Processed 4 images → 3 outputs, format=webp. 1 failed.");
}

TEST(ActionLog, DropsOldestBeyondCapacity) {
    ActionLog log(3);
    for (int i = 1; i <= 5; ++i) {
        log.append("entry " + std::to_string(i));
    }
    EXPECT_EQ(log.size(), 3u);
    EXPECT_EQ(log.entries(), (std::vector<std::string>{"entry 3", "entry 4", "entry 5"}));
}

TEST(ActionLog, DefaultCapacity) {
    ActionLog log;
    EXPECT_EQ(log.capacity(), 50u);
    EXPECT_TRUE(log.empty());
    EXPECT_THROW(static_cast<void>(ActionLog(0)), std::invalid_argument);
}

TEST(ActionLog, RecordsFromEventBus) {
    EventBus bus;
    ActionLog log;
    log.attach(bus);

    bus.publish(BatchCompleteEvent{2, 2, 0, ImageFormat::Png});
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries().front(), "Processed 2 images → 2 outputs, format=png.");
}
