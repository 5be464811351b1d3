#include <gtest/gtest.h>
#include "event_bus.hpp"
#include "events.hpp"

using namespace picbatch;

TEST(EventBus, DeliversToSubscribersOfTheType) {
    EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe<ItemStartEvent>([&](const ItemStartEvent& e) { seen.push_back("a:" + e.original_name); });
    bus.subscribe<ItemStartEvent>([&](const ItemStartEvent& e) { seen.push_back("b:" + e.original_name); });
    bus.subscribe<ItemErrorEvent>([&](const ItemErrorEvent&) { seen.emplace_back("error"); });

    EXPECT_EQ(bus.subscriber_count<ItemStartEvent>(), 2u);
    EXPECT_EQ(bus.subscriber_count<BatchStartEvent>(), 0u);

    bus.publish(ItemStartEvent{1, "x.jpg"});
    EXPECT_EQ(seen, (std::vector<std::string>{"a:x.jpg", "b:x.jpg"}));

    bus.publish(BatchStartEvent{});
    EXPECT_EQ(seen.size(), 2u);
}

TEST(EventBus, HandlerMaySubscribeDuringPublish) {
    EventBus bus;
    int late_calls = 0;
    bus.subscribe<BatchStartEvent>([&](const BatchStartEvent&) {
        bus.subscribe<BatchStartEvent>([&](const BatchStartEvent&) { ++late_calls; });
    });

    bus.publish(BatchStartEvent{});
    EXPECT_EQ(late_calls, 0);
    bus.publish(BatchStartEvent{});
    EXPECT_EQ(late_calls, 1);
}
