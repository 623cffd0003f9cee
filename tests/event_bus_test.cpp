#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "event_bus.hpp"

TEST(event_bus, delivers_to_subscribers_of_the_topic_in_order)
{
    events::event_bus bus;
    std::vector<std::string> calls;

    bus.subscribe(events::topic::devices_changed, [&calls](const nlohmann::json& payload) {
        calls.push_back("first " + payload.dump());
    });
    bus.subscribe(events::topic::media_info_received, [&calls](const nlohmann::json&) {
        calls.push_back("media");
    });
    bus.subscribe(events::topic::devices_changed, [&calls](const nlohmann::json& payload) {
        calls.push_back("second " + payload.dump());
    });

    EXPECT_EQ(bus.publish(events::topic::devices_changed, nlohmann::json::array({1})), 2u);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "first [1]");
    EXPECT_EQ(calls[1], "second [1]");
}

TEST(event_bus, unsubscribe_stops_delivery)
{
    events::event_bus bus;
    int calls = 0;

    uint64_t id = bus.subscribe("topic", [&calls](const nlohmann::json&) {
        ++calls;
    });

    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    EXPECT_EQ(bus.publish("topic", nullptr), 0u);
    EXPECT_EQ(calls, 0);
}

TEST(event_bus, throwing_handler_does_not_stop_fan_out)
{
    events::event_bus bus;
    int calls = 0;

    bus.subscribe("topic", [](const nlohmann::json&) {
        throw std::runtime_error {"handler failed"};
    });
    bus.subscribe("topic", [&calls](const nlohmann::json&) {
        ++calls;
    });

    EXPECT_NO_THROW(bus.publish("topic", nullptr));
    EXPECT_EQ(calls, 1);
}

TEST(event_bus, handler_may_unsubscribe_itself)
{
    events::event_bus bus;
    int calls = 0;
    uint64_t id = 0;

    id = bus.subscribe("topic", [&](const nlohmann::json&) {
        ++calls;
        bus.unsubscribe(id);
    });

    bus.publish("topic", nullptr);
    bus.publish("topic", nullptr);
    EXPECT_EQ(calls, 1);
}
