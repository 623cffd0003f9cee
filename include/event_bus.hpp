#ifndef ZONESCAN_EVENT_BUS_HPP
#define ZONESCAN_EVENT_BUS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <mutex>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace events
{

namespace topic
{

static constexpr const char* devices_changed = "device-roster-changed";
static constexpr const char* media_info_received = "media-info-received";

} // namespace topic

using handler = std::function<void(const nlohmann::json&)>;

// Synchronous in-process publish/subscribe
class event_bus
{
public:

    event_bus() = default;
    event_bus(const event_bus&) = delete;
    event_bus& operator=(const event_bus&) = delete;
    event_bus(event_bus&&) = delete;
    event_bus& operator=(event_bus&&) = delete;
    ~event_bus() = default;

    uint64_t subscribe(std::string_view topic, handler callback);

    bool unsubscribe(uint64_t subscription_id);

    // Calls every handler of the topic in subscription order, returns the number of handlers called
    size_t publish(std::string_view topic, const nlohmann::json& payload) const;

private:

    struct subscription
    {
        uint64_t id;
        std::string topic;
        handler callback;
    };

    std::vector<subscription> m_subscriptions;

    mutable std::mutex m_mutex;

    uint64_t m_next_id = 1;

};

} // namespace events

#endif
