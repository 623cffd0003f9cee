#include "event_bus.hpp"

#include "log.hpp"

#include <algorithm>

namespace events
{

uint64_t event_bus::subscribe(std::string_view topic, handler callback)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    uint64_t id = m_next_id++;
    m_subscriptions.push_back(subscription {id, std::string {topic}, std::move(callback)});
    return id;
}

bool event_bus::unsubscribe(uint64_t subscription_id)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = std::find_if(m_subscriptions.begin(), m_subscriptions.end(), [subscription_id](const subscription& sub) {
        return sub.id == subscription_id;
    });

    if(it == m_subscriptions.end())
        return false;

    m_subscriptions.erase(it);
    return true;
}

size_t event_bus::publish(std::string_view topic, const nlohmann::json& payload) const
{
    // Copy the handlers so a handler can subscribe or unsubscribe without deadlocking
    std::vector<handler> handlers;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        for(const auto& sub : m_subscriptions)
        {
            if(sub.topic == topic)
                handlers.push_back(sub.callback);
        }
    }

    for(const auto& callback : handlers)
    {
        try {
            callback(payload);
        } catch(std::exception& e) {
            logging::error("Handler for '{}' failed: {}", topic, e.what());
        }
    }

    return handlers.size();
}

} // namespace events
