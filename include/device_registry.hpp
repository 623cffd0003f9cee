#ifndef ZONESCAN_DEVICE_REGISTRY_HPP
#define ZONESCAN_DEVICE_REGISTRY_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <mutex>

#include "upnp_device.hpp"
#include "event_bus.hpp"

namespace upnp
{

// Devices are refreshed after five minutes at the latest
static constexpr std::chrono::milliseconds default_max_lifetime {std::chrono::minutes {5}};

struct decayed_device
{
    std::string id;
    std::string info_url;
};

/**
 * The one place that knows which devices are around
 * Every access is serialized, callers only ever get copies of the stored devices.
 * Roster changes are published as devices_changed events with the full roster as payload.
 */
class device_registry
{
public:

    device_registry() = delete;
    device_registry(const device_registry&) = delete;
    device_registry& operator=(const device_registry&) = delete;
    device_registry(device_registry&&) = delete;
    device_registry& operator=(device_registry&&) = delete;
    ~device_registry() = default;

    explicit device_registry(events::event_bus& bus, std::chrono::milliseconds max_lifetime = default_max_lifetime);

    /**
     * Inserts an unknown device and publishes the roster
     * A known device is replaced as a whole without a notification, unless the stored record is newer than
     * the given one. In that case the given one is dropped.
     * Returns true if the device was new.
     */
    bool upsert(device dev);

    bool remove(const std::string& id);

    std::vector<device> snapshot() const;

    std::optional<device> find(const std::string& id) const;

    bool contains(const std::string& id) const;

    size_t size() const;

    /// Removes every device with last_updated <= now - max_lifetime and returns what is needed to re-query them
    std::vector<decayed_device> sweep_decayed(clock::time_point now);

    std::chrono::milliseconds max_lifetime() const
    {
        return m_max_lifetime;
    }

    void publish_roster() const;

private:

    events::event_bus& m_bus;

    const std::chrono::milliseconds m_max_lifetime;

    std::vector<device> m_devices;

    mutable std::mutex m_mutex;

};

} // namespace upnp

#endif
