#include "device_registry.hpp"

#include "log.hpp"

#include <algorithm>

namespace upnp
{

device_registry::device_registry(events::event_bus& bus, std::chrono::milliseconds max_lifetime)
    : m_bus {bus}, m_max_lifetime {max_lifetime}
{}

bool device_registry::upsert(device dev)
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        auto it = std::find_if(m_devices.begin(), m_devices.end(), [&id = dev.id](const device& known) {
            return known.id == id;
        });

        if(it != m_devices.end())
        {
            if(it->last_updated > dev.last_updated)
            {
                logging::debug("Dropping outdated details for device: {}", dev.id);
                return false;
            }

            logging::debug("Updating device: {}", dev.id);
            *it = std::move(dev);
            return false;
        }

        logging::debug("Added new device: {}", dev.id);
        m_devices.push_back(std::move(dev));
    }

    publish_roster();
    return true;
}

bool device_registry::remove(const std::string& id)
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        auto it = std::find_if(m_devices.begin(), m_devices.end(), [&id](const device& known) {
            return known.id == id;
        });

        if(it == m_devices.end())
            return false;

        logging::debug("Removed device: {}", id);
        m_devices.erase(it);
    }

    publish_roster();
    return true;
}

std::vector<device> device_registry::snapshot() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_devices;
}

std::optional<device> device_registry::find(const std::string& id) const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = std::find_if(m_devices.begin(), m_devices.end(), [&id](const device& known) {
        return known.id == id;
    });

    if(it != m_devices.end())
        return *it;
    else
        return std::nullopt;
}

bool device_registry::contains(const std::string& id) const
{
    return find(id).has_value();
}

size_t device_registry::size() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_devices.size();
}

std::vector<decayed_device> device_registry::sweep_decayed(clock::time_point now)
{
    std::vector<decayed_device> decayed;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        const clock::time_point reference_time = now - m_max_lifetime;

        auto it = std::remove_if(m_devices.begin(), m_devices.end(), [&decayed, reference_time](const device& known) {
            if(known.last_updated > reference_time)
                return false;

            decayed.push_back(decayed_device {known.id, known.info_url});
            return true;
        });
        m_devices.erase(it, m_devices.end());
    }

    if(!decayed.empty())
    {
        logging::debug("{} device(s) decayed", decayed.size());
        publish_roster();
    }

    return decayed;
}

void device_registry::publish_roster() const
{
    nlohmann::json roster = snapshot();
    m_bus.publish(events::topic::devices_changed, roster);
}

} // namespace upnp
