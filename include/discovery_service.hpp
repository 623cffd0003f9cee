#ifndef ZONESCAN_DISCOVERY_SERVICE_HPP
#define ZONESCAN_DISCOVERY_SERVICE_HPP

#include <string>
#include <vector>
#include <set>
#include <atomic>
#include <optional>
#include <memory>
#include <mutex>

#include "config.hpp"
#include "transport.hpp"
#include "event_loop.hpp"
#include "event_bus.hpp"
#include "device_registry.hpp"
#include "ssdp_message.hpp"

namespace discovery
{

enum class service_state
{
    stopped,
    starting,
    running
};

const char* to_string(service_state state);

/**
 * Token shared by everything a running service schedules
 * Tasks and transport callbacks hold a reference and only reach the service while the token is active,
 * so a stopped or destroyed service is never touched by work from an earlier session.
 */
struct service_session
{
    std::recursive_mutex mutex;
    bool active = false;
};

/**
 * Keeps the device registry in sync with the devices on the network
 *
 * Joins the SSDP multicast group for notifications and sends out discovery bursts. Every inbound datagram and
 * every http completion is posted to the executor and handled there, so the state of the service is only touched
 * from one place. Results that arrive after stop() are dropped, as is everything scheduled before a restart.
 * The executor and the transport have to outlive the service.
 */
class discovery_service
{
public:

    discovery_service() = delete;
    discovery_service(const discovery_service&) = delete;
    discovery_service& operator=(const discovery_service&) = delete;
    discovery_service(discovery_service&&) = delete;
    discovery_service& operator=(discovery_service&&) = delete;
    ~discovery_service();

    discovery_service(const config::settings& cfg, transport& net, runtime::executor& exec, events::event_bus& bus);

    /// Returns false if there is no way to open the multicast socket, the service stays stopped then
    bool start();

    void stop();

    /// Sends one discovery burst
    void discover();

    /// Accepts a device id or the url of a description document
    void request_device_details(const std::string& info);

    /// Asks the device for its current media and publishes the answer as media_info_received
    bool request_media_state(const std::string& device_id);

    std::vector<upnp::device> devices() const
    {
        return m_registry.snapshot();
    }

    const upnp::device_registry& registry() const
    {
        return m_registry;
    }

    service_state state() const
    {
        return m_state.load();
    }

    bool running() const
    {
        return m_state.load() == service_state::running;
    }

    const std::string& last_error() const
    {
        return m_last_error;
    }

private:

    void on_discovery_response(const std::string& data);

    void on_multicast_notification(const std::string& data);

    void fetch_details(const std::string& location);

    void on_details(const std::string& location, upnp::clock::time_point requested, const fetch_result& result);

    void on_media_state(const std::string& device_id, const fetch_result& result);

    void manage_device_decay();

    void send_discovery(socket_handle handle, const std::string& payload, unsigned attempt);

    void end_session();

    config::settings m_config;

    transport& m_net;

    runtime::executor& m_exec;

    events::event_bus& m_bus;

    upnp::device_registry m_registry;

    std::atomic<service_state> m_state {service_state::stopped};

    std::shared_ptr<service_session> m_session;

    std::optional<socket_handle> m_multicast_socket;

    std::set<std::string> m_pending_fetches;    // Locations with a detail request in flight

    std::string m_last_error;

};

} // namespace discovery

#endif
