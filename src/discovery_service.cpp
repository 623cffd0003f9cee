#include "discovery_service.hpp"

#include "log.hpp"
#include "xml_parser.hpp"
#include "upnp_device.hpp"

#include <stdexcept>
#include <functional>

namespace discovery
{

static constexpr const char* media_state_action = "GetMediaInfo";

// Wraps fn so that it only runs while the session it was scheduled in is active
static runtime::task in_session(std::shared_ptr<service_session> token, std::function<void()> fn)
{
    return [token = std::move(token), fn = std::move(fn)]() {
        std::lock_guard<std::recursive_mutex> lock {token->mutex};
        if(token->active)
            fn();
    };
}

const char* to_string(service_state state)
{
    switch(state)
    {
        case service_state::stopped:
            return "stopped";
        case service_state::starting:
            return "starting";
        case service_state::running:
            return "running";
    }
    return "";
}

discovery_service::discovery_service(const config::settings& cfg, transport& net, runtime::executor& exec,
    events::event_bus& bus)
    : m_config {cfg}, m_net {net}, m_exec {exec}, m_bus {bus}, m_registry {bus, cfg.device_max_lifetime},
      m_session {std::make_shared<service_session>()}
{}

discovery_service::~discovery_service()
{
    stop();
    end_session();
}

bool discovery_service::start()
{
    if(m_state.load() != service_state::stopped)
        return true;

    if(!m_net.have_socket_support())
    {
        m_last_error = "No socket support. Can not run the discovery service.";
        logging::error("{}", m_last_error);
        return false;
    }

    logging::info("Starting the discovery service");
    m_state.store(service_state::starting);

    // Work left over from an earlier session never runs again
    m_session = std::make_shared<service_session>();
    m_session->active = true;
    m_pending_fetches.clear();

    try {
        m_multicast_socket = m_net.open_multicast_socket(m_config.multicast_address, m_config.multicast_port,
            [this, token = m_session, &exec = m_exec](std::string data) {
                exec.post(in_session(token, [this, data = std::move(data)]() {
                    on_multicast_notification(data);
                }));
            });
    } catch(std::runtime_error& e) {
        m_last_error = e.what();
        logging::error("Could not join the multicast group {}:{}: {}", m_config.multicast_address,
            m_config.multicast_port, m_last_error);
        end_session();
        m_state.store(service_state::stopped);
        return false;
    }

    m_last_error.clear();
    m_state.store(service_state::running);

    // Just send out whatever we got to start with
    m_registry.publish_roster();

    // Go wild with discovery at startup
    discover();
    for(const auto& delay : m_config.burst_delays)
    {
        m_exec.post_after(delay, in_session(m_session, [this]() {
            discover();
        }));
    }

    return true;
}

void discovery_service::stop()
{
    if(m_state.load() == service_state::stopped)
        return;

    logging::info("Stopping the discovery service");
    end_session();
    m_state.store(service_state::stopped);

    if(m_multicast_socket)
    {
        m_net.close(*m_multicast_socket);
        m_multicast_socket.reset();
    }
}

void discovery_service::end_session()
{
    // Waits for a task of the session that is running right now
    std::lock_guard<std::recursive_mutex> lock {m_session->mutex};
    m_session->active = false;
}

void discovery_service::discover()
{
    std::shared_ptr<service_session> token = m_session;
    m_exec.post(in_session(token, [this, token]() {
        if(!running())
            return;

        logging::info("Sending discovery for {}", m_config.search_target);
        std::string payload = build_discovery_request(m_config.search_target, m_config.max_wait_time,
            m_config.multicast_address, m_config.multicast_port);

        // Devices may wait up to max_wait_time before they answer, the socket stays open a while longer than that
        socket_handle handle;
        try {
            handle = m_net.open_socket(m_config.multicast_address, m_config.multicast_port,
                m_config.discovery_socket_timeout, [this, token, &exec = m_exec](std::string data) {
                    exec.post(in_session(token, [this, data = std::move(data)]() {
                        on_discovery_response(data);
                    }));
                });
        } catch(std::runtime_error& e) {
            logging::error("Could not open discovery socket: {}", e.what());
            return;
        }

        // Send the request a number of times in hope that all devices are reached
        for(unsigned attempt = 0; attempt < m_config.burst_repeat; ++attempt)
        {
            m_exec.post_after(m_config.burst_interval * attempt, in_session(token, [this, handle, payload, attempt]() {
                send_discovery(handle, payload, attempt);
            }));
        }
    }));
}

void discovery_service::send_discovery(socket_handle handle, const std::string& payload, unsigned attempt)
{
    if(!running())
        return;

    logging::debug("Sending discovery request {}", attempt);
    try {
        m_net.send(handle, payload);
    } catch(std::runtime_error& e) {
        logging::debug("Discovery request {} not sent: {}", attempt, e.what());
    }
}

void discovery_service::request_device_details(const std::string& info)
{
    if(!running())
    {
        logging::warning("Discovery service is not running, not requesting details for {}", info);
        return;
    }

    m_exec.post(in_session(m_session, [this, info]() {
        std::optional<upnp::device> known = m_registry.find(info);
        fetch_details(known ? known->info_url : info);
    }));
}

bool discovery_service::request_media_state(const std::string& device_id)
{
    std::optional<upnp::device> dev = m_registry.find(device_id);
    if(!dev)
    {
        logging::warning("No device in cache with id: {}", device_id);
        return false;
    }

    if(dev->media_state_url.empty())
    {
        logging::warning("Device {} has no media state service", device_id);
        return false;
    }

    logging::debug("Requesting media state for device: {}", device_id);
    m_net.soap_request(dev->media_state_url, soap_action {upnp::media_state_service, media_state_action, ""},
        [this, device_id, token = m_session, &exec = m_exec](fetch_result result) {
            exec.post(in_session(token, [this, device_id, result = std::move(result)]() {
                on_media_state(device_id, result);
            }));
        });

    return true;
}

void discovery_service::on_discovery_response(const std::string& data)
{
    if(!running())
        return;

    std::optional<ssdp_message> response = parse_response(data);
    if(!response)
        return;

    // Discovery requests are sent in bursts, multiple responses per device are expected
    if(m_registry.contains(response->id) || m_pending_fetches.count(response->location) > 0)
        return;

    fetch_details(response->location);
}

void discovery_service::on_multicast_notification(const std::string& data)
{
    if(!running())
        return;

    std::optional<ssdp_message> notification = parse_notification(data);
    if(!notification)
        return;

    logging::debug("Got a notification message: {} from {}", to_string(*notification->advertisement), notification->id);

    switch(*notification->advertisement)
    {
        case advertisement_type::goodbye:
            m_registry.remove(notification->id);
            break;
        case advertisement_type::alive:
        case advertisement_type::update:
            // The description may have changed, so fetch it even for known devices
            fetch_details(notification->location);
            break;
    }
}

void discovery_service::fetch_details(const std::string& location)
{
    logging::debug("Making device details request for: {}", location);

    // The request time is the update time, so the sweep below finds the device decayed unless it was refreshed since
    const upnp::clock::time_point requested = m_exec.now();
    m_pending_fetches.insert(location);

    m_net.http_get(location, [this, location, requested, token = m_session, &exec = m_exec](fetch_result result) {
        exec.post(in_session(token, [this, location, requested, result = std::move(result)]() {
            on_details(location, requested, result);
        }));
    });

    m_exec.post_after(m_registry.max_lifetime(), in_session(m_session, [this]() {
        manage_device_decay();
    }));
}

void discovery_service::on_details(const std::string& location, upnp::clock::time_point requested,
    const fetch_result& result)
{
    m_pending_fetches.erase(location);

    if(!running())
    {
        logging::debug("Dropping device details from {}, service is stopped", location);
        return;
    }

    if(!result)
    {
        logging::warning("Device details request for {} failed: {}", location, result.error);
        return;
    }

    try {
        xml::document doc = xml::parse(result.body);
        std::optional<upnp::device> dev = upnp::device_from_xml(*doc, location);
        if(!dev)
        {
            logging::error("Description from {} does not describe a device", location);
            return;
        }

        dev->last_updated = requested;
        m_registry.upsert(std::move(*dev));
    } catch(xml::parse_error& e) {
        logging::error("Had problems to parse device description from {}: {} at offset {}", location, e.what(), e.where());
    }
}

void discovery_service::on_media_state(const std::string& device_id, const fetch_result& result)
{
    if(!running())
        return;

    if(!result)
    {
        logging::warning("Media state request for {} failed: {}", device_id, result.error);
        return;
    }

    try {
        xml::document doc = xml::parse(result.body);
        std::optional<upnp::media_info> info = upnp::media_info_from_xml(*doc);
        if(!info)
        {
            logging::error("Had problems to parse media info xml from {}", device_id);
            return;
        }

        info->device_id = device_id;
        m_bus.publish(events::topic::media_info_received, *info);
    } catch(xml::parse_error& e) {
        logging::error("Had problems to parse media info xml from {}: {}", device_id, e.what());
    }
}

/**
 * Cleans up and refreshes the device cache
 *
 * A device that has not been updated within the max lifetime is removed and its details are requested again.
 * A device that does not answer anymore therefore disappears from the roster.
 */
void discovery_service::manage_device_decay()
{
    if(!running())
        return;

    for(const auto& decayed : m_registry.sweep_decayed(m_exec.now()))
    {
        logging::debug("Device {} decayed, requesting details again", decayed.id);
        fetch_details(decayed.info_url);
    }
}

} // namespace discovery
