#ifndef ZONESCAN_CONFIG_HPP
#define ZONESCAN_CONFIG_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "ssdp_message.hpp"
#include "log.hpp"

namespace config
{

struct settings
{
    std::string multicast_address {ZONESCAN_SSDP_MULTICAST_IP};
    uint16_t multicast_port = ZONESCAN_SSDP_PORT;

    std::string search_target {"urn:schemas-upnp-org:device:ZonePlayer:1"};
    unsigned max_wait_time = 5;

    // A discovery burst sends the same request burst_repeat times, burst_interval apart
    unsigned burst_repeat = 4;
    std::chrono::milliseconds burst_interval {500};

    // Additional bursts after start for devices that missed the first one
    std::vector<std::chrono::milliseconds> burst_delays {std::chrono::milliseconds {3000}, std::chrono::milliseconds {10000}};

    std::chrono::seconds discovery_socket_timeout {30};
    std::chrono::milliseconds device_max_lifetime {std::chrono::minutes {5}};
    std::chrono::seconds http_timeout {10};

    logging::level log_level = logging::level::info;
};

/// Keys missing in j keep their defaults. Throws std::runtime_error on values of the wrong type or range.
settings from_json(const nlohmann::json& j);

/// Throws std::runtime_error if the file can not be read or is not valid json
settings load_config(const std::string& path);

} // namespace config

#endif
