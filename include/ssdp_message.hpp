#ifndef ZONESCAN_SSDP_MESSAGE_HPP
#define ZONESCAN_SSDP_MESSAGE_HPP

#include <string>
#include <string_view>
#include <map>
#include <optional>

#include "utils.hpp"

#define ZONESCAN_SSDP_MULTICAST_IP "239.255.255.250"
#define ZONESCAN_SSDP_PORT 1900

namespace discovery
{

enum class advertisement_type
{
    alive,
    update,
    goodbye
};

using header_map = std::map<std::string, std::string, utils::ci_less>;

/**
 * Discovery response or multicast notification
 * A message is only ever handed out with a location and an id, everything else is dropped by the parser.
 */
struct ssdp_message
{
    header_map headers;
    std::optional<advertisement_type> advertisement;    // Notifications only
    std::string location;
    std::string id;

    std::string header(std::string_view name) const;
};

/// M-SEARCH payload, the HOST header names the group the request is sent to
std::string build_discovery_request(std::string_view target_scope, unsigned max_wait_time,
    std::string_view group = ZONESCAN_SSDP_MULTICAST_IP, uint16_t port = ZONESCAN_SSDP_PORT);

/// Device id from a USN value like "uuid:RINCON_000E58A0B1C201400::urn:schemas-upnp-org:device:ZonePlayer:1"
std::string id_from_usn(std::string_view usn);

std::optional<advertisement_type> advertisement_from_nts(std::string_view nts);

const char* to_string(advertisement_type type);

header_map parse_headers(std::string_view datagram);

std::optional<ssdp_message> parse_response(std::string_view datagram);

std::optional<ssdp_message> parse_notification(std::string_view datagram);

} // namespace discovery

#endif
