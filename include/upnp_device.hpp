#ifndef ZONESCAN_UPNP_DEVICE_HPP
#define ZONESCAN_UPNP_DEVICE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <functional>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "xml_parser.hpp"

namespace upnp
{

using clock = std::chrono::steady_clock;

// Service that answers GetMediaInfo
inline constexpr const char* media_state_service = "AVTransport";

struct upnp_service
{
    std::string id;
    std::string control_url;
    std::string scpd_url;
    std::string event_sub_url;
};

struct device
{
    std::string id;                 // UDN without the "uuid:" prefix, equal to the id derived from the USN
    std::string info_url;           // Location of the description document
    std::string media_state_url;    // Absolute control url of the AVTransport service
    clock::time_point last_updated {};

    std::string device_type;
    std::string friendly_name;
    std::string room_name;
    std::string manufacturer;
    std::string model_name;
    std::string model_number;
    std::string serial_number;
    std::string software_version;

    std::vector<upnp_service> services;

    bool service_available(std::string_view service_id) const;

    std::optional<std::reference_wrapper<const upnp_service>> get_service_information(std::string_view service_id) const;
};

/**
 * Extracts a device from a parsed description document
 * Relative service urls are resolved against URLBase or, if the document has none, against location.
 * Returns std::nullopt if the document has no /root/device/UDN.
 */
std::optional<device> device_from_xml(const xml::node& root, std::string_view location);

struct track_info
{
    std::string title;
    std::string creator;
    std::string album;
    std::string album_art_uri;
};

struct media_info
{
    std::string device_id;
    uint32_t tracks = 0;
    std::string duration;
    std::string current_uri;
    std::string next_uri;
    std::string play_medium;
    track_info track;
};

/// Reads the body of a GetMediaInfo response, std::nullopt if it is none
std::optional<media_info> media_info_from_xml(const xml::node& root);

void to_json(nlohmann::json& j, const upnp_service& service);

void to_json(nlohmann::json& j, const device& dev);

void to_json(nlohmann::json& j, const media_info& info);

} // namespace upnp

#endif
