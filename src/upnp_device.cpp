#include "upnp_device.hpp"

#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>

namespace upnp
{

bool device::service_available(std::string_view service_id) const
{
    return get_service_information(service_id).has_value();
}

std::optional<std::reference_wrapper<const upnp_service>> device::get_service_information(std::string_view service_id) const
{
    // Devices typically have only a handful of services
    // So using a vector and search for it should be as efficient as using unordered_map/set if not more efficient
    auto it = std::find_if(services.begin(), services.end(), [&s_id = service_id](const upnp_service& service) {
        return service.id == s_id;
    });

    if(it != services.end())
        return *it;
    else
        return std::nullopt;
}

// A missing url stays empty instead of resolving to the document directory
static std::string service_url(std::string_view base, const std::string& relative)
{
    return relative.empty() ? std::string {} : utils::resolve_url(base, relative);
}

static void read_services(const xml::node& device_node, std::string_view base, std::vector<upnp_service>& services)
{
    for(const xml::node* service_node : xml::query(device_node, "serviceList/service"))
    {
        // The serviceId ist the last part of a schema string with the form urn:upnp-org:serviceId:RenderingControl
        std::string service_id = xml::query_text(*service_node, "serviceId");
        std::string::size_type service_offset = service_id.find_last_of(':');
        if(service_offset != std::string::npos)
            service_id.erase(0, service_offset + 1);

        if(service_id.empty())
            continue;

        services.push_back(upnp_service {
            std::move(service_id),
            service_url(base, xml::query_text(*service_node, "controlURL")),
            service_url(base, xml::query_text(*service_node, "SCPDURL")),
            service_url(base, xml::query_text(*service_node, "eventSubURL"))
        });
    }

    // Players announce their renderer services in embedded devices
    for(const xml::node* embedded : xml::query(device_node, "deviceList/device"))
        read_services(*embedded, base, services);
}

std::optional<device> device_from_xml(const xml::node& root, std::string_view location)
{
    std::vector<const xml::node*> device_nodes = xml::query(root, "/root/device");
    if(device_nodes.empty())
        return std::nullopt;
    const xml::node& device_node = *device_nodes.front();

    device dev;
    std::string udn = xml::query_text(device_node, "UDN");
    std::string_view udn_view = utils::trim(udn);
    if(udn_view.size() >= 5 && utils::iequals(udn_view.substr(0, 5), "uuid:"))
        udn_view.remove_prefix(5);
    if(udn_view.empty())
        return std::nullopt;
    dev.id = std::string {udn_view};

    dev.info_url = std::string {location};
    dev.device_type = xml::query_text(device_node, "deviceType");
    dev.friendly_name = xml::query_text(device_node, "friendlyName");
    dev.room_name = xml::query_text(device_node, "roomName");
    dev.manufacturer = xml::query_text(device_node, "manufacturer");
    dev.model_name = xml::query_text(device_node, "modelName");
    dev.model_number = xml::query_text(device_node, "modelNumber");
    dev.serial_number = xml::query_text(device_node, "serialNum");
    dev.software_version = xml::query_text(device_node, "softwareVersion");

    std::string base = xml::query_text(root, "/root/URLBase");
    if(base.empty())
        base = std::string {location};

    read_services(device_node, base, dev.services);

    if(auto service = dev.get_service_information(media_state_service))
        dev.media_state_url = service->get().control_url;
    else
        logging::debug("Device {} has no {} service", dev.id, media_state_service);

    return dev;
}

static bool is_encoded(std::string_view metadata)
{
    if(metadata.rfind("&lt;", 0) == 0)
        return true;
    return utils::iequals(metadata.substr(0, 3), "%3C") || utils::iequals(metadata.substr(0, 5), "%26lt");
}

static track_info parse_track(std::string metadata)
{
    track_info track;
    if(utils::trim(metadata).empty() || metadata == "NOT_IMPLEMENTED")
        return track;

    if(is_encoded(metadata))
        metadata = xml::decode(metadata);

    try {
        xml::document didl = xml::parse(metadata);
        track.title = xml::query_text(*didl, "/DIDL-Lite/item/title");
        track.creator = xml::query_text(*didl, "/DIDL-Lite/item/creator");
        track.album = xml::query_text(*didl, "/DIDL-Lite/item/album");
        track.album_art_uri = xml::query_text(*didl, "/DIDL-Lite/item/albumArtURI");
    } catch(xml::parse_error& e) {
        logging::warning("Track metadata is not valid xml: {}", e.what());
    }

    return track;
}

std::optional<media_info> media_info_from_xml(const xml::node& root)
{
    std::vector<const xml::node*> response = xml::query(root, "/Envelope/Body/GetMediaInfoResponse");
    if(response.empty())
        return std::nullopt;
    const xml::node& res = *response.front();

    media_info info;
    std::string tracks = xml::query_text(res, "NrTracks");
    if(auto conv = std::from_chars(tracks.data(), tracks.data() + tracks.size(), info.tracks); conv.ec != std::errc {})
        info.tracks = 0;

    info.duration = xml::query_text(res, "MediaDuration");
    info.current_uri = xml::query_text(res, "CurrentURI");
    info.next_uri = xml::query_text(res, "NextURI");
    info.play_medium = xml::query_text(res, "PlayMedium");
    info.track = parse_track(xml::query_text(res, "CurrentURIMetaData"));

    return info;
}

void to_json(nlohmann::json& j, const upnp_service& service)
{
    j = nlohmann::json {
        {"id", service.id},
        {"controlUrl", service.control_url},
        {"scpdUrl", service.scpd_url},
        {"eventSubUrl", service.event_sub_url}
    };
}

void to_json(nlohmann::json& j, const device& dev)
{
    j = nlohmann::json {
        {"id", dev.id},
        {"infoUrl", dev.info_url},
        {"mediaStateUrl", dev.media_state_url},
        {"deviceType", dev.device_type},
        {"friendlyName", dev.friendly_name},
        {"roomName", dev.room_name},
        {"manufacturer", dev.manufacturer},
        {"modelName", dev.model_name},
        {"modelNumber", dev.model_number},
        {"serialNumber", dev.serial_number},
        {"softwareVersion", dev.software_version},
        {"services", dev.services}
    };
}

void to_json(nlohmann::json& j, const media_info& info)
{
    j = nlohmann::json {
        {"deviceId", info.device_id},
        {"tracks", info.tracks},
        {"duration", info.duration},
        {"currentUri", info.current_uri},
        {"nextUri", info.next_uri},
        {"playMedium", info.play_medium},
        {"track", {
            {"title", info.track.title},
            {"creator", info.track.creator},
            {"album", info.track.album},
            {"albumArtUri", info.track.album_art_uri}
        }}
    };
}

} // namespace upnp
