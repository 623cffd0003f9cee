#include "ssdp_message.hpp"

#include "log.hpp"

#include <fmt/format.h>

namespace discovery
{

std::string ssdp_message::header(std::string_view name) const
{
    auto it = headers.find(name);
    return (it != headers.end()) ? it->second : std::string {};
}

std::string build_discovery_request(std::string_view target_scope, unsigned max_wait_time, std::string_view group,
    uint16_t port)
{
    return fmt::format("M-SEARCH * HTTP/1.1\r\nHOST: {}:{}\r\nMAN: \"ssdp:discover\"\r\nMX: {}\r\nST: {}\r\n\r\n",
        group, port, max_wait_time, target_scope);
}

std::string id_from_usn(std::string_view usn)
{
    usn = utils::trim(usn);
    if(usn.size() >= 5 && utils::iequals(usn.substr(0, 5), "uuid:"))
        usn.remove_prefix(5);

    std::string_view::size_type sep = usn.find("::");
    if(sep != std::string_view::npos)
        usn = usn.substr(0, sep);

    return std::string {usn};
}

std::optional<advertisement_type> advertisement_from_nts(std::string_view nts)
{
    nts = utils::trim(nts);
    if(nts == "ssdp:alive")
        return advertisement_type::alive;
    else if(nts == "ssdp:update")
        return advertisement_type::update;
    else if(nts == "ssdp:byebye")
        return advertisement_type::goodbye;

    return std::nullopt;
}

const char* to_string(advertisement_type type)
{
    switch(type)
    {
        case advertisement_type::alive:
            return "alive";
        case advertisement_type::update:
            return "update";
        case advertisement_type::goodbye:
            return "goodbye";
    }
    return "";
}

header_map parse_headers(std::string_view view)
{
    header_map headers;

    // The first line is the request or status line
    std::string_view::size_type endl = view.find('\n');
    if(endl == std::string_view::npos)
        return headers;
    view.remove_prefix(endl + 1);

    while(!view.empty())
    {
        endl = view.find('\n');
        std::string_view line = view.substr(0, endl);
        view = (endl == std::string_view::npos) ? std::string_view {} : view.substr(endl + 1);

        if(!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if(line.empty())
            break;

        std::string_view::size_type sep = line.find(':');
        if(sep == std::string_view::npos)
            continue;

        std::string_view key = utils::trim(line.substr(0, sep));
        if(key.empty())
            continue;

        headers.emplace(std::string {key}, std::string {utils::trim(line.substr(sep + 1))});
    }

    return headers;
}

static ssdp_message read_message(std::string_view datagram)
{
    ssdp_message msg;
    msg.headers = parse_headers(datagram);
    msg.location = msg.header("LOCATION");
    msg.id = id_from_usn(msg.header("USN"));
    return msg;
}

std::optional<ssdp_message> parse_response(std::string_view datagram)
{
    ssdp_message msg = read_message(datagram);
    if(msg.location.empty() || msg.id.empty())
    {
        logging::debug("Dropping discovery response without location or usn");
        return std::nullopt;
    }

    return msg;
}

std::optional<ssdp_message> parse_notification(std::string_view datagram)
{
    ssdp_message msg = read_message(datagram);
    if(msg.id.empty())
    {
        logging::debug("Dropping notification without usn");
        return std::nullopt;
    }

    std::string nts = msg.header("NTS");
    msg.advertisement = advertisement_from_nts(nts);
    if(!msg.advertisement)
    {
        logging::error("Unknown advertisement type '{}'", nts);
        return std::nullopt;
    }

    // ssdp:byebye carries no LOCATION header on most devices
    if(msg.location.empty() && msg.advertisement != advertisement_type::goodbye)
    {
        logging::debug("Dropping {} notification without location", to_string(*msg.advertisement));
        return std::nullopt;
    }

    return msg;
}

} // namespace discovery
