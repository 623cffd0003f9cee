#include <gtest/gtest.h>

#include <string>

#include "ssdp_message.hpp"
#include "test_support.hpp"

using namespace discovery;

static const std::string location {"http://192.168.1.20:1400/xml/device_description.xml"};
static const std::string udn {"RINCON_000E58A0B1C201400"};

TEST(ssdp_request, is_byte_exact)
{
    EXPECT_EQ(build_discovery_request("urn:schemas-upnp-org:device:ZonePlayer:1", 5),
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: 5\r\n"
        "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
        "\r\n");
}

TEST(ssdp_request, names_the_configured_group)
{
    EXPECT_EQ(build_discovery_request("ssdp:all", 2, "239.255.255.251", 1901),
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: 239.255.255.251:1901\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: 2\r\n"
        "ST: ssdp:all\r\n"
        "\r\n");
}

TEST(ssdp_headers, are_case_insensitive_and_trimmed)
{
    header_map headers = parse_headers("HTTP/1.1 200 OK\r\nlocation:   http://x/  \r\nUsn:uuid:abc\r\nEXT:\r\n\r\n");

    ASSERT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers.at("LOCATION"), "http://x/");
    EXPECT_EQ(headers.at("usn"), "uuid:abc");
    EXPECT_EQ(headers.at("Ext"), "");
}

TEST(ssdp_headers, accept_bare_line_feeds_and_skip_lines_without_colon)
{
    header_map headers = parse_headers("NOTIFY * HTTP/1.1\nHOST: 239.255.255.250:1900\ngarbage line\nNTS: ssdp:alive\n");

    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers.at("host"), "239.255.255.250:1900");
    EXPECT_EQ(headers.at("nts"), "ssdp:alive");
}

TEST(ssdp_headers, status_line_is_no_header)
{
    EXPECT_TRUE(parse_headers("HTTP/1.1 200 OK").empty());
    EXPECT_TRUE(parse_headers("").empty());
}

TEST(ssdp_usn, yields_device_id)
{
    EXPECT_EQ(id_from_usn("uuid:RINCON_000E58A0B1C201400::urn:schemas-upnp-org:device:ZonePlayer:1"),
        "RINCON_000E58A0B1C201400");
    EXPECT_EQ(id_from_usn("uuid:RINCON_000E58A0B1C201400"), "RINCON_000E58A0B1C201400");
    EXPECT_EQ(id_from_usn(" RINCON_1::upnp:rootdevice "), "RINCON_1");
    EXPECT_EQ(id_from_usn(""), "");
}

TEST(ssdp_response, carries_location_and_id)
{
    std::optional<ssdp_message> msg = parse_response(testing_support::discovery_response(udn, location));

    ASSERT_TRUE(msg);
    EXPECT_EQ(msg->location, location);
    EXPECT_EQ(msg->id, udn);
    EXPECT_FALSE(msg->advertisement.has_value());
    EXPECT_EQ(msg->header("st"), "urn:schemas-upnp-org:device:ZonePlayer:1");
}

TEST(ssdp_response, without_location_or_usn_is_invalid)
{
    EXPECT_FALSE(parse_response("HTTP/1.1 200 OK\r\nUSN: uuid:" + udn + "\r\n\r\n"));
    EXPECT_FALSE(parse_response("HTTP/1.1 200 OK\r\nLOCATION: " + location + "\r\n\r\n"));
    EXPECT_FALSE(parse_response("not ssdp at all"));
}

TEST(ssdp_notification, maps_advertisement_types)
{
    std::optional<ssdp_message> alive = parse_notification(testing_support::notification(udn, "ssdp:alive", location));
    ASSERT_TRUE(alive);
    EXPECT_EQ(alive->advertisement, advertisement_type::alive);
    EXPECT_EQ(alive->id, udn);
    EXPECT_EQ(alive->location, location);

    std::optional<ssdp_message> update = parse_notification(testing_support::notification(udn, "ssdp:update", location));
    ASSERT_TRUE(update);
    EXPECT_EQ(update->advertisement, advertisement_type::update);

    std::optional<ssdp_message> bye = parse_notification(testing_support::notification(udn, "ssdp:byebye", location));
    ASSERT_TRUE(bye);
    EXPECT_EQ(bye->advertisement, advertisement_type::goodbye);
}

TEST(ssdp_notification, byebye_needs_no_location)
{
    std::optional<ssdp_message> bye = parse_notification(testing_support::notification(udn, "ssdp:byebye"));

    ASSERT_TRUE(bye);
    EXPECT_EQ(bye->advertisement, advertisement_type::goodbye);
    EXPECT_TRUE(bye->location.empty());
}

TEST(ssdp_notification, alive_without_location_is_invalid)
{
    EXPECT_FALSE(parse_notification(testing_support::notification(udn, "ssdp:alive")));
}

TEST(ssdp_notification, unknown_nts_is_dropped)
{
    EXPECT_FALSE(parse_notification(testing_support::notification(udn, "ssdp:propchange", location)));
    EXPECT_FALSE(parse_notification(testing_support::notification(udn, "", location)));
}

TEST(ssdp_advertisement, round_trips_through_names)
{
    EXPECT_EQ(advertisement_from_nts("ssdp:alive"), advertisement_type::alive);
    EXPECT_EQ(advertisement_from_nts(" ssdp:byebye "), advertisement_type::goodbye);
    EXPECT_FALSE(advertisement_from_nts("SSDP:ALIVE"));
    EXPECT_STREQ(to_string(advertisement_type::goodbye), "goodbye");
}
