#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>
#include <stdexcept>

#include "config.hpp"

using json = nlohmann::json;

TEST(config, defaults_match_ssdp_constants)
{
    config::settings cfg;

    EXPECT_EQ(cfg.multicast_address, "239.255.255.250");
    EXPECT_EQ(cfg.multicast_port, 1900);
    EXPECT_EQ(cfg.search_target, "urn:schemas-upnp-org:device:ZonePlayer:1");
    EXPECT_EQ(cfg.max_wait_time, 5u);
    EXPECT_EQ(cfg.burst_repeat, 4u);
    EXPECT_EQ(cfg.burst_interval, std::chrono::milliseconds {500});
    ASSERT_EQ(cfg.burst_delays.size(), 2u);
    EXPECT_EQ(cfg.burst_delays[0], std::chrono::seconds {3});
    EXPECT_EQ(cfg.burst_delays[1], std::chrono::seconds {10});
    EXPECT_EQ(cfg.discovery_socket_timeout, std::chrono::seconds {30});
    EXPECT_EQ(cfg.device_max_lifetime, std::chrono::minutes {5});
    EXPECT_EQ(cfg.log_level, logging::level::info);
}

TEST(config, missing_keys_keep_defaults)
{
    config::settings cfg = config::from_json(json::object());

    EXPECT_EQ(cfg.multicast_port, 1900);
    EXPECT_EQ(cfg.burst_repeat, 4u);
}

TEST(config, reads_every_key)
{
    json j = json::parse(R"({
        "multicast_address": "239.255.255.251",
        "multicast_port": 1901,
        "search_target": "ssdp:all",
        "max_wait_time": 2,
        "burst_repeat": 2,
        "burst_interval_ms": 100,
        "burst_delays_ms": [1000],
        "discovery_socket_timeout_s": 5,
        "device_max_lifetime_ms": 60000,
        "http_timeout_s": 3,
        "log_level": "debug"
    })");
    config::settings cfg = config::from_json(j);

    EXPECT_EQ(cfg.multicast_address, "239.255.255.251");
    EXPECT_EQ(cfg.multicast_port, 1901);
    EXPECT_EQ(cfg.search_target, "ssdp:all");
    EXPECT_EQ(cfg.max_wait_time, 2u);
    EXPECT_EQ(cfg.burst_repeat, 2u);
    EXPECT_EQ(cfg.burst_interval, std::chrono::milliseconds {100});
    ASSERT_EQ(cfg.burst_delays.size(), 1u);
    EXPECT_EQ(cfg.burst_delays[0], std::chrono::milliseconds {1000});
    EXPECT_EQ(cfg.discovery_socket_timeout, std::chrono::seconds {5});
    EXPECT_EQ(cfg.device_max_lifetime, std::chrono::milliseconds {60000});
    EXPECT_EQ(cfg.http_timeout, std::chrono::seconds {3});
    EXPECT_EQ(cfg.log_level, logging::level::debug);
}

TEST(config, rejects_invalid_values)
{
    EXPECT_THROW(config::from_json(json::array()), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"multicast_port", "nineteen hundred"}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"log_level", "loud"}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"burst_repeat", 0}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"device_max_lifetime_ms", 0}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"burst_delays_ms", {"soon"}}}), std::runtime_error);
}

TEST(config, rejects_values_out_of_range)
{
    EXPECT_THROW(config::from_json(json {{"multicast_port", 70000}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"multicast_port", 0}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"max_wait_time", -1}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"burst_interval_ms", -500}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"burst_delays_ms", {1000, -1}}}), std::runtime_error);
    EXPECT_THROW(config::from_json(json {{"http_timeout_s", 1.5}}), std::runtime_error);

    config::settings cfg = config::from_json(json {{"multicast_port", 65535}, {"max_wait_time", 1}});
    EXPECT_EQ(cfg.multicast_port, 65535);
    EXPECT_EQ(cfg.max_wait_time, 1u);
}

TEST(config, load_config_reads_file)
{
    const std::string path = ::testing::TempDir() + "zonescan_config_test.json";
    {
        std::ofstream ofs {path};
        ofs << R"({"search_target": "upnp:rootdevice", "burst_repeat": 1})";
    }

    config::settings cfg = config::load_config(path);
    std::remove(path.c_str());

    EXPECT_EQ(cfg.search_target, "upnp:rootdevice");
    EXPECT_EQ(cfg.burst_repeat, 1u);
}

TEST(config, load_config_rejects_broken_files)
{
    EXPECT_THROW(config::load_config("/nonexistent/zonescan.json"), std::runtime_error);

    const std::string path = ::testing::TempDir() + "zonescan_broken_config.json";
    {
        std::ofstream ofs {path};
        ofs << "{ not json";
    }

    EXPECT_THROW(config::load_config(path), std::runtime_error);
    std::remove(path.c_str());
}
