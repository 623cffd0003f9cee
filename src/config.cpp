#include "config.hpp"

#include <fstream>
#include <stdexcept>
#include <cstdint>

#include <fmt/format.h>

using nlohmann::json;

namespace config
{

// Integers are read wide and narrowed only after the range check
static int64_t to_integer(const json& value, const char* key, int64_t min, int64_t max)
{
    if(!value.is_number_integer())
        throw std::runtime_error {fmt::format("{} must be an integer", key)};

    bool in_range = value.is_number_unsigned()
        ? value.get<uint64_t>() <= static_cast<uint64_t>(max) && static_cast<int64_t>(value.get<uint64_t>()) >= min
        : value.get<int64_t>() >= min && value.get<int64_t>() <= max;
    if(!in_range)
        throw std::runtime_error {fmt::format("{} must be between {} and {}", key, min, max)};

    return value.get<int64_t>();
}

static int64_t read_integer(const json& j, const char* key, int64_t fallback, int64_t min, int64_t max)
{
    return j.contains(key) ? to_integer(j.at(key), key, min, max) : fallback;
}

settings from_json(const json& j)
{
    settings cfg;
    if(!j.is_object())
        throw std::runtime_error {"Configuration must be a json object"};

    try {
        cfg.multicast_address = j.value("multicast_address", cfg.multicast_address);
        cfg.multicast_port = static_cast<uint16_t>(read_integer(j, "multicast_port", cfg.multicast_port, 1, 65535));
        cfg.search_target = j.value("search_target", cfg.search_target);
        cfg.max_wait_time = static_cast<unsigned>(read_integer(j, "max_wait_time", cfg.max_wait_time, 1, 120));
        cfg.burst_repeat = static_cast<unsigned>(read_integer(j, "burst_repeat", cfg.burst_repeat, 1, 100));
        cfg.burst_interval = std::chrono::milliseconds {read_integer(j, "burst_interval_ms", cfg.burst_interval.count(), 0, 60000)};

        if(j.contains("burst_delays_ms"))
        {
            const json& delays = j.at("burst_delays_ms");
            if(!delays.is_array())
                throw std::runtime_error {"burst_delays_ms must be an array"};

            cfg.burst_delays.clear();
            for(const auto& delay : delays)
                cfg.burst_delays.emplace_back(to_integer(delay, "burst_delays_ms", 0, 3600000));
        }

        cfg.discovery_socket_timeout = std::chrono::seconds {read_integer(j, "discovery_socket_timeout_s",
            cfg.discovery_socket_timeout.count(), 1, 3600)};
        cfg.device_max_lifetime = std::chrono::milliseconds {read_integer(j, "device_max_lifetime_ms",
            cfg.device_max_lifetime.count(), 1, 86400000)};
        cfg.http_timeout = std::chrono::seconds {read_integer(j, "http_timeout_s", cfg.http_timeout.count(), 1, 3600)};

        if(j.contains("log_level"))
        {
            std::string name = j.at("log_level").get<std::string>();
            auto lvl = logging::level_from_string(name);
            if(!lvl)
                throw std::runtime_error {fmt::format("Unknown log level '{}'", name)};
            cfg.log_level = *lvl;
        }
    } catch(json::exception& e) {
        throw std::runtime_error {fmt::format("Invalid configuration: {}", e.what())};
    }

    return cfg;
}

settings load_config(const std::string& path)
{
    std::ifstream ifs {path};
    if(!ifs.good())
        throw std::runtime_error {fmt::format("Can not open configuration file {}", path)};

    json j;
    try {
        j = json::parse(ifs);
    } catch(json::parse_error& e) {
        throw std::runtime_error {fmt::format("Configuration file {} is not valid json: {}", path, e.what())};
    }

    return from_json(j);
}

} // namespace config
