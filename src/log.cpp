#include "log.hpp"

#include <atomic>
#include <mutex>
#include <cstdio>

namespace logging
{

static std::atomic<level> current_level {level::info};
static std::mutex output_mutex;

static const char* level_tag(level lvl)
{
    switch(lvl)
    {
        case level::debug:
            return "DEBUG";
        case level::info:
            return "INFO";
        case level::warning:
            return "WARNING";
        case level::error:
            return "ERROR";
    }
    return "";
}

void set_level(level lvl)
{
    current_level.store(lvl);
}

level get_level()
{
    return current_level.load();
}

std::optional<level> level_from_string(std::string_view name)
{
    if(name == "debug")
        return level::debug;
    else if(name == "info")
        return level::info;
    else if(name == "warning")
        return level::warning;
    else if(name == "error")
        return level::error;

    return std::nullopt;
}

void write(level lvl, std::string_view msg)
{
    std::lock_guard<std::mutex> lock {output_mutex};
    fmt::print(stderr, "[{}]: {}\n", level_tag(lvl), msg);
}

} // namespace logging
