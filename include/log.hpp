#ifndef ZONESCAN_LOG_HPP
#define ZONESCAN_LOG_HPP

#include <string>
#include <string_view>
#include <optional>
#include <utility>

#include <fmt/format.h>

namespace logging
{

enum class level
{
    debug,
    info,
    warning,
    error
};

void set_level(level lvl);

level get_level();

std::optional<level> level_from_string(std::string_view name);

void write(level lvl, std::string_view msg);

template<typename... Args>
inline void debug(fmt::format_string<Args...> format, Args&&... args)
{
    if(get_level() <= level::debug)
        write(level::debug, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
inline void info(fmt::format_string<Args...> format, Args&&... args)
{
    if(get_level() <= level::info)
        write(level::info, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
inline void warning(fmt::format_string<Args...> format, Args&&... args)
{
    if(get_level() <= level::warning)
        write(level::warning, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
inline void error(fmt::format_string<Args...> format, Args&&... args)
{
    write(level::error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace logging

#endif
