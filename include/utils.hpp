#ifndef ZONESCAN_UTILS_HPP
#define ZONESCAN_UTILS_HPP

#include <string>
#include <string_view>
#include <cstdint>

namespace utils
{

struct url
{
    std::string scheme;
    std::string host;
    uint16_t port;
    std::string path;
};

// Throws std::invalid_argument if the string is not of the form scheme://host[:port][/path]
url parse_url(std::string_view location);

// scheme://host:port of the given url
std::string url_origin(const url& parsed);

// Resolves a reference found in a description document against the document location
std::string resolve_url(std::string_view base, std::string_view reference);

// Decodes every %XX sequence. Malformed sequences are kept as they are.
std::string url_decode(std::string_view encoded);

std::string_view trim(std::string_view view);

bool iequals(std::string_view lhs, std::string_view rhs);

// Case-insensitive ordering for header maps
struct ci_less
{
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

} // namespace utils

#endif
