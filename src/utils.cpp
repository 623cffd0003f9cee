#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace utils
{

static const char* invalid_url_msg = "Not a valid location url";

url parse_url(std::string_view location)
{
    url parsed;

    std::string_view::size_type tmp = location.find("://");
    if(tmp == std::string_view::npos || tmp == 0)
        throw std::invalid_argument {invalid_url_msg};

    parsed.scheme = std::string {location.data(), tmp};
    location.remove_prefix(tmp + 3);

    std::string_view::size_type path_start = location.find('/');
    std::string_view authority = location.substr(0, path_start);
    if(authority.empty())
        throw std::invalid_argument {invalid_url_msg};

    tmp = authority.find(':');
    if(tmp == std::string_view::npos)
    {
        parsed.host = std::string {authority};
        parsed.port = (parsed.scheme == "https") ? 443 : 80;
    }
    else
    {
        parsed.host = std::string {authority.data(), tmp};
        std::string_view port_view = authority.substr(tmp + 1);
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), parsed.port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size())
            throw std::invalid_argument {invalid_url_msg};
    }

    if(parsed.host.empty())
        throw std::invalid_argument {invalid_url_msg};

    parsed.path = (path_start == std::string_view::npos) ? "/" : std::string {location.substr(path_start)};
    return parsed;
}

std::string url_origin(const url& parsed)
{
    return parsed.scheme + "://" + parsed.host + ":" + std::to_string(parsed.port);
}

std::string resolve_url(std::string_view base, std::string_view reference)
{
    if(reference.find("://") != std::string_view::npos)
        return std::string {reference};

    url parsed;
    try {
        parsed = parse_url(base);
    } catch(std::invalid_argument&) {
        return std::string {reference};
    }

    if(!reference.empty() && reference.front() == '/')
        return url_origin(parsed) + std::string {reference};

    // Relative to the directory of the document
    std::string dir = parsed.path.substr(0, parsed.path.find_last_of('/') + 1);
    return url_origin(parsed) + dir + std::string {reference};
}

static int hex_value(char c)
{
    if(c >= '0' && c <= '9')
        return c - '0';
    if(c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if(c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view encoded)
{
    std::string decoded;
    decoded.reserve(encoded.size());

    for(size_t i = 0; i < encoded.size(); ++i)
    {
        if(encoded[i] == '%' && i + 2 < encoded.size())
        {
            int high = hex_value(encoded[i + 1]);
            int low = hex_value(encoded[i + 2]);
            if(high >= 0 && low >= 0)
            {
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(encoded[i]);
    }

    return decoded;
}

std::string_view trim(std::string_view view)
{
    while(!view.empty() && std::isspace(static_cast<unsigned char>(view.front())))
        view.remove_prefix(1);
    while(!view.empty() && std::isspace(static_cast<unsigned char>(view.back())))
        view.remove_suffix(1);
    return view;
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

bool ci_less::operator()(std::string_view lhs, std::string_view rhs) const
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) < std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace utils
