#include "net_transport.hpp"

#include "log.hpp"
#include "utils.hpp"

#include <socketwrapper.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <charconv>
#include <thread>

#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>

using namespace std::chrono_literals;

namespace discovery
{

static constexpr int poll_interval_ms = 200;

// Descriptions and soap answers are a few kilobytes, anything beyond this is not read
static constexpr size_t max_response_size = 1024 * 1024;
static constexpr size_t datagram_size = 4096;

struct net_transport::socket_entry
{
    socket_entry(const std::string& bind_addr, uint16_t bind_port)
        : sock {bind_addr, bind_port}
    {}

    net::udp_socket<net::ip_version::v4> sock;

    std::string remote;

    uint16_t remote_port = 0;

    std::string group;  // Joined multicast group, empty for plain sockets

    std::atomic<bool> keep {true};

    std::future<void> reader;
};

static void set_membership(int fd, const std::string& group, int option)
{
    ip_mreq mreq {};
    if(inet_pton(AF_INET, group.c_str(), &mreq.imr_multiaddr) != 1)
        throw std::runtime_error {"Invalid multicast group " + group};
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);

    if(setsockopt(fd, IPPROTO_IP, option, &mreq, sizeof(mreq)) != 0)
        throw std::runtime_error {"Failed to change multicast membership for " + group};
}

void net_transport::start_reader(socket_entry* entry, datagram_consumer consumer,
    std::optional<std::chrono::steady_clock::time_point> deadline)
{
    entry->reader = std::async(std::launch::async, [entry, consumer = std::move(consumer), deadline]()
    {
        pollfd pfd {entry->sock.get(), POLLIN, 0};
        while(entry->keep.load())
        {
            if(deadline && std::chrono::steady_clock::now() >= *deadline)
                break;

            if(::poll(&pfd, 1, poll_interval_ms) <= 0 || !(pfd.revents & POLLIN))
                continue;

            try {
                auto [buffer, peer] = entry->sock.read<char>(datagram_size);
                consumer(std::string {buffer.data(), buffer.size()});
            } catch(std::runtime_error& e) {
                logging::debug("Reading datagram failed: {}", e.what());
            }
        }
        entry->keep.store(false);
    });
}

net_transport::net_transport() = default;

net_transport::net_transport(std::chrono::seconds http_timeout)
    : m_http_timeout {http_timeout}
{}

net_transport::~net_transport()
{
    std::unordered_map<socket_handle, std::unique_ptr<socket_entry>> sockets;
    std::vector<std::future<void>> requests;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        sockets = std::move(m_sockets);
        requests = std::move(m_requests);
    }

    for(auto& [handle, entry] : sockets)
    {
        entry->keep.store(false);
        entry->reader.wait();
    }

    for(auto& req : requests)
        req.wait();
}

bool net_transport::have_socket_support() const
{
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if(fd < 0)
        return false;

    ::close(fd);
    return true;
}

socket_handle net_transport::add_socket(std::unique_ptr<socket_entry> entry)
{
    reap();

    std::lock_guard<std::mutex> lock {m_mutex};
    socket_handle handle = m_next_handle++;
    m_sockets.emplace(handle, std::move(entry));
    return handle;
}

socket_handle net_transport::open_multicast_socket(const std::string& group, uint16_t port, datagram_consumer consumer)
{
    auto entry = std::make_unique<socket_entry>("0.0.0.0", port);
    entry->remote = group;
    entry->remote_port = port;

    set_membership(entry->sock.get(), group, IP_ADD_MEMBERSHIP);
    entry->group = group;

    start_reader(entry.get(), std::move(consumer), std::nullopt);
    logging::debug("Joined multicast group {}:{}", group, port);

    return add_socket(std::move(entry));
}

socket_handle net_transport::open_socket(const std::string& remote, uint16_t port, std::chrono::seconds timeout,
    datagram_consumer consumer)
{
    auto entry = std::make_unique<socket_entry>("0.0.0.0", 0);
    entry->remote = remote;
    entry->remote_port = port;

    start_reader(entry.get(), std::move(consumer), std::chrono::steady_clock::now() + timeout);

    return add_socket(std::move(entry));
}

void net_transport::send(socket_handle handle, std::string_view data)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = m_sockets.find(handle);
    if(it == m_sockets.end() || !it->second->keep.load())
        throw std::runtime_error {"Socket is closed"};

    socket_entry& entry = *it->second;
    entry.sock.send(entry.remote, entry.remote_port, std::string {data});
}

void net_transport::close(socket_handle handle)
{
    std::unique_ptr<socket_entry> entry;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        auto it = m_sockets.find(handle);
        if(it == m_sockets.end())
            return;

        entry = std::move(it->second);
        m_sockets.erase(it);
    }

    entry->keep.store(false);
    entry->reader.wait();

    if(!entry->group.empty())
    {
        try {
            set_membership(entry->sock.get(), entry->group, IP_DROP_MEMBERSHIP);
            logging::debug("Left multicast group {}", entry->group);
        } catch(std::runtime_error& e) {
            logging::warning("{}", e.what());
        }
    }
}

bool net_transport::is_open(socket_handle handle) const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = m_sockets.find(handle);
    return it != m_sockets.end() && it->second->keep.load();
}

void net_transport::reap()
{
    std::vector<std::unique_ptr<socket_entry>> expired;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        for(auto it = m_sockets.begin(); it != m_sockets.end(); )
        {
            if(!it->second->keep.load() && it->second->reader.wait_for(0s) == std::future_status::ready)
            {
                expired.push_back(std::move(it->second));
                it = m_sockets.erase(it);
            }
            else
                ++it;
        }

        m_requests.erase(std::remove_if(m_requests.begin(), m_requests.end(), [](const std::future<void>& req) {
            return req.wait_for(0s) == std::future_status::ready;
        }), m_requests.end());
    }
}

static std::string decode_chunked(std::string_view body)
{
    std::string decoded;
    while(!body.empty())
    {
        std::string_view::size_type endl = body.find("\r\n");
        if(endl == std::string_view::npos)
            break;

        size_t len = 0;
        auto res = std::from_chars(body.data(), body.data() + endl, len, 16);
        if(res.ec != std::errc {} || len == 0 || endl + 2 + len > body.size())
            break;

        decoded.append(body.substr(endl + 2, len));
        body.remove_prefix(std::min(body.size(), endl + 2 + len + 2));
    }
    return decoded;
}

static fetch_result read_response(const std::string& raw)
{
    fetch_result result;

    const std::string_view header_termination {"\r\n\r\n"};
    std::string::size_type body_start = raw.find(header_termination);
    if(body_start == std::string::npos)
    {
        result.error = "Incomplete http response";
        return result;
    }

    // HTTP/1.1 200 OK
    std::string_view status_line {raw.data(), raw.find("\r\n")};
    std::string_view::size_type sp = status_line.find(' ');
    if(sp == std::string_view::npos ||
        std::from_chars(status_line.data() + sp + 1, status_line.data() + status_line.size(), result.status).ec != std::errc {})
    {
        result.error = "Malformed status line";
        return result;
    }

    std::string_view head {raw.data(), body_start};
    std::string_view body {raw.data() + body_start + header_termination.size(), raw.size() - body_start - header_termination.size()};

    bool chunked = false;
    for(std::string_view::size_type pos = head.find("\r\n"); pos != std::string_view::npos; )
    {
        std::string_view::size_type next = head.find("\r\n", pos + 2);
        std::string_view line = head.substr(pos + 2, (next == std::string_view::npos) ? std::string_view::npos : next - pos - 2);
        std::string_view::size_type sep = line.find(':');
        if(sep != std::string_view::npos && utils::iequals(utils::trim(line.substr(0, sep)), "Transfer-Encoding") &&
            utils::iequals(utils::trim(line.substr(sep + 1)), "chunked"))
            chunked = true;
        pos = next;
    }

    result.body = chunked ? decode_chunked(body) : std::string {body};
    result.ok = (result.status >= 200 && result.status < 300);
    if(!result.ok)
        result.error = fmt::format("Http status {}", result.status);

    return result;
}

static fetch_result exchange(const utils::url& target, std::string request, std::chrono::seconds timeout)
{
    fetch_result result;
    try {
        net::tcp_connection<net::ip_version::v4> conn {target.host, target.port};

        timeval tv {static_cast<time_t>(timeout.count()), 0};
        if(setsockopt(conn.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0)
            logging::warning("Could not set receive timeout for {}", target.host);

        conn.send(net::span {request.begin(), request.end()});

        // Read until the device closes the connection
        std::string raw;
        std::array<char, 4096> buffer;
        for(size_t br = conn.read(net::span {buffer}); br > 0; br = conn.read(net::span {buffer}))
        {
            raw.append(buffer.data(), br);
            if(raw.size() > max_response_size)
                throw std::runtime_error {fmt::format("Response from {} exceeds {} bytes", target.host, max_response_size)};
        }

        result = read_response(raw);
    } catch(std::runtime_error& e) {
        result.ok = false;
        result.error = e.what();
    }

    return result;
}

void net_transport::run_request(const std::string& url, request_builder build_request, fetch_callback callback)
{
    reap();

    utils::url target;
    try {
        target = utils::parse_url(url);
    } catch(std::invalid_argument& e) {
        fetch_result result;
        result.error = fmt::format("{}: {}", e.what(), url);
        callback(std::move(result));
        return;
    }

    std::string request = build_request(target);

    std::lock_guard<std::mutex> lock {m_mutex};
    m_requests.push_back(std::async(std::launch::async,
        [target = std::move(target), request = std::move(request), callback = std::move(callback), timeout = m_http_timeout]()
    {
        fetch_result result = exchange(target, request, timeout);
        try {
            callback(std::move(result));
        } catch(std::exception& e) {
            logging::error("Http callback failed: {}", e.what());
        }
    }));
}

void net_transport::http_get(const std::string& url, fetch_callback callback)
{
    run_request(url, [](const utils::url& target) {
        return fmt::format("GET {} HTTP/1.1\r\nHOST: {}:{}\r\nConnection: close\r\n\r\n", target.path, target.host, target.port);
    }, std::move(callback));
}

void net_transport::soap_request(const std::string& url, const soap_action& action, fetch_callback callback)
{
    std::string body = fmt::format(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?><s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\"><s:Body><u:{0} xmlns:u=\"urn:schemas-upnp-org:service:{1}:1\"><InstanceID>0</InstanceID>{2}</u:{0}></s:Body></s:Envelope>",
        action.action,
        action.service,
        action.arguments
    );

    run_request(url, [body = std::move(body), &action](const utils::url& target) {
        return fmt::format(
            "POST {0} HTTP/1.1\r\nHOST: {1}:{2}\r\nContent-Type: text/xml; charset=\"utf-8\"\r\nContent-Length: {3}\r\nSOAPAction: \"urn:schemas-upnp-org:service:{4}:1#{5}\"\r\nConnection: close\r\n\r\n{6}",
            target.path,
            target.host,
            target.port,
            body.size(),
            action.service,
            action.action,
            body
        );
    }, std::move(callback));
}

} // namespace discovery
