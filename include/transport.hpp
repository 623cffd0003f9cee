#ifndef ZONESCAN_TRANSPORT_HPP
#define ZONESCAN_TRANSPORT_HPP

#include <string>
#include <string_view>
#include <functional>
#include <chrono>
#include <cstdint>

namespace discovery
{

using socket_handle = int;
using datagram_consumer = std::function<void(std::string)>;

struct fetch_result
{
    bool ok = false;
    int status = 0;
    std::string body;
    std::string error;

    explicit operator bool() const
    {
        return ok;
    }
};

using fetch_callback = std::function<void(fetch_result)>;

// Identifies one action of a service, e.g. AVTransport#GetMediaInfo
struct soap_action
{
    std::string service;
    std::string action;
    std::string arguments;
};

/**
 * Everything that goes over the wire
 * Opening and sending throw std::runtime_error. Callbacks may be invoked on any thread.
 */
class transport
{
public:

    virtual ~transport() = default;

    virtual bool have_socket_support() const = 0;

    /// Socket bound to port that joined the multicast group
    virtual socket_handle open_multicast_socket(const std::string& group, uint16_t port, datagram_consumer consumer) = 0;

    /// Socket on an ephemeral port sending to remote, closed automatically after timeout
    virtual socket_handle open_socket(const std::string& remote, uint16_t port, std::chrono::seconds timeout,
        datagram_consumer consumer) = 0;

    /// Sends to the remote address the socket was opened for
    virtual void send(socket_handle handle, std::string_view data) = 0;

    /// Leaves the multicast group if the socket joined one. Closing an unknown handle does nothing.
    virtual void close(socket_handle handle) = 0;

    virtual bool is_open(socket_handle handle) const = 0;

    virtual void http_get(const std::string& url, fetch_callback callback) = 0;

    virtual void soap_request(const std::string& url, const soap_action& action, fetch_callback callback) = 0;
};

} // namespace discovery

#endif
