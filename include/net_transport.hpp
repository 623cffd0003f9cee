#ifndef ZONESCAN_NET_TRANSPORT_HPP
#define ZONESCAN_NET_TRANSPORT_HPP

#include <string>
#include <string_view>
#include <memory>
#include <unordered_map>
#include <vector>
#include <future>
#include <mutex>
#include <chrono>
#include <optional>
#include <functional>

#include "transport.hpp"
#include "utils.hpp"

namespace discovery
{

// transport on top of socketwrapper, every socket gets a reader and every http request a worker
class net_transport : public transport
{
public:

    net_transport();
    net_transport(const net_transport&) = delete;
    net_transport& operator=(const net_transport&) = delete;
    net_transport(net_transport&&) = delete;
    net_transport& operator=(net_transport&&) = delete;
    ~net_transport() override;

    explicit net_transport(std::chrono::seconds http_timeout);

    bool have_socket_support() const override;

    socket_handle open_multicast_socket(const std::string& group, uint16_t port, datagram_consumer consumer) override;

    socket_handle open_socket(const std::string& remote, uint16_t port, std::chrono::seconds timeout,
        datagram_consumer consumer) override;

    void send(socket_handle handle, std::string_view data) override;

    void close(socket_handle handle) override;

    bool is_open(socket_handle handle) const override;

    void http_get(const std::string& url, fetch_callback callback) override;

    void soap_request(const std::string& url, const soap_action& action, fetch_callback callback) override;

private:

    struct socket_entry;

    using request_builder = std::function<std::string(const utils::url&)>;

    static void start_reader(socket_entry* entry, datagram_consumer consumer,
        std::optional<std::chrono::steady_clock::time_point> deadline);

    socket_handle add_socket(std::unique_ptr<socket_entry> entry);

    void reap();

    void run_request(const std::string& url, request_builder build_request, fetch_callback callback);

    std::chrono::seconds m_http_timeout {10};

    std::unordered_map<socket_handle, std::unique_ptr<socket_entry>> m_sockets;

    std::vector<std::future<void>> m_requests;

    mutable std::mutex m_mutex;

    socket_handle m_next_handle = 1;

};

} // namespace discovery

#endif
