#include <future>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>

#include "config.hpp"
#include "log.hpp"
#include "event_loop.hpp"
#include "event_bus.hpp"
#include "net_transport.hpp"
#include "discovery_service.hpp"

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

static void print_roster(const nlohmann::json& roster)
{
    fmt::print("{} device(s) in your local network\n-------------------------------\n", roster.size());
    for(const auto& dev : roster)
    {
        fmt::print("{} | {} | {}\n",
            dev.value("roomName", std::string {}),
            dev.value("modelName", std::string {}),
            dev.value("id", std::string {}));
    }
    fmt::print("\n");
}

int main(int argc, char** argv)
{
    config::settings cfg;
    if(argc > 1)
    {
        try {
            cfg = config::load_config(argv[1]);
        } catch(std::runtime_error& e) {
            fmt::print(stderr, "{}\n", e.what());
            return EXIT_FAILURE;
        }
    }
    logging::set_level(cfg.log_level);

    // Block before any thread is started so that only the signal handler receives them
    sigset_t sigset;
    block_signals(&sigset);
    std::future<int> signal_handler = std::async(std::launch::async, [&sigset]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        fmt::print("Shutting down...\n");
        return signum;
    });

    auto net = std::make_unique<discovery::net_transport>(cfg.http_timeout);
    events::event_bus bus;
    runtime::event_loop loop;
    loop.start();

    bus.subscribe(events::topic::devices_changed, print_roster);
    bus.subscribe(events::topic::media_info_received, [](const nlohmann::json& info) {
        fmt::print("{}\n", info.dump(2));
    });

    discovery::discovery_service service {cfg, *net, loop, bus};
    if(!service.start())
    {
        fmt::print("Discovery failed to start: {}\nPress Ctrl+C to exit.\n", service.last_error());
        signal_handler.get();
        loop.stop();
        net.reset();
        return EXIT_FAILURE;
    }

    fmt::print("Scanning network for {}...\nPress Ctrl+C to exit.\n", cfg.search_target);

    // Wait for signal and shut down in reverse order
    // Reader threads and http workers still post into the loop until the transport is gone
    signal_handler.get();
    service.stop();
    loop.stop();
    net.reset();

    return EXIT_SUCCESS;
}
