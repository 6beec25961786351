#ifndef PALM_TEST_NETWORK_TEST_HELPERS_HPP
#define PALM_TEST_NETWORK_TEST_HELPERS_HPP

#include "network/connection.hpp"
#include "network/log_entry.hpp"
#include "network/server.hpp"
#include <boost/asio.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

namespace palm {
namespace test {

// Generous: loopback work finishes in milliseconds, CI machines stall
constexpr std::chrono::milliseconds kWaitTimeout{std::chrono::seconds(5)};

// Poll pred every few ms until it holds or the timeout passes
inline bool WaitFor(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = kWaitTimeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return pred();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

inline size_t CountKind(const std::vector<network::LogEntry>& logs, network::LogKind kind) {
    return static_cast<size_t>(std::count_if(logs.begin(), logs.end(),
        [kind](const network::LogEntry& e) { return e.kind() == kind; }));
}

// Drain until the log holds at least `count` entries of `kind`
template <typename Entity>
bool WaitForLog(Entity& entity, network::LogKind kind, size_t count = 1,
                std::chrono::milliseconds timeout = kWaitTimeout) {
    return WaitFor([&]() { return CountKind(entity.drain_logs(), kind) >= count; }, timeout);
}

template <typename Entity>
bool WaitForState(const Entity& entity, network::NetState state,
                  std::chrono::milliseconds timeout = kWaitTimeout) {
    return WaitFor([&]() { return entity.net_state() == state; }, timeout);
}

// Concatenate the payloads of every entry of `kind`
inline std::vector<uint8_t> Concat(const std::vector<network::LogEntry>& logs,
                                   network::LogKind kind) {
    std::vector<uint8_t> out;
    for (const auto& e : logs) {
        if (e.kind() == kind && e.packet()) {
            out.insert(out.end(), e.packet()->payload().begin(), e.packet()->payload().end());
        }
    }
    return out;
}

// Start on an ephemeral loopback port; returns the bound port (0 on failure)
inline uint16_t StartLoopbackServer(network::Server& server) {
    server.start(0, "127.0.0.1");
    if (!WaitForState(server, network::NetState::ACTIVE)) {
        return 0;
    }
    return server.listening_port();
}

inline std::string LoopbackAddress(uint16_t port) {
    return "127.0.0.1:" + std::to_string(port);
}

// A loopback port with nothing listening (bound once, then released)
inline uint16_t UnusedLoopbackPort() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(
        io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace test
} // namespace palm

#endif // PALM_TEST_NETWORK_TEST_HELPERS_HPP
