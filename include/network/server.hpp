// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include "network/connection.hpp"
#include "network/log_bus.hpp"
#include "network/net_state.hpp"
#include "util/shutdown_signal.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace palm {
namespace network {

// Accepted connections keyed by peer "ip:port" (sorted for stable listings)
using ConnectionRegistry = util::ThreadSafeMap<std::string, ConnectionPtr, std::map>;

/**
 * Server - listening socket plus a registry of server-side connections
 *
 * start() binds and runs an accept loop on its own strand. Every accepted
 * stream becomes a Connection adopted with:
 * - this server's log bus as parent sink (the child's Disconnect shows up here)
 * - a listener on this server's shutdown signal (stopping the server stops
 *   every child, asynchronously)
 *
 * Children stay registered after they disconnect so their logs can still be
 * drained; prune_inactive() drops them.
 *
 * Owner calls are expected from one thread. The registry itself is safe to
 * use concurrently with the accept loop.
 */
class Server {
public:
  static constexpr const char *DEFAULT_BIND_ADDRESS = "127.0.0.1";

  explicit Server(boost::asio::io_context &io_context);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Bind to bind_address:port and accept in the background
   *
   * Sets ESTABLISHING before returning. Outcome: ServerStarted (ACTIVE) or
   * BindError (back to INACTIVE). Port 0 picks an ephemeral port, see
   * listening_port().
   *
   * @throws std::logic_error if not INACTIVE
   */
  void start(uint16_t port, const std::string &bind_address = DEFAULT_BIND_ADDRESS);

  // Fire-and-forget and idempotent; completion shows as INACTIVE + ServerStopped
  void shutdown();

  NetState net_state() const { return state_->load(); }

  // Port requested in the last start()
  uint16_t port() const { return port_; }

  // Port actually bound, 0 when not listening
  uint16_t listening_port() const { return listening_port_->load(std::memory_order_acquire); }

  const std::string &bind_address() const { return bind_address_; }

  /**
   * Move pending entries from the server bus into the server log
   * @param previous_size if set, receives the log length before this call
   */
  const std::vector<LogEntry> &drain_logs(size_t *previous_size = nullptr);

  /**
   * Scoped read access to one registered connection
   * op(const Connection&) runs under the registry's shared lock: it must be
   * short, must not block and must not call back into this Server.
   * @return false if no connection is registered under address
   */
  template <typename Func>
  bool with_connection(const std::string &address, Func &&op) const {
    return registry_->Read(address, [&op](const ConnectionPtr &conn) {
      op(static_cast<const Connection &>(*conn));
    });
  }

  // Same as with_connection(), but op(Connection&) runs under the exclusive lock
  template <typename Func>
  bool with_connection_mut(const std::string &address, Func &&op) {
    return registry_->Modify(address, [&op](ConnectionPtr &conn) { op(*conn); });
  }

  /**
   * Call op(address, Connection&) for every registered connection
   * Iterates a snapshot, so op may take its time and use the registry.
   */
  template <typename Func>
  void for_each_connection(Func &&op) {
    for (auto &[address, conn] : registry_->GetAll()) {
      op(address, *conn);
    }
  }

  std::vector<std::string> connection_addresses() const { return registry_->GetKeys(); }

  size_t connection_count() const { return registry_->Size(); }

  // Drop every registered connection that is INACTIVE; returns how many
  size_t prune_inactive();

private:
  boost::asio::io_context &io_context_;
  uint16_t port_{0};
  std::string bind_address_{DEFAULT_BIND_ADDRESS};
  AtomicNetStatePtr state_;
  LogBusPtr log_bus_;
  std::vector<LogEntry> logs_;
  std::shared_ptr<util::ShutdownSignal> shutdown_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<std::atomic<uint16_t>> listening_port_;
};

} // namespace network
} // namespace palm
