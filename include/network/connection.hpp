// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include "network/log_bus.hpp"
#include "network/net_state.hpp"
#include "network/send_channel.hpp"
#include "util/shutdown_signal.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace palm {
namespace network {

enum class SendResult {
  QUEUED,      // handed to the active session's writer
  NO_RECEIVER, // no session is running; nothing was queued or logged
};

/**
 * Connection - owner handle for one TCP socket's full lifecycle
 *
 * Either connects out (start_client) or takes over a socket accepted by a
 * Server (adopt). The actual work runs as a session on the io_context; the
 * owner only ever touches:
 * - net_state(): relaxed atomic read, for gating and display
 * - drain_logs(): non-blocking poll of the log bus
 * - send_data(): publish on the broadcast send channel
 * - shutdown(): raise the level-triggered stop signal
 *
 * All owner calls are expected from one thread (the driver). Starting a
 * Connection that is not INACTIVE, or whose session has already run, is a
 * programming error and throws std::logic_error: connections are single-use
 * once a session has run. A failed connect attempt may be retried.
 *
 * Destroy only while INACTIVE. A destructor running while a task is live
 * raises shutdown and closes the log bus so the task winds down on its own.
 */
class Connection {
public:
  static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{std::chrono::seconds(8)};

  explicit Connection(boost::asio::io_context &io_context);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection(Connection&&) = delete;
  Connection& operator=(Connection&&) = delete;

  /**
   * Connect to "host:port" (or "[v6]:port") in the background
   *
   * Sets ESTABLISHING before returning. Outcome is reported through the log:
   * exactly one of Connect, ConnectError or ConnectTimedOut.
   *
   * @throws std::logic_error if not INACTIVE or already used for a session
   */
  void start_client(const std::string &address,
                    std::chrono::milliseconds timeout = DEFAULT_CONNECT_TIMEOUT);

  /**
   * Take over an already connected socket (server-accepted mode)
   *
   * @param parent_log if set, the final Disconnect is also pushed there
   * @param external_shutdown if valid, firing it ends this session too
   * @throws std::logic_error if not INACTIVE or already used for a session
   */
  void adopt(boost::asio::ip::tcp::socket socket, const std::string &address,
             LogBusPtr parent_log = nullptr,
             util::ShutdownListener external_shutdown = util::ShutdownListener());

  /**
   * Queue a payload for the active session and log it as sent
   * The SentPacket entry goes straight into the local log, bypassing the bus.
   */
  SendResult send_data(std::vector<uint8_t> payload);

  // Fire-and-forget and idempotent; completion shows as INACTIVE + Disconnect
  void shutdown();

  NetState net_state() const { return state_->load(); }

  // Address given to start_client()/adopt(), if any
  const std::optional<std::string> &address() const { return address_; }

  /**
   * Move pending entries from the log bus into the local log
   * @param previous_size if set, receives the log length before this call
   * @return the whole append-only log
   */
  const std::vector<LogEntry> &drain_logs(size_t *previous_size = nullptr);

  // True once a session has been started on this connection
  bool session_used() const { return session_used_->load(std::memory_order_acquire); }

#ifdef PALM_TESTS
  size_t send_receiver_count() const { return sender_->receiver_count(); }
#endif

private:
  void check_startable(const char *operation) const;

  boost::asio::io_context &io_context_;
  std::optional<std::string> address_;
  AtomicNetStatePtr state_;
  LogBusPtr log_bus_;
  std::vector<LogEntry> logs_;
  std::shared_ptr<util::ShutdownSignal> shutdown_;
  std::shared_ptr<SendChannel> sender_;
  // Set from the I/O thread when a connect succeeds
  std::shared_ptr<std::atomic<bool>> session_used_;
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace network
} // namespace palm
