// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include "network/log_bus.hpp"
#include "network/net_state.hpp"
#include "network/send_channel.hpp"
#include "util/shutdown_signal.hpp"
#include <array>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <string>

namespace palm {
namespace network {

/**
 * SessionContext - the pieces of a Connection a session works on
 *
 * Everything is shared, so a session keeps running correctly even if the
 * owning Connection handle is destroyed under it.
 */
struct SessionContext {
  std::string address;
  AtomicNetStatePtr state;
  LogBusPtr log;
  LogBusPtr parent_log;  // optional second sink (server aggregate view)
  std::shared_ptr<util::ShutdownSignal> shutdown;
  util::ShutdownListener external_shutdown;  // optional (server cascade)
  std::shared_ptr<SendChannel> sender;
};

/**
 * Session - the managed read/write session over one established socket
 *
 * Two loops run on one strand:
 * - reader: reads READ_CHUNK_SIZE-byte chunks and logs each as a received
 *   packet, issuing the next read only once the log bus took the chunk;
 *   end-of-stream raises the local shutdown; interrupted-class errors are
 *   retried; other errors are logged as fatal and raise shutdown.
 * - writer: takes the next packet from its SendReceiver and writes it fully.
 *
 * Both watch the local shutdown signal; the external one (if any) is only
 * observed and re-raises the local one. On shutdown the writer finishes the
 * packet in flight, then the outstanding read is cancelled. A reader parked
 * on a full log bus withdraws its entry, keeps it with a non-waiting push and
 * stops.
 *
 * When both loops are done: local shutdown reset, state -> INACTIVE,
 * Disconnect logged to the local and parent sinks, socket closed.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
  static constexpr size_t READ_CHUNK_SIZE = 2048;

  /**
   * Create a session over a connected socket
   *
   * Subscribes to ctx.sender immediately, so a send issued as soon as the
   * caller publishes ACTIVE has a receiver.
   */
  static std::shared_ptr<Session> create(boost::asio::ip::tcp::socket socket,
                                         SessionContext ctx);

  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /**
   * Register the shutdown watches and start both loops
   * The watches are registered before this returns.
   */
  void start();

  const std::string &address() const { return ctx_.address; }

  // Read errors after which the socket is still usable and the read is reissued
  static bool is_transient_read_error(const boost::system::error_code &ec);

private:
  Session(boost::asio::ip::tcp::socket socket, SessionContext ctx);

  // Strand-serialized internals
  void start_read_impl();
  void handle_read(const boost::system::error_code &ec, size_t bytes_transferred);
  void handle_logged(bool pushed);
  void abandon_parked_log();
  void wait_for_packet_impl();
  void handle_packet(std::optional<DataPacket> packet);
  void handle_write(const boost::system::error_code &ec);
  void handle_local_shutdown();
  void cancel_read_impl();
  void reader_done();
  void writer_done();
  void finish_if_done();

  void emit(LogEntry entry);

  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  SessionContext ctx_;
  util::ShutdownListener local_listener_;
  SendReceiverPtr receiver_;

  std::array<uint8_t, READ_CHUNK_SIZE> read_buffer_{};

  // Accessed only on strand_
  bool stopping_{false};
  bool write_in_flight_{false};
  bool log_pending_{false};
  LogBus::PushId log_push_id_{0};
  bool reader_done_{false};
  bool writer_done_{false};
  bool finished_{false};

  util::ShutdownListener::WaitId local_wait_id_{0};
  util::ShutdownListener::WaitId external_wait_id_{0};
};

} // namespace network
} // namespace palm
