// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include "network/data_packet.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace palm {
namespace network {

class SendReceiver;
using SendReceiverPtr = std::shared_ptr<SendReceiver>;

/**
 * SendChannel - bounded broadcast queue for outbound packets
 *
 * The owner publishes; each writer task subscribes and gets its own
 * SendReceiver. A packet published while nobody is subscribed is not
 * delivered anywhere, which publish() reports by returning 0.
 */
class SendChannel {
public:
  static constexpr size_t DEFAULT_CAPACITY = 1024;

  explicit SendChannel(size_t capacity = DEFAULT_CAPACITY);

  SendChannel(const SendChannel&) = delete;
  SendChannel& operator=(const SendChannel&) = delete;

  /**
   * Deliver a packet to every open receiver
   * @return number of receivers the packet was delivered to
   */
  size_t publish(const DataPacket &packet);

  SendReceiverPtr subscribe();

  // Open receivers currently subscribed
  size_t receiver_count() const;

  // Close every current receiver; their writers see end-of-channel
  void close_receivers();

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<SendReceiver>> receivers_;
};

/**
 * SendReceiver - one subscriber's queue
 *
 * At most one async_receive() may be outstanding. The handler is posted to
 * the given executor with the next packet, or with std::nullopt once the
 * receiver is closed and drained of its wake-up.
 *
 * If the subscriber falls more than capacity packets behind, the oldest
 * queued packets are dropped and counted in lagged().
 */
class SendReceiver {
public:
  using Handler = std::function<void(std::optional<DataPacket>)>;

  explicit SendReceiver(size_t capacity);

  SendReceiver(const SendReceiver&) = delete;
  SendReceiver& operator=(const SendReceiver&) = delete;

  void async_receive(const boost::asio::any_io_executor &executor, Handler handler);

  // Stop accepting packets; a pending async_receive completes with nullopt
  void close();
  bool is_closed() const;

  size_t queued() const;
  uint64_t lagged() const { return lagged_.load(std::memory_order_relaxed); }

private:
  friend class SendChannel;

  // Returns false if the receiver is closed
  bool deliver(const DataPacket &packet);

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<DataPacket> queue_;
  bool closed_{false};
  std::optional<boost::asio::any_io_executor> waiting_executor_;
  Handler waiting_handler_;
  std::atomic<uint64_t> lagged_{0};
};

} // namespace network
} // namespace palm
