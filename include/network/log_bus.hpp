// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include "network/log_entry.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace palm {
namespace network {

/**
 * LogBus - bounded multi-producer queue of LogEntry, drained by polling
 *
 * Producers are background tasks on I/O threads; the single consumer is the
 * owner of the Connection/Server, which drains without blocking on every
 * tick. Entries from one producer keep their order; entries from different
 * producers are ordered only by arrival.
 *
 * Back-pressure: async_push() on a full bus parks the entry and completes
 * once the consumer has made room (or the bus is closed), so a producer task
 * waits without holding an I/O thread. push() never waits; it is meant for
 * the handful of lifecycle entries a task emits and may overshoot capacity.
 * The owner closes the bus when it goes away so no producer waits on a
 * consumer that no longer exists.
 */
class LogBus {
public:
  static constexpr size_t DEFAULT_CAPACITY = 1024;

  using PushId = uint64_t;
  using PushHandler = std::function<void(bool pushed)>;

  explicit LogBus(size_t capacity = DEFAULT_CAPACITY);

  LogBus(const LogBus&) = delete;
  LogBus& operator=(const LogBus&) = delete;

  /**
   * Append an entry without waiting
   * @return false if the bus is closed (entry discarded)
   */
  bool push(LogEntry entry);

  /**
   * Append an entry once there is room for it
   *
   * The handler is posted to executor with true when the entry is in the
   * bus, or with false when the bus was closed first. Entries parked by
   * different producers are admitted in the order they were parked.
   *
   * @return id usable with cancel_push(), 0 if the push completed at once
   */
  PushId async_push(LogEntry entry, const boost::asio::any_io_executor &executor,
                    PushHandler handler);

  /**
   * Withdraw a parked entry; its handler is dropped without being called
   * @return the entry, or std::nullopt if it was already admitted
   */
  std::optional<LogEntry> cancel_push(PushId id);

  // Non-blocking; std::nullopt when empty
  std::optional<LogEntry> try_pop();

  /**
   * Move every pending entry to the back of out
   * @return number of entries moved
   */
  size_t drain_into(std::vector<LogEntry> &out);

  // Fail parked pushes and reject further entries
  void close();
  bool is_closed() const;

  size_t size() const;
  size_t parked() const;
  size_t capacity() const { return capacity_; }

private:
  struct ParkedPush {
    PushId id;
    LogEntry entry;
    boost::asio::any_io_executor executor;
    PushHandler handler;
  };

  // Requires mutex_; moves parked entries into free slots
  void admit_parked(std::vector<ParkedPush> &admitted);
  static void complete(std::vector<ParkedPush> &pushes, bool pushed);

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<LogEntry> entries_;
  std::deque<ParkedPush> parked_;
  PushId next_id_{1};
  bool closed_{false};
};

using LogBusPtr = std::shared_ptr<LogBus>;

} // namespace network
} // namespace palm
