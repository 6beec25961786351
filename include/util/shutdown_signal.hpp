// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace palm {
namespace util {

namespace detail {
struct ShutdownState;
} // namespace detail

class ShutdownListener;

/**
 * ShutdownSignal - single-slot, level-triggered cooperative stop flag
 *
 * raise() sets the flag and wakes every waiting listener. The flag stays set
 * until reset(): a listener that starts waiting after raise() is woken
 * immediately, so a late observer still sees "stop". Repeated raise() calls
 * coalesce into the first one.
 *
 * Any number of ShutdownListener handles can be cloned from one signal; they
 * share its state and may outlive the signal object.
 */
class ShutdownSignal {
public:
  ShutdownSignal();

  ShutdownSignal(const ShutdownSignal&) = delete;
  ShutdownSignal& operator=(const ShutdownSignal&) = delete;

  // Set the flag; wakes waiters only on the false -> true edge
  void raise();

  // Clear the flag (pending waiters stay registered)
  void reset();

  bool is_raised() const;

  ShutdownListener listener() const;

private:
  std::shared_ptr<detail::ShutdownState> state_;
};

/**
 * ShutdownListener - observing side of a ShutdownSignal
 *
 * async_wait() registers a one-shot handler that is posted to the given
 * executor once the signal is raised (immediately if it already is).
 * cancel() drops a registration that has not fired yet.
 */
class ShutdownListener {
public:
  using WaitId = uint64_t;

  ShutdownListener() = default;

  // False for a default-constructed listener (no signal attached)
  bool valid() const { return state_ != nullptr; }

  bool is_raised() const;

  WaitId async_wait(const boost::asio::any_io_executor &executor,
                    std::function<void()> handler) const;

  // Returns true if the wait was still pending
  bool cancel(WaitId id) const;

  // Number of registered waits that have not fired (diagnostics/tests)
  size_t pending_waits() const;

private:
  friend class ShutdownSignal;
  explicit ShutdownListener(std::shared_ptr<detail::ShutdownState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::ShutdownState> state_;
};

namespace detail {

struct ShutdownState {
  struct Waiter {
    boost::asio::any_io_executor executor;
    std::function<void()> handler;
  };

  mutable std::mutex mutex;
  bool raised{false};
  uint64_t next_id{1};
  std::map<uint64_t, Waiter> waiters;
};

} // namespace detail

} // namespace util
} // namespace palm
