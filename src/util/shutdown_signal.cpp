// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "util/shutdown_signal.hpp"
#include <boost/asio/post.hpp>
#include <vector>

namespace palm {
namespace util {

ShutdownSignal::ShutdownSignal()
    : state_(std::make_shared<detail::ShutdownState>()) {}

void ShutdownSignal::raise() {
  std::map<uint64_t, detail::ShutdownState::Waiter> to_fire;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->raised) {
      return;
    }
    state_->raised = true;
    to_fire.swap(state_->waiters);
  }

  // Post outside the lock; handlers may register new waits or cancel others
  for (auto &[id, waiter] : to_fire) {
    boost::asio::post(waiter.executor, std::move(waiter.handler));
  }
}

void ShutdownSignal::reset() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->raised = false;
}

bool ShutdownSignal::is_raised() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->raised;
}

ShutdownListener ShutdownSignal::listener() const {
  return ShutdownListener(state_);
}

bool ShutdownListener::is_raised() const {
  if (!state_) return false;
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->raised;
}

ShutdownListener::WaitId
ShutdownListener::async_wait(const boost::asio::any_io_executor &executor,
                             std::function<void()> handler) const {
  if (!state_) return 0;

  WaitId id = 0;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    id = state_->next_id++;
    if (!state_->raised) {
      state_->waiters.emplace(id, detail::ShutdownState::Waiter{executor, std::move(handler)});
      return id;
    }
  }

  // Level-triggered: already raised, fire right away
  boost::asio::post(executor, std::move(handler));
  return id;
}

bool ShutdownListener::cancel(WaitId id) const {
  if (!state_) return false;
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->waiters.erase(id) > 0;
}

size_t ShutdownListener::pending_waits() const {
  if (!state_) return 0;
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->waiters.size();
}

} // namespace util
} // namespace palm
