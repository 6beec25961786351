// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "network/send_channel.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>

namespace palm {
namespace network {

// ============================================================================
// SendChannel
// ============================================================================

SendChannel::SendChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

size_t SendChannel::publish(const DataPacket &packet) {
  std::vector<SendReceiverPtr> live;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Drop receivers whose session is gone
    receivers_.erase(
        std::remove_if(receivers_.begin(), receivers_.end(),
                       [](const std::weak_ptr<SendReceiver> &w) {
                         auto r = w.lock();
                         return !r || r->is_closed();
                       }),
        receivers_.end());
    for (const auto &w : receivers_) {
      if (auto r = w.lock()) {
        live.push_back(std::move(r));
      }
    }
  }

  size_t delivered = 0;
  for (const auto &receiver : live) {
    if (receiver->deliver(packet)) {
      ++delivered;
    }
  }
  return delivered;
}

SendReceiverPtr SendChannel::subscribe() {
  auto receiver = std::make_shared<SendReceiver>(capacity_);
  std::lock_guard<std::mutex> lock(mutex_);
  receivers_.push_back(receiver);
  return receiver;
}

size_t SendChannel::receiver_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(
      receivers_.begin(), receivers_.end(), [](const std::weak_ptr<SendReceiver> &w) {
        auto r = w.lock();
        return r && !r->is_closed();
      }));
}

void SendChannel::close_receivers() {
  std::vector<SendReceiverPtr> live;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &w : receivers_) {
      if (auto r = w.lock()) {
        live.push_back(std::move(r));
      }
    }
    receivers_.clear();
  }
  for (const auto &receiver : live) {
    receiver->close();
  }
}

// ============================================================================
// SendReceiver
// ============================================================================

SendReceiver::SendReceiver(size_t capacity) : capacity_(capacity) {}

bool SendReceiver::deliver(const DataPacket &packet) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }

  if (waiting_handler_) {
    auto executor = std::move(*waiting_executor_);
    auto handler = std::move(waiting_handler_);
    waiting_executor_.reset();
    waiting_handler_ = nullptr;
    lock.unlock();
    boost::asio::post(executor, [handler = std::move(handler), packet]() {
      handler(packet);
    });
    return true;
  }

  queue_.push_back(packet);
  if (queue_.size() > capacity_) {
    queue_.pop_front();
    uint64_t lagged = lagged_.fetch_add(1, std::memory_order_relaxed) + 1;
    LOG_NET_WARN("send queue overflow, dropped oldest outbound packet ({} dropped so far)", lagged);
  }
  return true;
}

void SendReceiver::async_receive(const boost::asio::any_io_executor &executor,
                                 Handler handler) {
  std::unique_lock<std::mutex> lock(mutex_);

  if (!queue_.empty()) {
    DataPacket packet = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    boost::asio::post(executor, [handler = std::move(handler), packet = std::move(packet)]() {
      handler(packet);
    });
    return;
  }

  if (closed_) {
    lock.unlock();
    boost::asio::post(executor, [handler = std::move(handler)]() { handler(std::nullopt); });
    return;
  }

  waiting_executor_ = executor;
  waiting_handler_ = std::move(handler);
}

void SendReceiver::close() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  // Undelivered packets die with the session
  queue_.clear();

  if (waiting_handler_) {
    auto executor = std::move(*waiting_executor_);
    auto handler = std::move(waiting_handler_);
    waiting_executor_.reset();
    waiting_handler_ = nullptr;
    lock.unlock();
    boost::asio::post(executor, [handler = std::move(handler)]() { handler(std::nullopt); });
  }
}

bool SendReceiver::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t SendReceiver::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace network
} // namespace palm
