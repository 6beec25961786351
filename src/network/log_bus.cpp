// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "network/log_bus.hpp"
#include <boost/asio/post.hpp>

namespace palm {
namespace network {

LogBus::LogBus(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool LogBus::push(LogEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  entries_.push_back(std::move(entry));
  return true;
}

LogBus::PushId LogBus::async_push(LogEntry entry,
                                  const boost::asio::any_io_executor &executor,
                                  PushHandler handler) {
  bool pushed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
      // Parked entries go first so producers are admitted in order
      if (parked_.empty() && entries_.size() < capacity_) {
        entries_.push_back(std::move(entry));
        pushed = true;
      } else {
        PushId id = next_id_++;
        parked_.push_back(ParkedPush{id, std::move(entry), executor, std::move(handler)});
        return id;
      }
    }
  }

  boost::asio::post(executor, [handler = std::move(handler), pushed]() { handler(pushed); });
  return 0;
}

std::optional<LogEntry> LogBus::cancel_push(PushId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = parked_.begin(); it != parked_.end(); ++it) {
    if (it->id == id) {
      LogEntry entry = std::move(it->entry);
      parked_.erase(it);
      return entry;
    }
  }
  return std::nullopt;
}

std::optional<LogEntry> LogBus::try_pop() {
  std::optional<LogEntry> entry;
  std::vector<ParkedPush> admitted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
      return std::nullopt;
    }
    entry.emplace(std::move(entries_.front()));
    entries_.pop_front();
    admit_parked(admitted);
  }
  complete(admitted, true);
  return entry;
}

size_t LogBus::drain_into(std::vector<LogEntry> &out) {
  size_t moved = 0;
  std::vector<ParkedPush> admitted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    moved = entries_.size();
    out.reserve(out.size() + moved);
    for (auto &entry : entries_) {
      out.push_back(std::move(entry));
    }
    entries_.clear();
    admit_parked(admitted);
  }
  complete(admitted, true);
  return moved;
}

void LogBus::close() {
  std::vector<ParkedPush> failed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (auto &push : parked_) {
      failed.push_back(std::move(push));
    }
    parked_.clear();
  }
  complete(failed, false);
}

bool LogBus::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t LogBus::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

size_t LogBus::parked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parked_.size();
}

void LogBus::admit_parked(std::vector<ParkedPush> &admitted) {
  while (!parked_.empty() && entries_.size() < capacity_) {
    entries_.push_back(std::move(parked_.front().entry));
    admitted.push_back(std::move(parked_.front()));
    parked_.pop_front();
  }
}

void LogBus::complete(std::vector<ParkedPush> &pushes, bool pushed) {
  // Posted outside the lock; a handler may push again right away
  for (auto &push : pushes) {
    boost::asio::post(push.executor,
                      [handler = std::move(push.handler), pushed]() { handler(pushed); });
  }
}

} // namespace network
} // namespace palm
