// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "network/runtime.hpp"
#include "util/logging.hpp"

namespace palm {
namespace network {

Runtime::Runtime(size_t io_threads)
    : io_context_(std::make_unique<boost::asio::io_context>()) {
  if (io_threads == 0) {
    io_threads = std::thread::hardware_concurrency();
    if (io_threads == 0) {
      io_threads = 2; // hardware_concurrency() may report 0
    }
  }
  desired_io_threads_ = io_threads;
}

Runtime::~Runtime() { stop(); }

void Runtime::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this, i]() {
      try {
        io_context_->run();
      } catch (const std::exception &e) {
        LOG_NET_ERROR("I/O thread {} terminated by exception: {}", i, e.what());
      }
    });
  }
  LOG_NET_DEBUG("runtime started with {} I/O threads", desired_io_threads_);
}

void Runtime::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Don't log here - this runs from the destructor, logger may be shut down

  work_guard_.reset();
  io_context_->stop();

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // io_context_ itself is destroyed only in ~Runtime(): sockets and strands
  // still held by Connections reference it until they are destroyed
}

} // namespace network
} // namespace palm
