// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <thread>
#include <vector>

namespace palm {
namespace network {

/**
 * Runtime - shared multi-threaded reactor hosting every background task
 *
 * One io_context driven by a pool of I/O threads. Connections and Servers
 * serialize their own handlers on strands, so any thread count is safe.
 *
 * The io_context lives as long as the Runtime, so it outlives every socket,
 * strand and timer created on it; Connections and Servers must be destroyed
 * before their Runtime.
 */
class Runtime {
public:
  /**
   * @param io_threads Number of I/O threads (0 = hardware concurrency)
   */
  explicit Runtime(size_t io_threads = 0);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  // Start the I/O threads; no-op if already running
  void run();

  // Stop the reactor and join the I/O threads; idempotent
  void stop();

  bool is_running() const { return running_; }
  size_t thread_count() const { return desired_io_threads_; }

  boost::asio::io_context &io_context() { return *io_context_; }

private:
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  size_t desired_io_threads_{1};
};

} // namespace network
} // namespace palm
