#pragma once

#include "console_command.hpp"
#include "network/connection.hpp"
#include "network/runtime.hpp"
#include "network/server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <deque>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace palm {
namespace app {

enum class Mode {
  CLIENT,
  SERVER,
};

// Application configuration
struct AppConfig {
  Mode mode = Mode::CLIENT;

  // Client mode: "host:port" or "[v6]:port"
  std::string connect_address;
  std::chrono::milliseconds connect_timeout = network::Connection::DEFAULT_CONNECT_TIMEOUT;

  // Server mode (port 0 = ephemeral)
  uint16_t listen_port = 0;
  std::string bind_address = network::Server::DEFAULT_BIND_ADDRESS;

  // I/O threads for the runtime (0 = hardware concurrency)
  size_t io_threads = 0;

  // Driver polling interval
  std::chrono::milliseconds tick{50};

  // Print log entries as JSON lines instead of text
  bool json_output = false;
};

/**
 * Application - the console driver
 *
 * Owns the runtime and exactly one Connection (client mode) or Server
 * (server mode). Every tick it:
 * - executes console lines collected by the stdin reader thread
 * - drains logs and prints only what is new
 * - checks whether the session is over
 *
 * Output goes to the given stream; the application logger stays on stderr.
 */
class Application {
public:
  explicit Application(const AppConfig &config, std::ostream &out);
  ~Application();

  // Lifecycle
  bool start();
  void stop();

  /**
   * Run the tick loop until :quit, EOF, a signal, or (client mode) the end
   * of the connection
   * @return process exit status
   */
  int run();

  // Feed one console line (normally done by the stdin reader thread)
  void submit_line(std::string line);
  void submit_eof();

  // Shutdown request (signals, EOF)
  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::ostream &out_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  bool start_failed_{false};

  std::unique_ptr<network::Runtime> runtime_;
  std::unique_ptr<network::Connection> connection_;
  std::unique_ptr<network::Server> server_;

  // Lines read from stdin, consumed by the tick loop
  std::mutex input_mutex_;
  std::deque<std::string> input_;
  bool input_eof_{false};
  std::unique_ptr<std::thread> input_thread_;
  std::atomic<bool> input_stop_{false};

  // Tick steps
  bool tick();
  void process_input();
  void execute(const ConsoleCommand &cmd);
  bool session_over(const std::vector<network::LogEntry> &logs) const;
  void print_new_logs();
  void print_entries(const std::vector<network::LogEntry> &logs, size_t from,
                     const std::string &tag);
  void print_state();
  void send_payload(std::vector<uint8_t> payload);
  bool all_inactive() const;
  void wait_for_inactive(std::chrono::milliseconds limit);

  // stdin reader
  void start_input_thread();
  void stop_input_thread();
  void input_loop();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace palm
