#include "application.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"
#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <ostream>
#include <poll.h>
#include <unistd.h>  // For read(), write(), STDIN_FILENO (write is async-signal-safe)

namespace palm {
namespace app {

namespace {

// How long :quit / EOF / signals wait for sessions to wind down
constexpr std::chrono::milliseconds SHUTDOWN_GRACE{std::chrono::seconds(3)};

// stdin poll interval; bounds how long stop_input_thread() can take
constexpr int INPUT_POLL_MS = 100;

// Registry keys are canonical "ip:port"; accept what the user typed
std::string CanonicalTarget(const std::string &target) {
  std::string host;
  uint16_t port = 0;
  if (!util::SplitHostPort(target, host, port) || !util::IsValidIPAddress(host)) {
    return target;
  }
  return util::FormatEndpoint(host, port);
}

} // namespace

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config, std::ostream &out)
    : config_(config), out_(out) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  runtime_ = std::make_unique<network::Runtime>(config_.io_threads);
  runtime_->run();
  LOG_APP_DEBUG("Runtime started with {} I/O threads", runtime_->thread_count());

  setup_signal_handlers();

  if (config_.mode == Mode::CLIENT) {
    connection_ = std::make_unique<network::Connection>(runtime_->io_context());
    LOG_APP_INFO("Connecting to {}", config_.connect_address);
    connection_->start_client(config_.connect_address, config_.connect_timeout);
  } else {
    server_ = std::make_unique<network::Server>(runtime_->io_context());
    LOG_APP_INFO("Starting server on {}",
                 util::FormatEndpoint(config_.bind_address, config_.listen_port));
    server_->start(config_.listen_port, config_.bind_address);
  }

  start_input_thread();
  running_ = true;

  LOG_APP_INFO("Press Ctrl+C or type :quit to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  running_ = false;

  LOG_APP_DEBUG("Stopping application");

  stop_input_thread();

  if (connection_) {
    connection_->shutdown();
  }
  if (server_) {
    server_->shutdown();
  }

  // Handlers stop first, then the handles go, then the io_context
  if (runtime_) {
    runtime_->stop();
  }
  connection_.reset();
  server_.reset();
  runtime_.reset();
}

int Application::run() {
  while (!shutdown_requested_) {
    if (!tick()) {
      break;
    }
    std::this_thread::sleep_for(config_.tick);
  }

  if (shutdown_requested_) {
    LOG_APP_INFO("Shutting down...");
    if (connection_) {
      connection_->shutdown();
    }
    if (server_) {
      server_->shutdown();
    }
    wait_for_inactive(SHUTDOWN_GRACE);
  }

  print_new_logs();
  out_.flush();

  return start_failed_ ? 1 : 0;
}

void Application::submit_line(std::string line) {
  std::lock_guard<std::mutex> lock(input_mutex_);
  input_.push_back(std::move(line));
}

void Application::submit_eof() {
  std::lock_guard<std::mutex> lock(input_mutex_);
  input_eof_ = true;
}

// ----------------------------------------------------------------------------
// Tick
// ----------------------------------------------------------------------------

bool Application::tick() {
  print_new_logs();

  if (connection_) {
    network::NetState state = connection_->net_state();
    if (state == network::NetState::ESTABLISHING) {
      // Hold console input until the outcome is known
      return true;
    }
    if (state == network::NetState::INACTIVE) {
      size_t previous = 0;
      const auto &logs = connection_->drain_logs(&previous);
      print_entries(logs, previous, "");
      if (!session_over(logs)) {
        // INACTIVE is published before the final Disconnect entry
        return true;
      }
      start_failed_ = !connection_->session_used();
      return false;
    }
  } else if (server_) {
    network::NetState state = server_->net_state();
    if (state == network::NetState::ESTABLISHING) {
      return true;
    }
    if (state == network::NetState::INACTIVE) {
      size_t previous = 0;
      const auto &logs = server_->drain_logs(&previous);
      print_entries(logs, previous, "");
      if (!logs.empty() && logs.back().kind() == network::LogKind::BIND_ERROR) {
        start_failed_ = true;
        return false;
      }
      return true;
    }
  }

  process_input();
  return true;
}

bool Application::session_over(const std::vector<network::LogEntry> &logs) const {
  if (logs.empty()) {
    return false;
  }
  switch (logs.back().kind()) {
  case network::LogKind::DISCONNECT:
  case network::LogKind::CONNECT_ERROR:
  case network::LogKind::CONNECT_TIMED_OUT:
  case network::LogKind::BIND_ERROR:
    return true;
  default:
    return false;
  }
}

void Application::process_input() {
  std::deque<std::string> lines;
  bool eof = false;
  {
    std::lock_guard<std::mutex> lock(input_mutex_);
    lines.swap(input_);
    eof = input_eof_;
  }

  for (const auto &line : lines) {
    ConsoleCommand cmd = ParseConsoleCommand(line);
    if (cmd.kind == ConsoleCommand::Kind::QUIT) {
      request_shutdown();
      return;
    }
    execute(cmd);
  }

  if (eof) {
    LOG_APP_DEBUG("End of input");
    request_shutdown();
  }
}

void Application::execute(const ConsoleCommand &cmd) {
  using Kind = ConsoleCommand::Kind;

  switch (cmd.kind) {
  case Kind::EMPTY:
  case Kind::QUIT:
    break;

  case Kind::INVALID:
    out_ << "error: " << cmd.error << std::endl;
    break;

  case Kind::SEND:
    send_payload(cmd.payload);
    break;

  case Kind::SEND_TO: {
    if (!server_) {
      out_ << "error: :to is only available in server mode" << std::endl;
      break;
    }
    std::string target = CanonicalTarget(cmd.target);
    network::SendResult result = network::SendResult::NO_RECEIVER;
    bool found = server_->with_connection_mut(target, [&](network::Connection &conn) {
      result = conn.send_data(cmd.payload);
    });
    if (!found) {
      out_ << "error: no connection " << target << std::endl;
    } else if (result == network::SendResult::NO_RECEIVER) {
      out_ << "error: " << target << " is not active" << std::endl;
    }
    break;
  }

  case Kind::KICK: {
    if (!server_) {
      out_ << "error: :kick is only available in server mode" << std::endl;
      break;
    }
    std::string target = CanonicalTarget(cmd.target);
    if (!server_->with_connection_mut(target, [](network::Connection &conn) { conn.shutdown(); })) {
      out_ << "error: no connection " << target << std::endl;
    }
    break;
  }

  case Kind::LIST:
    if (!server_) {
      out_ << "error: :list is only available in server mode" << std::endl;
      break;
    }
    if (server_->connection_count() == 0) {
      out_ << "no connections" << std::endl;
      break;
    }
    server_->for_each_connection([this](const std::string &address, network::Connection &conn) {
      out_ << "  " << address << "  " << network::NetStateAsString(conn.net_state()) << std::endl;
    });
    break;

  case Kind::PRUNE:
    if (!server_) {
      out_ << "error: :prune is only available in server mode" << std::endl;
      break;
    }
    out_ << "pruned " << server_->prune_inactive() << " inactive connections" << std::endl;
    break;

  case Kind::STATE:
    print_state();
    break;
  }
}

void Application::send_payload(std::vector<uint8_t> payload) {
  if (connection_) {
    if (connection_->send_data(std::move(payload)) == network::SendResult::NO_RECEIVER) {
      out_ << "error: not connected" << std::endl;
    }
    return;
  }

  size_t sent = 0;
  server_->for_each_connection([&](const std::string &, network::Connection &conn) {
    if (conn.net_state() == network::NetState::ACTIVE &&
        conn.send_data(payload) == network::SendResult::QUEUED) {
      ++sent;
    }
  });
  if (sent == 0) {
    out_ << "error: no active connections" << std::endl;
  }
}

void Application::print_state() {
  if (connection_) {
    out_ << "state: " << network::NetStateAsString(connection_->net_state()) << " ("
         << connection_->address().value_or("-") << ")" << std::endl;
  } else if (server_) {
    out_ << "state: " << network::NetStateAsString(server_->net_state()) << ", port "
         << server_->listening_port() << ", " << server_->connection_count()
         << " connections" << std::endl;
  }
}

// ----------------------------------------------------------------------------
// Log output
// ----------------------------------------------------------------------------

void Application::print_new_logs() {
  size_t previous = 0;
  if (connection_) {
    const auto &logs = connection_->drain_logs(&previous);
    print_entries(logs, previous, "");
    return;
  }
  if (!server_) {
    return;
  }

  const auto &logs = server_->drain_logs(&previous);
  print_entries(logs, previous, "");

  server_->for_each_connection([this](const std::string &address, network::Connection &conn) {
    size_t child_previous = 0;
    const auto &child_logs = conn.drain_logs(&child_previous);
    print_entries(child_logs, child_previous, address);
  });
}

void Application::print_entries(const std::vector<network::LogEntry> &logs, size_t from,
                                const std::string &tag) {
  for (size_t i = from; i < logs.size(); ++i) {
    const auto &entry = logs[i];
    if (config_.json_output) {
      nlohmann::json j = entry.to_json();
      if (!tag.empty()) {
        j["connection"] = tag;
      }
      out_ << j.dump() << '\n';
    } else {
      out_ << '[' << util::FormatTimestamp(entry.timestamp()) << "] ";
      if (!tag.empty()) {
        out_ << '<' << tag << "> ";
      }
      out_ << entry.describe() << '\n';
    }
  }
  out_.flush();
}

bool Application::all_inactive() const {
  if (connection_) {
    return connection_->net_state() == network::NetState::INACTIVE;
  }
  if (!server_) {
    return true;
  }
  if (server_->net_state() != network::NetState::INACTIVE) {
    return false;
  }
  for (const auto &address : server_->connection_addresses()) {
    bool active = false;
    server_->with_connection(address, [&](const network::Connection &conn) {
      active = conn.net_state() != network::NetState::INACTIVE;
    });
    if (active) {
      return false;
    }
  }
  return true;
}

void Application::wait_for_inactive(std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!all_inactive()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      LOG_APP_WARN("Sessions still running after {} ms, stopping anyway", limit.count());
      return;
    }
    print_new_logs();
    std::this_thread::sleep_for(config_.tick);
  }
  // The last entries trail the state change by a moment
  std::this_thread::sleep_for(config_.tick);
}

// ----------------------------------------------------------------------------
// stdin reader
// ----------------------------------------------------------------------------

void Application::start_input_thread() {
  input_stop_ = false;
  input_thread_ = std::make_unique<std::thread>(&Application::input_loop, this);
}

void Application::stop_input_thread() {
  input_stop_ = true;
  if (input_thread_ && input_thread_->joinable()) {
    input_thread_->join();
  }
  input_thread_.reset();
}

void Application::input_loop() {
  std::string pending;
  char buffer[4096];

  while (!input_stop_) {
    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    int ready = poll(&pfd, 1, INPUT_POLL_MS);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG_APP_ERROR("Polling stdin failed: {}", std::strerror(errno));
      break;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      LOG_APP_ERROR("Reading stdin failed: {}", std::strerror(errno));
      break;
    }
    if (n == 0) {
      break;
    }

    pending.append(buffer, static_cast<size_t>(n));
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      submit_line(pending.substr(0, newline));
      pending.erase(0, newline + 1);
    }
  }

  if (input_stop_) {
    return;
  }
  if (!pending.empty()) {
    submit_line(pending);
  }
  submit_eof();
}

// ----------------------------------------------------------------------------
// Signals
// ----------------------------------------------------------------------------

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char* msg = "\nReceived signal\n";
    ssize_t ignored = write(STDERR_FILENO, msg, 17);  // Use literal length to avoid strlen()
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace palm
