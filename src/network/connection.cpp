// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "network/connection.hpp"
#include "network/session.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <stdexcept>

namespace palm {
namespace network {

namespace {

/**
 * ConnectAttempt - one timed resolve + connect, run on its own strand
 *
 * Resolution, connect and the timeout timer race; done_ makes sure exactly
 * one of them reports. The attempt keeps itself alive through its pending
 * handlers.
 */
class ConnectAttempt : public std::enable_shared_from_this<ConnectAttempt> {
public:
  static void launch(boost::asio::io_context &io_context, SessionContext ctx,
                     std::chrono::milliseconds timeout,
                     std::shared_ptr<std::atomic<bool>> session_used) {
    auto attempt = std::shared_ptr<ConnectAttempt>(
        new ConnectAttempt(io_context, std::move(ctx), timeout, std::move(session_used)));
    boost::asio::post(attempt->strand_, [attempt]() { attempt->run(); });
  }

private:
  ConnectAttempt(boost::asio::io_context &io_context, SessionContext ctx,
                 std::chrono::milliseconds timeout,
                 std::shared_ptr<std::atomic<bool>> session_used)
      : strand_(boost::asio::make_strand(io_context.get_executor())),
        socket_(strand_), resolver_(strand_), timer_(strand_),
        ctx_(std::move(ctx)), timeout_(timeout),
        session_used_(std::move(session_used)) {}

  void run() {
    std::string host;
    uint16_t port = 0;
    if (!util::SplitHostPort(ctx_.address, host, port)) {
      fail(LogEntry::connect_error("invalid address '" + ctx_.address +
                                   "', expected host:port"));
      return;
    }

    timer_.expires_after(timeout_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted || self->done_) {
        return;
      }
      LOG_NET_WARN("connect timeout to {} after {} ms", self->ctx_.address,
                   self->timeout_.count());
      boost::system::error_code ignored;
      self->resolver_.cancel();
      self->socket_.close(ignored);
      self->fail(LogEntry::connect_timed_out());
    });

    resolver_.async_resolve(
        host, std::to_string(port),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    boost::asio::ip::tcp::resolver::results_type results) {
          if (self->done_) return; // timed out
          if (ec) {
            LOG_NET_DEBUG("failed to resolve {}: {}", self->ctx_.address, ec.message());
            self->fail(LogEntry::connect_error(ec.message()));
            return;
          }

          boost::asio::async_connect(
              self->socket_, results,
              [self](const boost::system::error_code &ec,
                     const boost::asio::ip::tcp::endpoint &) {
                if (self->done_) return; // timed out
                if (ec) {
                  LOG_NET_DEBUG("failed to connect to {}: {}", self->ctx_.address, ec.message());
                  self->fail(LogEntry::connect_error(ec.message()));
                  return;
                }
                self->succeed();
              });
        });
  }

  void fail(LogEntry entry) {
    done_ = true;
    (void)timer_.cancel();
    // INACTIVE is published last so a driver that sees it can rely on the
    // outcome entry already being on the bus
    if (!ctx_.log->push(std::move(entry))) {
      LOG_NET_TRACE("log bus closed, dropping connect outcome for {}", ctx_.address);
    }
    ctx_.state->store(NetState::INACTIVE);
  }

  void succeed() {
    done_ = true;
    (void)timer_.cancel();

    boost::system::error_code opt_ec;
    socket_.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

    LOG_NET_INFO("connected to {}", ctx_.address);

    // Release the socket from the connect strand into the session's own
    boost::asio::ip::tcp::socket socket(std::move(socket_));
    auto session = Session::create(std::move(socket), ctx_);
    session_used_->store(true, std::memory_order_release);
    ctx_.state->store(NetState::ACTIVE);
    if (!ctx_.log->push(LogEntry::connect(ctx_.address))) {
      LOG_NET_TRACE("log bus closed, dropping connect event for {}", ctx_.address);
    }
    session->start();
  }

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::asio::steady_timer timer_;
  SessionContext ctx_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<std::atomic<bool>> session_used_;
  bool done_{false}; // strand-serialized
};

} // namespace

Connection::Connection(boost::asio::io_context &io_context)
    : io_context_(io_context),
      state_(std::make_shared<AtomicNetState>()),
      log_bus_(std::make_shared<LogBus>()),
      shutdown_(std::make_shared<util::ShutdownSignal>()),
      sender_(std::make_shared<SendChannel>()),
      session_used_(std::make_shared<std::atomic<bool>>(false)) {}

Connection::~Connection() {
  if (state_->load() != NetState::INACTIVE) {
    shutdown_->raise();
    // A writer waiting for a packet holds its session; wake it even if the
    // shutdown handler never gets to run
    sender_->close_receivers();
  }
  // Parked producers must not wait for a consumer that is gone
  log_bus_->close();
}

void Connection::check_startable(const char *operation) const {
  if (state_->load() != NetState::INACTIVE) {
    LOG_NET_ERROR("{} called on connection {} in state {}", operation,
                  address_.value_or("<none>"), NetStateAsString(state_->load()));
    throw std::logic_error(std::string(operation) +
                           ": connection is already establishing or active");
  }
  if (session_used_->load(std::memory_order_acquire)) {
    LOG_NET_ERROR("{} called on finished connection {}; connections are single-use",
                  operation, address_.value_or("<none>"));
    throw std::logic_error(std::string(operation) +
                           ": connection is single-use and its session has ended");
  }
}

void Connection::start_client(const std::string &address,
                              std::chrono::milliseconds timeout) {
  check_startable("start_client");

  // Set synchronously so a second start is rejected before any I/O happens
  state_->store(NetState::ESTABLISHING);
  // A shutdown() issued while idle must not kill the new session
  shutdown_->reset();
  address_ = address;

  LOG_NET_DEBUG("connecting to {} (timeout {} ms)", address, timeout.count());

  SessionContext ctx;
  ctx.address = address;
  ctx.state = state_;
  ctx.log = log_bus_;
  ctx.shutdown = shutdown_;
  ctx.sender = sender_;
  ConnectAttempt::launch(io_context_, std::move(ctx), timeout, session_used_);
}

void Connection::adopt(boost::asio::ip::tcp::socket socket, const std::string &address,
                       LogBusPtr parent_log, util::ShutdownListener external_shutdown) {
  check_startable("adopt");

  shutdown_->reset();
  address_ = address;

  SessionContext ctx;
  ctx.address = address;
  ctx.state = state_;
  ctx.log = log_bus_;
  ctx.parent_log = std::move(parent_log);
  ctx.shutdown = shutdown_;
  ctx.external_shutdown = std::move(external_shutdown);
  ctx.sender = sender_;

  auto session = Session::create(std::move(socket), std::move(ctx));
  session_used_->store(true, std::memory_order_release);
  state_->store(NetState::ACTIVE);
  if (!log_bus_->push(LogEntry::connect(address))) {
    LOG_NET_TRACE("log bus closed, dropping connect event for {}", address);
  }
  session->start();
}

SendResult Connection::send_data(std::vector<uint8_t> payload) {
  DataPacket packet = DataPacket::local(std::move(payload));
  if (sender_->publish(packet) == 0) {
    LOG_NET_DEBUG("send to {} rejected: no active session", address_.value_or("<none>"));
    return SendResult::NO_RECEIVER;
  }
  logs_.push_back(LogEntry::sent(std::move(packet)));
  return SendResult::QUEUED;
}

void Connection::shutdown() {
  shutdown_->raise();
}

const std::vector<LogEntry> &Connection::drain_logs(size_t *previous_size) {
  if (previous_size) {
    *previous_size = logs_.size();
  }
  log_bus_->drain_into(logs_);
  return logs_;
}

} // namespace network
} // namespace palm
