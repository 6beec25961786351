// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "network/server.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <stdexcept>

namespace palm {
namespace network {

namespace {

/**
 * AcceptLoop - bind, accept and stop for one Server run
 *
 * Everything runs on the loop's strand. The loop keeps itself alive through
 * its pending accept and shutdown wait; it only shares state with the Server
 * handle, so the handle may be destroyed first.
 */
class AcceptLoop : public std::enable_shared_from_this<AcceptLoop> {
public:
  struct Context {
    uint16_t port{0};
    std::string bind_address;
    AtomicNetStatePtr state;
    LogBusPtr log;
    std::shared_ptr<util::ShutdownSignal> shutdown;
    std::shared_ptr<ConnectionRegistry> registry;
    std::shared_ptr<std::atomic<uint16_t>> listening_port;
  };

  static void launch(boost::asio::io_context &io_context, Context ctx) {
    auto loop = std::shared_ptr<AcceptLoop>(new AcceptLoop(io_context, std::move(ctx)));
    boost::asio::post(loop->strand_, [loop]() { loop->run(); });
  }

private:
  AcceptLoop(boost::asio::io_context &io_context, Context ctx)
      : io_context_(io_context),
        strand_(boost::asio::make_strand(io_context.get_executor())),
        acceptor_(strand_), ctx_(std::move(ctx)),
        listener_(ctx_.shutdown->listener()) {}

  void run() {
    if (!bind()) {
      return;
    }

    ctx_.state->store(NetState::ACTIVE);
    emit(LogEntry::server_started());
    LOG_NET_INFO("listening on {}",
                 util::FormatEndpoint(ctx_.bind_address, ctx_.listening_port->load()));

    // Registered after ACTIVE so a shutdown() raised while binding is still
    // observed (the signal is level-triggered)
    // The pending accept keeps the loop alive; the wait only observes it
    std::weak_ptr<AcceptLoop> weak = shared_from_this();
    wait_id_ = listener_.async_wait(strand_, [weak]() {
      if (auto self = weak.lock()) {
        self->handle_shutdown();
      }
    });

    start_accept();
  }

  bool bind() {
    using boost::asio::ip::tcp;

    auto normalized = util::ValidateAndNormalizeIP(ctx_.bind_address);
    if (!normalized) {
      LOG_NET_ERROR("invalid bind address '{}'", ctx_.bind_address);
      fail_bind("invalid bind address '" + ctx_.bind_address + "'");
      return false;
    }

    try {
      tcp::endpoint endpoint(boost::asio::ip::make_address(*normalized), ctx_.port);
      acceptor_.open(endpoint.protocol());
      acceptor_.set_option(tcp::acceptor::reuse_address(true));
      acceptor_.bind(endpoint);
      acceptor_.listen(boost::asio::socket_base::max_listen_connections);

      boost::system::error_code ec;
      auto local = acceptor_.local_endpoint(ec);
      ctx_.listening_port->store(ec ? ctx_.port : local.port(), std::memory_order_release);
      return true;
    } catch (const std::exception &e) {
      LOG_NET_ERROR("failed to listen on {}: {}",
                    util::FormatEndpoint(*normalized, ctx_.port), e.what());
      // Do not leave a half-initialized acceptor behind
      boost::system::error_code ignored;
      acceptor_.close(ignored);
      fail_bind(e.what());
      return false;
    }
  }

  void fail_bind(const std::string &error) {
    emit(LogEntry::bind_error(error));
    ctx_.state->store(NetState::INACTIVE);
  }

  void start_accept() {
    acceptor_.async_accept(
        io_context_,
        boost::asio::bind_executor(
            strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                                 boost::asio::ip::tcp::socket socket) {
              self->handle_accept(ec, std::move(socket));
            }));
  }

  void handle_accept(const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket) {
    if (stopping_) {
      boost::system::error_code ignored;
      socket.close(ignored);
      return;
    }

    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        LOG_NET_WARN("accept error: {}", ec.message());
        // Continue accepting despite error
        start_accept();
      }
      return;
    }

    boost::system::error_code opt_ec;
    socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

    boost::system::error_code ep_ec;
    auto remote_ep = socket.remote_endpoint(ep_ec);
    if (ep_ec) {
      // Peer already gone between accept and here
      LOG_NET_DEBUG("dropping accepted socket without peer address: {}", ep_ec.message());
      boost::system::error_code ignored;
      socket.close(ignored);
      start_accept();
      return;
    }
    std::string address = util::FormatEndpoint(remote_ep.address().to_string(), remote_ep.port());

    LOG_NET_DEBUG("connection from {} accepted", address);

    try {
      auto conn = std::make_shared<Connection>(io_context_);
      // Logged before the child starts so its Disconnect cannot come first
      emit(LogEntry::connect(address));
      conn->adopt(std::move(socket), address, ctx_.log, listener_);
      if (!ctx_.registry->Insert(address, conn)) {
        LOG_NET_DEBUG("replaced stale registry entry for {}", address);
      }
    } catch (const std::exception &e) {
      LOG_NET_ERROR("failed to adopt connection from {}: {}", address, e.what());
    }

    start_accept();
  }

  void handle_shutdown() {
    stopping_ = true;

    boost::system::error_code ignored;
    acceptor_.close(ignored);
    ctx_.listening_port->store(0, std::memory_order_release);

    ctx_.state->store(NetState::INACTIVE);
    emit(LogEntry::server_stopped());
    LOG_NET_INFO("server on port {} stopped", ctx_.port);
  }

  void emit(LogEntry entry) {
    if (!ctx_.log->push(std::move(entry))) {
      LOG_NET_TRACE("server log bus closed, dropping event");
    }
  }

  boost::asio::io_context &io_context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::tcp::acceptor acceptor_;
  Context ctx_;
  util::ShutdownListener listener_;
  util::ShutdownListener::WaitId wait_id_{0};
  bool stopping_{false}; // strand-serialized
};

} // namespace

Server::Server(boost::asio::io_context &io_context)
    : io_context_(io_context),
      state_(std::make_shared<AtomicNetState>()),
      log_bus_(std::make_shared<LogBus>()),
      shutdown_(std::make_shared<util::ShutdownSignal>()),
      registry_(std::make_shared<ConnectionRegistry>()),
      listening_port_(std::make_shared<std::atomic<uint16_t>>(0)) {}

Server::~Server() {
  if (state_->load() != NetState::INACTIVE) {
    shutdown_->raise();
  }
  log_bus_->close();
}

void Server::start(uint16_t port, const std::string &bind_address) {
  if (state_->load() != NetState::INACTIVE) {
    LOG_NET_ERROR("start called on server (port {}) in state {}", port_,
                  NetStateAsString(state_->load()));
    throw std::logic_error("start: server is already establishing or active");
  }

  state_->store(NetState::ESTABLISHING);
  // Children of a previous run already saw the last raise
  shutdown_->reset();
  port_ = port;
  bind_address_ = bind_address;

  LOG_NET_DEBUG("starting server on {}", util::FormatEndpoint(bind_address, port));

  AcceptLoop::Context ctx;
  ctx.port = port;
  ctx.bind_address = bind_address;
  ctx.state = state_;
  ctx.log = log_bus_;
  ctx.shutdown = shutdown_;
  ctx.registry = registry_;
  ctx.listening_port = listening_port_;
  AcceptLoop::launch(io_context_, std::move(ctx));
}

void Server::shutdown() {
  shutdown_->raise();
}

const std::vector<LogEntry> &Server::drain_logs(size_t *previous_size) {
  if (previous_size) {
    *previous_size = logs_.size();
  }
  log_bus_->drain_into(logs_);
  return logs_;
}

size_t Server::prune_inactive() {
  size_t removed = registry_->EraseIf([](const std::string &, const ConnectionPtr &conn) {
    return conn->net_state() == NetState::INACTIVE;
  });
  if (removed > 0) {
    LOG_NET_DEBUG("pruned {} inactive connections", removed);
  }
  return removed;
}

} // namespace network
} // namespace palm
