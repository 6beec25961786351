// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "network/session.hpp"
#include "util/logging.hpp"
#include <cassert>

namespace palm {
namespace network {

bool Session::is_transient_read_error(const boost::system::error_code &ec) {
  return ec == boost::asio::error::interrupted ||
         ec == boost::asio::error::try_again ||
         ec == boost::asio::error::would_block;
}

std::shared_ptr<Session> Session::create(boost::asio::ip::tcp::socket socket,
                                         SessionContext ctx) {
  return std::shared_ptr<Session>(new Session(std::move(socket), std::move(ctx)));
}

Session::Session(boost::asio::ip::tcp::socket socket, SessionContext ctx)
    : socket_(std::move(socket)),
      strand_(boost::asio::make_strand(socket_.get_executor())),
      ctx_(std::move(ctx)),
      local_listener_(ctx_.shutdown->listener()),
      receiver_(ctx_.sender->subscribe()) {}

Session::~Session() {
  // Do not log here; the last reference may be dropped while the io_context
  // is torn down after the logger is gone
}

void Session::start() {
  auto self = shared_from_this();
  // Weak: the waits live in shutdown state this session itself holds
  std::weak_ptr<Session> weak = self;

  local_wait_id_ = local_listener_.async_wait(strand_, [weak]() {
    if (auto session = weak.lock()) {
      session->handle_local_shutdown();
    }
  });

  if (ctx_.external_shutdown.valid()) {
    // Cascade: the parent's stop is turned into our own stop so that the
    // normal teardown path runs
    external_wait_id_ = ctx_.external_shutdown.async_wait(strand_, [weak]() {
      if (auto session = weak.lock()) {
        LOG_NET_DEBUG("parent shutdown observed by session {}", session->ctx_.address);
        session->ctx_.shutdown->raise();
      }
    });
  }

  boost::asio::dispatch(strand_, [self]() {
    self->start_read_impl();
    self->wait_for_packet_impl();
  });
}

void Session::emit(LogEntry entry) {
  if (!ctx_.log->push(std::move(entry))) {
    LOG_NET_TRACE("log bus closed, dropping event for {}", ctx_.address);
  }
}

// ----------------------------------------------------------------------------
// Reader
// ----------------------------------------------------------------------------

void Session::start_read_impl() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  if (stopping_) {
    reader_done();
    return;
  }

  socket_.async_read_some(
      boost::asio::buffer(read_buffer_),
      boost::asio::bind_executor(
          strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                               size_t bytes_transferred) {
            self->handle_read(ec, bytes_transferred);
          }));
}

void Session::handle_read(const boost::system::error_code &ec, size_t bytes_transferred) {
  if (!ec && bytes_transferred > 0) {
    LOG_NET_TRACE("received {} bytes from {}", bytes_transferred, ctx_.address);
    std::vector<uint8_t> data(read_buffer_.begin(), read_buffer_.begin() + bytes_transferred);
    // The next read waits until the consumer has room for this chunk
    log_pending_ = true;
    log_push_id_ = ctx_.log->async_push(
        LogEntry::received(DataPacket(ctx_.address, std::move(data))), strand_,
        [self = shared_from_this()](bool pushed) { self->handle_logged(pushed); });
    return;
  }

  if (!ec || ec == boost::asio::error::eof) {
    // Peer closed its side; not an error
    LOG_NET_DEBUG("peer {} closed the connection", ctx_.address);
    ctx_.shutdown->raise();
    reader_done();
    return;
  }

  if (ec == boost::asio::error::operation_aborted) {
    // Cancelled by our own shutdown
    reader_done();
    return;
  }

  if (is_transient_read_error(ec)) {
    LOG_NET_TRACE("transient read error from {}: {}, retrying", ctx_.address, ec.message());
    start_read_impl();
    return;
  }

  LOG_NET_DEBUG("read error from {}: {}", ctx_.address, ec.message());
  emit(LogEntry::fatal_read_error(ec.message()));
  ctx_.shutdown->raise();
  reader_done();
}

void Session::handle_logged(bool pushed) {
  log_pending_ = false;
  log_push_id_ = 0;
  if (!pushed) {
    LOG_NET_TRACE("log bus closed, dropping received packet from {}", ctx_.address);
  }
  start_read_impl();
}

void Session::abandon_parked_log() {
  if (!log_pending_ || log_push_id_ == 0) {
    // Either idle or already admitted; handle_logged() ends the reader
    return;
  }
  auto entry = ctx_.log->cancel_push(log_push_id_);
  if (!entry) {
    return;
  }
  // Keep the chunk that was already read; it goes in ahead of Disconnect
  emit(std::move(*entry));
  log_pending_ = false;
  log_push_id_ = 0;
  reader_done();
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

void Session::wait_for_packet_impl() {
  receiver_->async_receive(strand_, [self = shared_from_this()](std::optional<DataPacket> packet) {
    self->handle_packet(std::move(packet));
  });
}

void Session::handle_packet(std::optional<DataPacket> packet) {
  if (!packet || stopping_) {
    writer_done();
    return;
  }

  write_in_flight_ = true;
  // The packet is captured so its shared payload outlives the write
  boost::asio::async_write(
      socket_, boost::asio::buffer(packet->payload()),
      boost::asio::bind_executor(
          strand_, [self = shared_from_this(), packet](const boost::system::error_code &ec,
                                                       size_t /*bytes_transferred*/) {
            self->handle_write(ec);
          }));
}

void Session::handle_write(const boost::system::error_code &ec) {
  write_in_flight_ = false;

  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_DEBUG("write error to {}: {}", ctx_.address, ec.message());
      emit(LogEntry::fatal_write_error(ec.message()));
    }
    ctx_.shutdown->raise();
    writer_done();
    cancel_read_impl();
    return;
  }

  if (stopping_) {
    // Shutdown arrived while this packet was on the wire
    writer_done();
    cancel_read_impl();
    return;
  }

  wait_for_packet_impl();
}

// ----------------------------------------------------------------------------
// Shutdown and teardown
// ----------------------------------------------------------------------------

void Session::handle_local_shutdown() {
  if (finished_) {
    return;
  }
  stopping_ = true;

  // Completes a pending async_receive with nullopt
  receiver_->close();

  // A reader parked on a full log bus has no read to cancel
  abandon_parked_log();

  // A write in flight is finished first; handle_write cancels the read then
  if (!write_in_flight_) {
    cancel_read_impl();
  }
}

void Session::cancel_read_impl() {
  if (reader_done_) {
    return;
  }
  boost::system::error_code ignored;
  socket_.cancel(ignored);
}

void Session::reader_done() {
  reader_done_ = true;
  finish_if_done();
}

void Session::writer_done() {
  writer_done_ = true;
  receiver_->close();
  finish_if_done();
}

void Session::finish_if_done() {
  if (!reader_done_ || !writer_done_ || finished_) {
    return;
  }
  finished_ = true;

  local_listener_.cancel(local_wait_id_);
  if (ctx_.external_shutdown.valid()) {
    ctx_.external_shutdown.cancel(external_wait_id_);
  }

  {
    boost::system::error_code ignored;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  ctx_.shutdown->reset();
  ctx_.state->store(NetState::INACTIVE);

  emit(LogEntry::disconnect(ctx_.address));
  if (ctx_.parent_log) {
    if (!ctx_.parent_log->push(LogEntry::disconnect(ctx_.address))) {
      LOG_NET_TRACE("parent log bus closed, dropping disconnect of {}", ctx_.address);
    }
  }

  LOG_NET_INFO("disconnected from {}", ctx_.address);
}

} // namespace network
} // namespace palm
