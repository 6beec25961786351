// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "network/log_entry.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>

namespace palm {
namespace network {

std::string LogKindAsString(LogKind kind) {
  switch (kind) {
  case LogKind::CONNECT:
    return "connect";
  case LogKind::DISCONNECT:
    return "disconnect";
  case LogKind::RECEIVED_PACKET:
    return "received";
  case LogKind::SENT_PACKET:
    return "sent";
  case LogKind::CONNECT_ERROR:
    return "connect_error";
  case LogKind::CONNECT_TIMED_OUT:
    return "connect_timed_out";
  case LogKind::FATAL_READ_ERROR:
    return "read_error";
  case LogKind::FATAL_WRITE_ERROR:
    return "write_error";
  case LogKind::BIND_ERROR:
    return "bind_error";
  case LogKind::SERVER_STARTED:
    return "server_started";
  case LogKind::SERVER_STOPPED:
    return "server_stopped";
  default:
    return "unknown";
  }
}

LogEntry::LogEntry(LogKind kind, std::string text, std::optional<DataPacket> packet)
    : kind_(kind), timestamp_(util::Now()), text_(std::move(text)),
      packet_(std::move(packet)) {}

LogEntry LogEntry::connect(std::string address) {
  return LogEntry(LogKind::CONNECT, std::move(address), std::nullopt);
}

LogEntry LogEntry::disconnect(std::string address) {
  return LogEntry(LogKind::DISCONNECT, std::move(address), std::nullopt);
}

LogEntry LogEntry::received(DataPacket packet) {
  return LogEntry(LogKind::RECEIVED_PACKET, std::string(), std::move(packet));
}

LogEntry LogEntry::sent(DataPacket packet) {
  return LogEntry(LogKind::SENT_PACKET, std::string(), std::move(packet));
}

LogEntry LogEntry::connect_error(std::string error) {
  return LogEntry(LogKind::CONNECT_ERROR, std::move(error), std::nullopt);
}

LogEntry LogEntry::connect_timed_out() {
  return LogEntry(LogKind::CONNECT_TIMED_OUT, std::string(), std::nullopt);
}

LogEntry LogEntry::fatal_read_error(std::string error) {
  return LogEntry(LogKind::FATAL_READ_ERROR, std::move(error), std::nullopt);
}

LogEntry LogEntry::fatal_write_error(std::string error) {
  return LogEntry(LogKind::FATAL_WRITE_ERROR, std::move(error), std::nullopt);
}

LogEntry LogEntry::bind_error(std::string error) {
  return LogEntry(LogKind::BIND_ERROR, std::move(error), std::nullopt);
}

LogEntry LogEntry::server_started() {
  return LogEntry(LogKind::SERVER_STARTED, std::string(), std::nullopt);
}

LogEntry LogEntry::server_stopped() {
  return LogEntry(LogKind::SERVER_STOPPED, std::string(), std::nullopt);
}

std::string LogEntry::describe() const {
  switch (kind_) {
  case LogKind::CONNECT:
    return "Connected to " + text_;
  case LogKind::DISCONNECT:
    return "Disconnected from " + text_;
  case LogKind::RECEIVED_PACKET:
    return "Received " + std::to_string(packet_->size()) + " bytes from " +
           packet_->origin() + ": " + util::HexEncodeFormatted(packet_->payload());
  case LogKind::SENT_PACKET:
    return "Sent " + std::to_string(packet_->size()) +
           " bytes: " + util::HexEncodeFormatted(packet_->payload());
  case LogKind::CONNECT_ERROR:
    return "Failed to connect: " + text_;
  case LogKind::CONNECT_TIMED_OUT:
    return "Connection attempt timed out";
  case LogKind::FATAL_READ_ERROR:
    return "Read failed: " + text_;
  case LogKind::FATAL_WRITE_ERROR:
    return "Write failed: " + text_;
  case LogKind::BIND_ERROR:
    return "Failed to start server: " + text_;
  case LogKind::SERVER_STARTED:
    return "Server started";
  case LogKind::SERVER_STOPPED:
    return "Server stopped";
  default:
    return "Unknown event";
  }
}

nlohmann::json LogEntry::to_json() const {
  nlohmann::json j;
  j["time"] = util::FormatTimestamp(timestamp_);
  j["kind"] = LogKindAsString(kind_);

  switch (kind_) {
  case LogKind::CONNECT:
  case LogKind::DISCONNECT:
    j["address"] = text_;
    break;
  case LogKind::CONNECT_ERROR:
  case LogKind::FATAL_READ_ERROR:
  case LogKind::FATAL_WRITE_ERROR:
  case LogKind::BIND_ERROR:
    j["error"] = text_;
    break;
  case LogKind::RECEIVED_PACKET:
  case LogKind::SENT_PACKET:
    if (!packet_->is_local()) {
      j["address"] = packet_->origin();
    }
    j["size"] = packet_->size();
    j["payload"] = util::HexEncodeFormatted(packet_->payload());
    break;
  default:
    break;
  }
  return j;
}

} // namespace network
} // namespace palm
