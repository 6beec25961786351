// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include "network/data_packet.hpp"
#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace palm {
namespace network {

enum class LogKind {
  CONNECT,           // address
  DISCONNECT,        // address
  RECEIVED_PACKET,   // packet (origin = peer address)
  SENT_PACKET,       // packet (origin empty)
  CONNECT_ERROR,     // error text
  CONNECT_TIMED_OUT,
  FATAL_READ_ERROR,  // error text
  FATAL_WRITE_ERROR, // error text
  BIND_ERROR,        // error text
  SERVER_STARTED,
  SERVER_STOPPED,
};

std::string LogKindAsString(LogKind kind);

/**
 * LogEntry - one user-visible event, stamped when it is created
 *
 * Built only through the named factories below, which keep the kind and its
 * attached data consistent.
 */
class LogEntry {
public:
  static LogEntry connect(std::string address);
  static LogEntry disconnect(std::string address);
  static LogEntry received(DataPacket packet);
  static LogEntry sent(DataPacket packet);
  static LogEntry connect_error(std::string error);
  static LogEntry connect_timed_out();
  static LogEntry fatal_read_error(std::string error);
  static LogEntry fatal_write_error(std::string error);
  static LogEntry bind_error(std::string error);
  static LogEntry server_started();
  static LogEntry server_stopped();

  LogKind kind() const { return kind_; }
  std::chrono::system_clock::time_point timestamp() const { return timestamp_; }

  // Peer address for CONNECT/DISCONNECT, error text for the error kinds,
  // empty otherwise
  const std::string &text() const { return text_; }

  // Set for RECEIVED_PACKET and SENT_PACKET only
  const std::optional<DataPacket> &packet() const { return packet_; }

  // One-line rendering, e.g. "Received 4 bytes from 127.0.0.1:5000: DE AD BE EF"
  std::string describe() const;

  // {"time": "...", "kind": "...", "address"/"error"/"payload": ...}
  nlohmann::json to_json() const;

private:
  LogEntry(LogKind kind, std::string text, std::optional<DataPacket> packet);

  LogKind kind_;
  std::chrono::system_clock::time_point timestamp_;
  std::string text_;
  std::optional<DataPacket> packet_;
};

} // namespace network
} // namespace palm
