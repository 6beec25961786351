// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace palm {
namespace network {

/**
 * DataPacket - origin tag plus an opaque byte payload
 *
 * Immutable once built. Copies are cheap: they share the payload storage,
 * which is what logging and broadcasting to writer tasks rely on.
 *
 * An empty origin marks a locally sent packet; a received packet carries the
 * peer address it came from.
 */
class DataPacket {
public:
  DataPacket(std::string origin, std::vector<uint8_t> payload)
      : origin_(std::move(origin)),
        payload_(std::make_shared<const std::vector<uint8_t>>(std::move(payload))) {}

  static DataPacket local(std::vector<uint8_t> payload) {
    return DataPacket(std::string(), std::move(payload));
  }

  const std::string &origin() const { return origin_; }
  bool is_local() const { return origin_.empty(); }

  const std::vector<uint8_t> &payload() const { return *payload_; }
  size_t size() const { return payload_->size(); }

  bool operator==(const DataPacket &other) const {
    return origin_ == other.origin_ && *payload_ == *other.payload_;
  }
  bool operator!=(const DataPacket &other) const { return !(*this == other); }

private:
  std::string origin_;
  std::shared_ptr<const std::vector<uint8_t>> payload_;
};

} // namespace network
} // namespace palm
