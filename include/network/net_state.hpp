// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace palm {
namespace network {

/**
 * Connectivity of a Connection or Server
 *
 * Legal transitions:
 *   INACTIVE -> ESTABLISHING -> ACTIVE -> INACTIVE
 *   INACTIVE -> ESTABLISHING -> INACTIVE   (connect/bind failed)
 */
enum class NetState : uint8_t {
  INACTIVE,     // no socket
  ESTABLISHING, // connect or bind in flight
  ACTIVE,       // socket usable
};

std::string NetStateAsString(NetState state);

/**
 * AtomicNetState - state cell shared between an owner handle and its
 * background task
 *
 * Only the task (and the synchronous first step of a start call) writes it.
 * All accesses are relaxed: the value gates lifecycle calls and feeds the
 * display, it never publishes other data.
 */
class AtomicNetState {
public:
  AtomicNetState() = default;
  explicit AtomicNetState(NetState initial) : state_(initial) {}

  AtomicNetState(const AtomicNetState&) = delete;
  AtomicNetState& operator=(const AtomicNetState&) = delete;

  NetState load() const { return state_.load(std::memory_order_relaxed); }
  void store(NetState state) { state_.store(state, std::memory_order_relaxed); }

private:
  std::atomic<NetState> state_{NetState::INACTIVE};
};

using AtomicNetStatePtr = std::shared_ptr<AtomicNetState>;

} // namespace network
} // namespace palm
