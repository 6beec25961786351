// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license

#include "network/net_state.hpp"

namespace palm {
namespace network {

std::string NetStateAsString(NetState state) {
  switch (state) {
  case NetState::INACTIVE:
    return "Inactive";
  case NetState::ESTABLISHING:
    return "Establishing";
  case NetState::ACTIVE:
    return "Active";
  default:
    return "Unknown";
  }
}

} // namespace network
} // namespace palm
