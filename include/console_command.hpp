#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace palm {
namespace app {

/**
 * One parsed console line
 *
 *   DE AD BE EF            SEND      (payload)
 *   :to 1.2.3.4:5 DEADBEEF SEND_TO   (target, payload)
 *   :kick 1.2.3.4:5        KICK      (target)
 *   :list / :prune / :state / :quit
 *   :text hello world      SEND      (payload = UTF-8 bytes after ":text ")
 *
 * Anything else is INVALID with a human readable error.
 */
struct ConsoleCommand {
  enum class Kind {
    EMPTY,
    SEND,
    SEND_TO,
    KICK,
    LIST,
    PRUNE,
    STATE,
    QUIT,
    INVALID,
  };

  Kind kind{Kind::EMPTY};
  std::string target;
  std::vector<uint8_t> payload;
  std::string error;
};

ConsoleCommand ParseConsoleCommand(const std::string &line);

} // namespace app
} // namespace palm
