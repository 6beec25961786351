#include "console_command.hpp"
#include "util/string_parsing.hpp"

namespace palm {
namespace app {

namespace {

// Split "word rest..." at the first whitespace run
void SplitFirstWord(const std::string &str, std::string &word, std::string &rest) {
  size_t end = str.find_first_of(" \t");
  if (end == std::string::npos) {
    word = str;
    rest.clear();
    return;
  }
  word = str.substr(0, end);
  size_t next = str.find_first_not_of(" \t", end);
  rest = next == std::string::npos ? std::string() : str.substr(next);
}

ConsoleCommand Invalid(std::string error) {
  ConsoleCommand cmd;
  cmd.kind = ConsoleCommand::Kind::INVALID;
  cmd.error = std::move(error);
  return cmd;
}

} // namespace

ConsoleCommand ParseConsoleCommand(const std::string &line) {
  ConsoleCommand cmd;
  std::string trimmed = util::Trim(line);
  if (trimmed.empty()) {
    return cmd;
  }

  if (trimmed[0] != ':') {
    auto bytes = util::ParseHexBytes(trimmed);
    if (!bytes) {
      return Invalid("invalid hex payload (expected pairs of hex digits)");
    }
    if (bytes->empty()) {
      return cmd;
    }
    cmd.kind = ConsoleCommand::Kind::SEND;
    cmd.payload = std::move(*bytes);
    return cmd;
  }

  std::string word, rest;
  SplitFirstWord(trimmed, word, rest);

  if (word == ":text") {
    // Keep the text exactly as typed after the separator, minus the newline
    size_t start = line.find(":text") + 5;
    if (start < line.size() && (line[start] == ' ' || line[start] == '\t')) {
      ++start;
    }
    std::string text = start < line.size() ? line.substr(start) : std::string();
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
      text.pop_back();
    }
    if (text.empty()) {
      return Invalid(":text needs a string to send");
    }
    cmd.kind = ConsoleCommand::Kind::SEND;
    cmd.payload.assign(text.begin(), text.end());
    return cmd;
  }

  if (word == ":to") {
    std::string target, hex;
    SplitFirstWord(rest, target, hex);
    if (target.empty()) {
      return Invalid("usage: :to <ip:port> <hex bytes>");
    }
    auto bytes = util::ParseHexBytes(hex);
    if (!bytes || bytes->empty()) {
      return Invalid("invalid or empty hex payload for :to");
    }
    cmd.kind = ConsoleCommand::Kind::SEND_TO;
    cmd.target = std::move(target);
    cmd.payload = std::move(*bytes);
    return cmd;
  }

  if (word == ":kick") {
    if (rest.empty() || rest.find_first_of(" \t") != std::string::npos) {
      return Invalid("usage: :kick <ip:port>");
    }
    cmd.kind = ConsoleCommand::Kind::KICK;
    cmd.target = rest;
    return cmd;
  }

  if (!rest.empty()) {
    return Invalid(word + " takes no arguments");
  }

  if (word == ":list") {
    cmd.kind = ConsoleCommand::Kind::LIST;
  } else if (word == ":prune") {
    cmd.kind = ConsoleCommand::Kind::PRUNE;
  } else if (word == ":state") {
    cmd.kind = ConsoleCommand::Kind::STATE;
  } else if (word == ":quit") {
    cmd.kind = ConsoleCommand::Kind::QUIT;
  } else {
    return Invalid("unknown command " + word);
  }
  return cmd;
}

} // namespace app
} // namespace palm
