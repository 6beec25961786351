#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>

namespace palm {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool SplitHostPort(const std::string& address, std::string& out_host, uint16_t& out_port) {
  if (address.empty()) {
    return false;
  }

  std::string host;
  std::string port_str;

  if (address[0] == '[') {
    size_t bracket_end = address.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false; // Missing closing bracket or empty brackets
    }
    if (bracket_end + 1 >= address.length() || address[bracket_end + 1] != ':') {
      return false; // Missing :port
    }
    host = address.substr(1, bracket_end - 1);
    port_str = address.substr(bracket_end + 2);

    // Brackets are only meaningful around an IPv6 literal
    if (!IsValidIPAddress(host)) {
      return false;
    }
  } else {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos) {
      return false;
    }
    host = address.substr(0, colon);
    port_str = address.substr(colon + 1);

    // Multiple colons without brackets is an unbracketed IPv6 literal
    if (host.empty() || host.find(':') != std::string::npos) {
      return false;
    }
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return false;
  }

  out_host = host;
  out_port = *port;
  return true;
}

std::string FormatEndpoint(const std::string& ip, uint16_t port) {
  std::string host = ValidateAndNormalizeIP(ip).value_or(ip);
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

} // namespace util
} // namespace palm
