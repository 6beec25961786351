#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Split and format "host:port" strings used as connection addresses

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsValidIPAddress: Quick check if address string is valid
 - SplitHostPort: Split "host:port" / "[v6]:port" without resolving the host
 - FormatEndpoint: Canonical "ip:port" / "[v6]:port" form used as registry key
*/

#include <cstdint>
#include <optional>
#include <string>

namespace palm {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to IPv4 so that "::ffff:127.0.0.1" and "127.0.0.1" key the same
 * registry slot.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 *   "" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Check if a string is a valid numeric IP address
 */
bool IsValidIPAddress(const std::string& address);

/**
 * Split a connect address into host and port
 *
 * Accepts "host:port" (host may be a DNS name or IPv4 literal) and
 * "[IPv6]:port". The host is not resolved or validated beyond being
 * non-empty; resolution happens asynchronously at connect time.
 *
 * @return true if successfully split, false otherwise
 *
 * Examples:
 *   "127.0.0.1:9000" -> ("127.0.0.1", 9000)
 *   "localhost:80" -> ("localhost", 80)
 *   "[::1]:9000" -> ("::1", 9000)
 *   "::1:9000" -> false (unbracketed IPv6)
 *   "host" -> false (missing port)
 */
bool SplitHostPort(const std::string& address, std::string& out_host, uint16_t& out_port);

/**
 * Format an IP and port as "ip:port", bracketing IPv6 literals
 * The IP is normalized first when it parses.
 */
std::string FormatEndpoint(const std::string& ip, uint16_t port);

} // namespace util
} // namespace palm
