#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of user input (command line, console) with validation
 - Hex rendering and parsing of raw payload bytes

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - IsValidHex: Check a string consists only of hex digits
 - ParseHexBytes: Parse "DE AD be ef" style input into bytes
 - HexEncodeFormatted: Render bytes as "DE AD BE EF"

 All parsers return std::nullopt on any error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace palm {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * - Validates entire string is consumed (no trailing characters)
 * - Checks value is within [min, max] range
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("9000") -> 9000
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * @return true if str is non-empty and all characters are hex digits [0-9a-fA-F]
 */
bool IsValidHex(const std::string& str);

/**
 * Parse hex text into bytes
 *
 * Whitespace is ignored anywhere between digits, so "DEADBEEF",
 * "de ad be ef" and "D E A D" all parse. An odd digit count or any
 * non-hex, non-space character is rejected.
 *
 * Examples:
 *   ParseHexBytes("DE AD BE EF") -> {0xDE, 0xAD, 0xBE, 0xEF}
 *   ParseHexBytes("") -> {} (empty payload)
 *   ParseHexBytes("ABC") -> std::nullopt (odd digit count)
 *   ParseHexBytes("zz") -> std::nullopt
 */
std::optional<std::vector<uint8_t>> ParseHexBytes(const std::string& str);

/**
 * Render bytes as upper-case hex pairs separated by single spaces
 *
 * Example:
 *   HexEncodeFormatted({0xDE, 0xAD, 0x01}) -> "DE AD 01"
 */
std::string HexEncodeFormatted(const std::vector<uint8_t>& data);

/**
 * Strip leading and trailing whitespace
 */
std::string Trim(const std::string& str);

} // namespace util
} // namespace palm
