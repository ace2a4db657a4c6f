#pragma once

/*
 Network Address Utilities

 Purpose:
 - Parse "ip:port" strings from the command line, config files and seed lists
 - Normalize addresses so the same host always yields the same node identity

 Key functions:
 - ValidateAndNormalizeIP: validates an address and normalizes IPv4-mapped IPv6 to IPv4
 - ParseIPPort / ParseEndpoint: "1.2.3.4:9000" and "[2001:db8::1]:9000"
 - FormatEndpoint: inverse of ParseEndpoint
*/

#include <cstdint>
#include <optional>
#include <string>

#include <asio/ip/address.hpp>
#include <asio/ip/udp.hpp>

namespace kadcast {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Only numeric addresses are accepted. IPv4-mapped IPv6 addresses are
 * rewritten to plain IPv4 (::ffff:10.0.0.1 -> 10.0.0.1): node identifiers
 * are derived from the address octets, so both spellings of one host must
 * produce the same identifier.
 *
 * @return canonical string, or std::nullopt if invalid
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// Same normalization as ValidateAndNormalizeIP on an already parsed address.
asio::ip::address NormalizeAddress(const asio::ip::address& address);

// Strict decimal port parser: no sign, no whitespace, 1..65535.
std::optional<uint16_t> SafeParsePort(const std::string& port_str);

/**
 * Parse "IP:port" into separate components
 *
 * - IPv4: "192.168.1.1:9000"
 * - IPv6: "[2001:db8::1]:9000" (brackets required)
 */
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

std::optional<asio::ip::udp::endpoint> ParseEndpoint(const std::string& address_port);

// "1.2.3.4:9000" or "[::1]:9000"
std::string FormatEndpoint(const asio::ip::udp::endpoint& endpoint);

}  // namespace util
}  // namespace kadcast
