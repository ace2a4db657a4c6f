#include "util/netaddress.hpp"

#include <charconv>

namespace kadcast {
namespace util {

asio::ip::address NormalizeAddress(const asio::ip::address& address) {
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6());
  }
  return address;
}

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }
  return NormalizeAddress(ip).to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

std::optional<uint16_t> SafeParsePort(const std::string& port_str) {
  if (port_str.empty() || port_str.size() > 5) {
    return std::nullopt;
  }
  for (char c : port_str) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
  if (ec != std::errc() || ptr != port_str.data() + port_str.size()) {
    return std::nullopt;
  }
  if (value == 0 || value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip;
  std::string port_str;

  if (address_port[0] == '[') {
    const size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= address_port.size() || address_port[bracket_end + 1] != ':') {
      return false;
    }
    ip = address_port.substr(1, bracket_end - 1);
    port_str = address_port.substr(bracket_end + 2);
  } else {
    const size_t colon = address_port.find(':');
    if (colon == std::string::npos || colon == 0) {
      return false;
    }
    // Unbracketed IPv6 is ambiguous
    if (address_port.find(':', colon + 1) != std::string::npos) {
      return false;
    }
    ip = address_port.substr(0, colon);
    port_str = address_port.substr(colon + 1);
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return false;
  }
  auto normalized = ValidateAndNormalizeIP(ip);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

std::optional<asio::ip::udp::endpoint> ParseEndpoint(const std::string& address_port) {
  std::string ip;
  uint16_t port = 0;
  if (!ParseIPPort(address_port, ip, port)) {
    return std::nullopt;
  }
  asio::error_code ec;
  auto address = asio::ip::make_address(ip, ec);
  if (ec) {
    return std::nullopt;
  }
  return asio::ip::udp::endpoint(address, port);
}

std::string FormatEndpoint(const asio::ip::udp::endpoint& endpoint) {
  const auto address = NormalizeAddress(endpoint.address());
  if (address.is_v6()) {
    return "[" + address.to_string() + "]:" + std::to_string(endpoint.port());
  }
  return address.to_string() + ":" + std::to_string(endpoint.port());
}

}  // namespace util
}  // namespace kadcast
