#ifndef EWSC_URI_HPP_
#define EWSC_URI_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>

namespace ewsc {

// ============================================================================
// Endpoint - resolved ws:// or wss:// URI
// ============================================================================

struct Endpoint {
  bool secure = false;
  std::string host;               // lowercase, IPv6 literals without brackets
  uint16_t port = 80;
  std::string resource_name = "/";  // path plus "?query"

  static constexpr uint16_t kDefaultPort = 80;
  static constexpr uint16_t kDefaultSecurePort = 443;

  uint16_t default_port() const {
    return secure ? kDefaultSecurePort : kDefaultPort;
  }

  bool is_ipv6_literal() const {
    return host.find(':') != std::string::npos;
  }

  // Value of the Host request header: the port is omitted when it is the
  // scheme default.
  std::string host_header() const;

  // Canonical "ws://host:port/resource" form, for logs.
  std::string to_string() const;
};

// Parse a WebSocket URI. Rejects other schemes, user info, fragments,
// missing hosts and out-of-range ports with ErrorCode::kInvalidUri.
Result<Endpoint> parse_uri(std::string_view uri);

}  // namespace ewsc

#endif  // EWSC_URI_HPP_
