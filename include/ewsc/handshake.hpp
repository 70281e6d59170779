#ifndef EWSC_HANDSHAKE_HPP_
#define EWSC_HANDSHAKE_HPP_

#include "uri.hpp"
#include "utils.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <array>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ewsc {

// ============================================================================
// Headers
// ============================================================================

struct Header {
  std::string name;
  std::string value;
};

// Ordered header list; order is transmitted verbatim and duplicates are kept.
using HeaderSet = std::vector<Header>;

// ASCII case-insensitive comparison (header names, tokens).
bool iequals(std::string_view a, std::string_view b);

// First header named `name` (case-insensitive), or nullptr.
const Header* find_header(const HeaderSet& headers, std::string_view name);

// Value of `name`; repeated headers are joined with ", " (RFC 7230 3.2.2).
optional<std::string> get_header(const HeaderSet& headers, std::string_view name);

// ============================================================================
// ExtraHeaders - caller supplied request headers
// ============================================================================

/**
 * @brief Additional request headers, from either a mapping or a sequence of
 *        pairs.
 *
 * A mapping contributes each key once, sorted by key so the request is
 * reproducible. A pair sequence is kept in order, duplicates included.
 */
class ExtraHeaders {
 public:
  using Pairs = std::vector<std::pair<std::string, std::string>>;

  ExtraHeaders() = default;
  ExtraHeaders(std::initializer_list<Header> items) : items_(items) {}  // NOLINT
  ExtraHeaders(const Pairs& pairs);                                     // NOLINT
  ExtraHeaders(const std::map<std::string, std::string>& mapping);      // NOLINT
  ExtraHeaders(const std::unordered_map<std::string, std::string>& mapping);  // NOLINT

  ExtraHeaders& add(std::string name, std::string value) {
    items_.push_back(Header{std::move(name), std::move(value)});
    return *this;
  }

  const HeaderSet& items() const { return items_; }
  bool empty() const { return items_.empty(); }
  size_t size() const { return items_.size(); }

  // kConfiguration if a name is not an RFC 7230 token or a name/value
  // carries CR, LF or NUL (header injection).
  Status validate() const;

 private:
  HeaderSet items_;
};

// ============================================================================
// Handshake key
// ============================================================================

struct HandshakeKey {
  std::array<uint8_t, ws::kKeyBytes> raw{};
  std::string encoded;  // base64(raw), sent as Sec-WebSocket-Key

  // Fresh key from the system random source; kConfiguration if it fails.
  static Result<HandshakeKey> generate();

  // Deterministic key (tests, replay).
  static HandshakeKey from_bytes(const std::array<uint8_t, ws::kKeyBytes>& bytes);

  std::string expected_accept() const { return ws::compute_accept_key(encoded); }
};

// ============================================================================
// Request builder
// ============================================================================

constexpr const char* kUserAgent = "ewsc/1.0";

struct RequestOptions {
  optional<std::string> origin;
  std::vector<std::string> extensions;    // offers, decreasing preference
  std::vector<std::string> subprotocols;  // offers, decreasing preference
  ExtraHeaders extra_headers;
  std::string user_agent = kUserAgent;
};

struct HandshakeRequest {
  HeaderSet headers;
  HandshakeKey key;
};

// Build the opening handshake headers with a fresh key.
Result<HandshakeRequest> build_request(const Endpoint& endpoint,
                                       const RequestOptions& options);

// Same, with a caller-provided key.
Result<HandshakeRequest> build_request(const Endpoint& endpoint,
                                       const RequestOptions& options,
                                       HandshakeKey key);

// ============================================================================
// Response validator
// ============================================================================

struct HandshakeResult {
  std::vector<std::string> extensions;  // negotiated, server order
  optional<std::string> subprotocol;
  HeaderSet response_headers;
  int status_code = 0;
};

/**
 * @brief Check a handshake response against the request that produced it.
 *
 * Checks run in order: status 101, Upgrade/Connection/Sec-WebSocket-Accept,
 * then every negotiated extension and the subprotocol must be one that was
 * offered. The first failing check is reported as kHandshake.
 */
Result<HandshakeResult> validate_response(int status_code, const HeaderSet& headers,
                                          const HandshakeKey& key,
                                          const std::vector<std::string>& offered_extensions,
                                          const std::vector<std::string>& offered_subprotocols);

}  // namespace ewsc

#endif  // EWSC_HANDSHAKE_HPP_
