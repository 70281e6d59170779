#include "ewsc/handshake.hpp"

#include <algorithm>

namespace ewsc {

namespace {

char to_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Split a comma separated header value, trimming each element.
std::vector<std::string> split_list(std::string_view value) {
  std::vector<std::string> out;
  while (true) {
    size_t comma = value.find(',');
    std::string_view item = trim(value.substr(0, comma));
    if (!item.empty()) out.emplace_back(item);
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return out;
}

std::string join(const std::vector<std::string>& items) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    out += items[i];
  }
  return out;
}

bool is_token_char(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
    return true;
  }
  constexpr std::string_view kSpecials = "!#$%&'*+-.^_`|~";
  return kSpecials.find(c) != std::string_view::npos;
}

bool contains(const std::vector<std::string>& items, std::string_view value) {
  return std::find(items.begin(), items.end(), value) != items.end();
}

}  // namespace

// ============================================================================
// Headers
// ============================================================================

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (to_lower(a[i]) != to_lower(b[i])) return false;
  }
  return true;
}

const Header* find_header(const HeaderSet& headers, std::string_view name) {
  for (const auto& h : headers) {
    if (iequals(h.name, name)) return &h;
  }
  return nullptr;
}

optional<std::string> get_header(const HeaderSet& headers, std::string_view name) {
  optional<std::string> result;
  for (const auto& h : headers) {
    if (!iequals(h.name, name)) continue;
    if (result.has_value()) {
      result.value() += ", ";
      result.value() += h.value;
    } else {
      result = h.value;
    }
  }
  return result;
}

// ============================================================================
// ExtraHeaders
// ============================================================================

ExtraHeaders::ExtraHeaders(const Pairs& pairs) {
  items_.reserve(pairs.size());
  for (const auto& p : pairs) items_.push_back(Header{p.first, p.second});
}

ExtraHeaders::ExtraHeaders(const std::map<std::string, std::string>& mapping) {
  items_.reserve(mapping.size());
  for (const auto& kv : mapping) items_.push_back(Header{kv.first, kv.second});
}

ExtraHeaders::ExtraHeaders(const std::unordered_map<std::string, std::string>& mapping) {
  items_.reserve(mapping.size());
  for (const auto& kv : mapping) items_.push_back(Header{kv.first, kv.second});
  std::sort(items_.begin(), items_.end(),
            [](const Header& a, const Header& b) { return a.name < b.name; });
}

Status ExtraHeaders::validate() const {
  for (const auto& h : items_) {
    if (h.name.empty()) {
      return fail(ErrorCode::kConfiguration, "Invalid extra header", "empty header name");
    }
    if (!std::all_of(h.name.begin(), h.name.end(), is_token_char)) {
      return fail(ErrorCode::kConfiguration, "Invalid extra header: " + h.name,
                  "header name is not an HTTP token");
    }
    if (h.value.find_first_of(std::string_view("\r\n\0", 3)) != std::string::npos) {
      return fail(ErrorCode::kConfiguration, "Invalid extra header: " + h.name,
                  "header value contains CR, LF or NUL");
    }
  }
  return ok();
}

// ============================================================================
// HandshakeKey
// ============================================================================

Result<HandshakeKey> HandshakeKey::generate() {
  HandshakeKey key;
  if (!random_bytes(key.raw.data(), key.raw.size())) {
    return Result<HandshakeKey>::error(Error(ErrorCode::kConfiguration,
                                             "Cannot generate Sec-WebSocket-Key",
                                             "system random source unavailable"));
  }
  key.encoded = Base64::encode(key.raw.data(), key.raw.size());
  return Result<HandshakeKey>::success(std::move(key));
}

HandshakeKey HandshakeKey::from_bytes(const std::array<uint8_t, ws::kKeyBytes>& bytes) {
  HandshakeKey key;
  key.raw = bytes;
  key.encoded = Base64::encode(key.raw.data(), key.raw.size());
  return key;
}

// ============================================================================
// Request builder
// ============================================================================

Result<HandshakeRequest> build_request(const Endpoint& endpoint,
                                       const RequestOptions& options) {
  auto key = HandshakeKey::generate();
  if (!key) return Result<HandshakeRequest>::error(key.get_error());
  return build_request(endpoint, options, std::move(key.value()));
}

Result<HandshakeRequest> build_request(const Endpoint& endpoint,
                                       const RequestOptions& options,
                                       HandshakeKey key) {
  auto valid = options.extra_headers.validate();
  if (!valid) return Result<HandshakeRequest>::error(valid.get_error());

  HandshakeRequest request;
  HeaderSet& headers = request.headers;
  headers.reserve(8 + options.extra_headers.size());

  headers.push_back(Header{"Host", endpoint.host_header()});
  if (options.origin.has_value()) {
    headers.push_back(Header{"Origin", options.origin.value()});
  }
  if (!options.extensions.empty()) {
    headers.push_back(Header{"Sec-WebSocket-Extensions", join(options.extensions)});
  }
  if (!options.subprotocols.empty()) {
    headers.push_back(Header{"Sec-WebSocket-Protocol", join(options.subprotocols)});
  }
  for (const auto& h : options.extra_headers.items()) headers.push_back(h);
  headers.push_back(Header{"User-Agent", options.user_agent});

  headers.push_back(Header{"Upgrade", "websocket"});
  headers.push_back(Header{"Connection", "Upgrade"});
  headers.push_back(Header{"Sec-WebSocket-Key", key.encoded});
  headers.push_back(Header{"Sec-WebSocket-Version", std::string(ws::kVersion)});

  request.key = std::move(key);
  return Result<HandshakeRequest>::success(std::move(request));
}

// ============================================================================
// Response validator
// ============================================================================

Result<HandshakeResult> validate_response(int status_code, const HeaderSet& headers,
                                          const HandshakeKey& key,
                                          const std::vector<std::string>& offered_extensions,
                                          const std::vector<std::string>& offered_subprotocols) {
  using R = Result<HandshakeResult>;

  if (status_code != 101) {
    return R::error(Error(ErrorCode::kHandshake,
                          "Bad status code: " + std::to_string(status_code)));
  }

  // Upgrade, Connection and the accept value are one check: any mismatch
  // (absence included) is the same failure.
  auto upgrade = get_header(headers, "Upgrade");
  auto connection = get_header(headers, "Connection");
  auto accept = get_header(headers, "Sec-WebSocket-Accept");
  std::vector<std::string> connection_tokens;
  if (connection.has_value()) connection_tokens = split_list(connection.value());
  const char* reason = nullptr;
  if (!upgrade.has_value() || !iequals(trim(upgrade.value()), "websocket")) {
    reason = "Upgrade header is not websocket";
  } else if (std::none_of(connection_tokens.begin(), connection_tokens.end(),
                          [](const std::string& t) { return iequals(t, "upgrade"); })) {
    reason = "Connection header lacks the upgrade token";
  } else if (!accept.has_value() || trim(accept.value()) != key.expected_accept()) {
    reason = "Sec-WebSocket-Accept mismatch";
  }
  if (reason != nullptr) {
    return R::error(Error(ErrorCode::kHandshake, "Invalid challenge response", reason));
  }

  HandshakeResult result;
  result.status_code = status_code;
  result.response_headers = headers;

  auto extensions = get_header(headers, "Sec-WebSocket-Extensions");
  if (extensions.has_value()) {
    for (auto& token : split_list(extensions.value())) {
      if (!contains(offered_extensions, token)) {
        return R::error(Error(ErrorCode::kHandshake, "Unknown extension: " + token));
      }
      result.extensions.push_back(std::move(token));
    }
  }

  auto subprotocol = get_header(headers, "Sec-WebSocket-Protocol");
  if (subprotocol.has_value()) {
    std::string token(trim(subprotocol.value()));
    if (!contains(offered_subprotocols, token)) {
      return R::error(Error(ErrorCode::kHandshake, "Unknown subprotocol: " + token));
    }
    result.subprotocol = std::move(token);
  }

  return R::success(std::move(result));
}

}  // namespace ewsc
