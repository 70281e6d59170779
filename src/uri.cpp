#include "ewsc/uri.hpp"

#include <cctype>

namespace ewsc {

namespace {

std::string lowercase(std::string_view in) {
  std::string out(in);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

Result<Endpoint> invalid(std::string_view uri, const char* why) {
  return Result<Endpoint>::error(
      Error(ErrorCode::kInvalidUri, std::string(uri) + " isn't a valid URI", why));
}

}  // namespace

std::string Endpoint::host_header() const {
  std::string out = is_ipv6_literal() ? "[" + host + "]" : host;
  if (port != default_port()) {
    out += ':';
    out += std::to_string(port);
  }
  return out;
}

std::string Endpoint::to_string() const {
  std::string out = secure ? "wss://" : "ws://";
  out += is_ipv6_literal() ? "[" + host + "]" : host;
  out += ':';
  out += std::to_string(port);
  out += resource_name;
  return out;
}

Result<Endpoint> parse_uri(std::string_view uri) {
  for (char c : uri) {
    if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7F) {
      return invalid(uri, "contains whitespace or control characters");
    }
  }

  size_t scheme_end = uri.find("://");
  if (scheme_end == std::string_view::npos) {
    return invalid(uri, "missing scheme");
  }

  Endpoint ep;
  std::string scheme = lowercase(uri.substr(0, scheme_end));
  if (scheme == "ws") {
    ep.secure = false;
  } else if (scheme == "wss") {
    ep.secure = true;
  } else {
    return invalid(uri, "scheme must be ws or wss");
  }

  std::string_view rest = uri.substr(scheme_end + 3);
  if (rest.find('#') != std::string_view::npos) {
    return invalid(uri, "fragments are not allowed");
  }

  size_t authority_end = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, authority_end);
  std::string_view target =
      authority_end == std::string_view::npos ? std::string_view{}
                                              : rest.substr(authority_end);

  if (authority.find('@') != std::string_view::npos) {
    return invalid(uri, "user info is not allowed");
  }

  std::string_view host;
  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string_view::npos) {
      return invalid(uri, "unterminated IPv6 literal");
    }
    host = authority.substr(1, close - 1);
    std::string_view tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') return invalid(uri, "garbage after IPv6 literal");
      port_text = tail.substr(1);
      if (port_text.empty()) return invalid(uri, "empty port");
    }
  } else {
    size_t colon = authority.find(':');
    host = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      port_text = authority.substr(colon + 1);
      if (port_text.empty()) return invalid(uri, "empty port");
    }
  }

  if (host.empty()) {
    return invalid(uri, "missing host");
  }
  ep.host = lowercase(host);

  if (port_text.empty()) {
    ep.port = ep.default_port();
  } else {
    uint32_t port = 0;
    for (char c : port_text) {
      if (c < '0' || c > '9') return invalid(uri, "port is not a number");
      port = port * 10 + static_cast<uint32_t>(c - '0');
      if (port > 65535) return invalid(uri, "port out of range");
    }
    if (port == 0) return invalid(uri, "port out of range");
    ep.port = static_cast<uint16_t>(port);
  }

  size_t query = target.find('?');
  std::string_view path = target.substr(0, query);
  ep.resource_name = path.empty() ? "/" : std::string(path);
  if (query != std::string_view::npos && query + 1 < target.size()) {
    ep.resource_name += '?';
    ep.resource_name.append(target.substr(query + 1));
  }
  return Result<Endpoint>::success(std::move(ep));
}

}  // namespace ewsc
