#include "ewsc/http.hpp"

#include <algorithm>

namespace ewsc {

namespace {

constexpr size_t kReadChunkSize = 512;
constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeadEnd = "\r\n\r\n";

Error malformed(std::string cause) {
  return Error(ErrorCode::kHandshake, "Malformed HTTP message", std::move(cause));
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

bool is_token_char(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
    return true;
  }
  constexpr std::string_view kSpecials = "!#$%&'*+-.^_`|~";
  return kSpecials.find(c) != std::string_view::npos;
}

// Bound the next blocking call by what is left of the deadline.
Status arm_timeout(Transport& transport, Deadline deadline, const char* what) {
  if (deadline == kNoDeadline) return ok();
  auto now = SteadyClock::now();
  if (now >= deadline) return fail(ErrorCode::kTimeout, what);
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
  return transport.set_timeout(static_cast<uint32_t>(std::max<int64_t>(left, 1)));
}

}  // namespace

std::string serialize_request(std::string_view resource_name, const HeaderSet& headers) {
  std::string out;
  out.reserve(64 + headers.size() * 48);
  out += "GET ";
  out += resource_name;
  out += " HTTP/1.1\r\n";
  for (const auto& h : headers) {
    out += h.name;
    out += ": ";
    out += h.value;
    out += kCrlf;
  }
  out += kCrlf;
  return out;
}

Status send_request(Transport& transport, std::string_view resource_name,
                    const HeaderSet& headers, Deadline deadline) {
  auto armed = arm_timeout(transport, deadline, "Timed out sending the handshake request");
  if (!armed) return armed;
  return write_all(transport, serialize_request(resource_name, headers));
}

// ============================================================================
// HttpResponseReader
// ============================================================================

Result<bool> HttpResponseReader::feed(std::string_view data) {
  if (complete_) {
    response_.leftover.append(data.data(), data.size());
    return Result<bool>::success(true);
  }

  // The terminator may straddle the previous chunk.
  size_t search_from = buffer_.size() >= 3 ? buffer_.size() - 3 : 0;
  buffer_.append(data.data(), data.size());

  size_t end = buffer_.find(kHeadEnd, search_from);
  if (end == std::string::npos) {
    if (buffer_.size() > kMaxHeadSize) {
      return Result<bool>::error(malformed("response head exceeds " +
                                           std::to_string(kMaxHeadSize) + " bytes"));
    }
    size_t last_eol = buffer_.rfind(kCrlf);
    size_t partial = last_eol == std::string::npos ? buffer_.size()
                                                   : buffer_.size() - (last_eol + 2);
    if (partial > kMaxLineLength) {
      return Result<bool>::error(malformed("line too long"));
    }
    return Result<bool>::success(false);
  }

  if (end + kHeadEnd.size() > kMaxHeadSize) {
    return Result<bool>::error(malformed("response head exceeds " +
                                         std::to_string(kMaxHeadSize) + " bytes"));
  }

  auto parsed = parse(std::string_view(buffer_).substr(0, end + kCrlf.size()));
  if (!parsed) return Result<bool>::error(parsed.get_error());

  response_ = std::move(parsed.value());
  response_.leftover = buffer_.substr(end + kHeadEnd.size());
  buffer_.clear();
  complete_ = true;
  return Result<bool>::success(true);
}

Result<HttpResponse> HttpResponseReader::parse(std::string_view head) {
  using R = Result<HttpResponse>;
  HttpResponse response;
  bool status_seen = false;

  while (!head.empty()) {
    size_t eol = head.find(kCrlf);
    if (eol == std::string_view::npos) return R::error(malformed("line without CRLF"));
    std::string_view line = head.substr(0, eol);
    head.remove_prefix(eol + kCrlf.size());

    if (line.size() > kMaxLineLength) return R::error(malformed("line too long"));
    if (line.find_first_of(std::string_view("\r\n\0", 3)) != std::string_view::npos) {
      return R::error(malformed("line without CRLF"));
    }

    if (!status_seen) {
      // HTTP/1.1 SP 3DIGIT [SP reason]
      constexpr std::string_view kVersion = "HTTP/1.1 ";
      if (line.substr(0, kVersion.size()) != kVersion) {
        return R::error(malformed("unsupported HTTP version"));
      }
      std::string_view rest = line.substr(kVersion.size());
      if (rest.size() < 3 || !std::all_of(rest.begin(), rest.begin() + 3,
                                          [](char c) { return c >= '0' && c <= '9'; })) {
        return R::error(malformed("invalid status code"));
      }
      if (rest.size() > 3 && rest[3] != ' ') {
        return R::error(malformed("invalid status code"));
      }
      response.status_code = (rest[0] - '0') * 100 + (rest[1] - '0') * 10 + (rest[2] - '0');
      if (rest.size() > 4) response.reason = std::string(rest.substr(4));
      status_seen = true;
      continue;
    }

    if (line.front() == ' ' || line.front() == '\t') {
      return R::error(malformed("obsolete line folding"));
    }
    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return R::error(malformed("invalid header line"));
    }
    std::string_view name = line.substr(0, colon);
    if (!std::all_of(name.begin(), name.end(), is_token_char)) {
      return R::error(malformed("invalid header name"));
    }
    if (response.headers.size() >= kMaxHeaders) {
      return R::error(malformed("too many headers"));
    }
    response.headers.push_back(
        Header{std::string(name), std::string(trim(line.substr(colon + 1)))});
  }

  if (!status_seen) return R::error(malformed("missing status line"));
  return R::success(std::move(response));
}

Result<HttpResponse> receive_response(Transport& transport, Deadline deadline) {
  using R = Result<HttpResponse>;
  HttpResponseReader reader;
  uint8_t chunk[kReadChunkSize];

  while (true) {
    auto armed = arm_timeout(transport, deadline, "Timed out waiting for the handshake response");
    if (!armed) return R::error(armed.get_error());

    auto n = transport.read(chunk, sizeof(chunk));
    if (!n) return R::error(n.get_error());
    if (n.value() == 0) {
      return R::error(Error(ErrorCode::kTransport, "Connection closed during handshake"));
    }

    auto done = reader.feed(std::string_view(reinterpret_cast<const char*>(chunk), n.value()));
    if (!done) return R::error(done.get_error());
    if (done.value()) return R::success(reader.take());
  }
}

}  // namespace ewsc
