#ifndef EWSC_HTTP_HPP_
#define EWSC_HTTP_HPP_

#include "handshake.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace ewsc {

using SteadyClock = std::chrono::steady_clock;
using Deadline = SteadyClock::time_point;

// No deadline: transport timeouts are left as configured.
constexpr Deadline kNoDeadline = Deadline::max();

struct HttpResponse {
  int status_code = 0;
  std::string reason;
  HeaderSet headers;
  std::string leftover;  // bytes received after the header block
};

// "GET <resource> HTTP/1.1\r\n" + "Name: value\r\n"... + "\r\n"
std::string serialize_request(std::string_view resource_name, const HeaderSet& headers);

// Write the serialized request; kTransport on write failure, kTimeout once
// the deadline has passed.
Status send_request(Transport& transport, std::string_view resource_name,
                    const HeaderSet& headers, Deadline deadline = kNoDeadline);

// ============================================================================
// HttpResponseReader - incremental status line + header parser
// ============================================================================

/**
 * @brief Accumulates bytes until the blank line that ends an HTTP response
 *        head, then parses it.
 *
 * Lines must end with CRLF. Obsolete line folding is rejected. Parse and size
 * failures are kHandshake "Malformed HTTP message" with the detail in cause.
 */
class HttpResponseReader {
 public:
  static constexpr size_t kMaxHeaders = 256;
  static constexpr size_t kMaxLineLength = 4096;
  static constexpr size_t kMaxHeadSize = 64 * 1024;

  // Returns true once the head is complete. Bytes past the head go to
  // response().leftover; feeding a completed reader appends to it.
  Result<bool> feed(std::string_view data);

  bool complete() const { return complete_; }
  const HttpResponse& response() const { return response_; }
  HttpResponse take() { return std::move(response_); }

  // Parse a complete head: status line and header lines, each ending in
  // CRLF, without the terminating blank line.
  static Result<HttpResponse> parse(std::string_view head);

 private:
  std::string buffer_;
  HttpResponse response_;
  bool complete_ = false;
};

// Read and parse the response head. A peer close before the blank line is
// kTransport "Connection closed during handshake".
Result<HttpResponse> receive_response(Transport& transport, Deadline deadline = kNoDeadline);

}  // namespace ewsc

#endif  // EWSC_HTTP_HPP_
