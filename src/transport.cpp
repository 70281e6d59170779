#include "ewsc/transport.hpp"

#include "ewsc/log.hpp"

#include <cerrno>

#include <chrono>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sockpp/inet6_address.h>
#include <sockpp/inet_address.h>
#include <sockpp/tcp6_connector.h>
#include <sockpp/tcp_connector.h>
#include <sys/socket.h>
#include <system_error>

namespace ewsc {

namespace {

bool is_timeout(const std::error_code& ec) {
  return ec == std::errc::resource_unavailable_try_again ||
         ec == std::errc::operation_would_block ||
         ec == std::errc::timed_out;
}

Error socket_error(const std::error_code& ec, const char* what) {
  return Error(is_timeout(ec) ? ErrorCode::kTimeout : ErrorCode::kTransport,
               what, ec.message());
}

std::chrono::microseconds to_micros(uint32_t timeout_ms) {
  return std::chrono::microseconds(static_cast<int64_t>(timeout_ms) * 1000);
}

// Connect with the address family matching the host and hand back the fd.
template <typename ConnectorT, typename AddressT>
Result<int> connect_socket(const Endpoint& endpoint, uint32_t timeout_ms) {
  ConnectorT conn;
  try {
    AddressT addr(endpoint.host, endpoint.port);
    auto res = timeout_ms > 0 ? conn.connect(addr, to_micros(timeout_ms))
                              : conn.connect(addr);
    if (!res) {
      return Result<int>::error(socket_error(
          res.error(), ("Failed to connect to " + endpoint.host_header()).c_str()));
    }
  } catch (const std::exception& e) {
    return Result<int>::error(
        Error(ErrorCode::kTransport, "Failed to resolve " + endpoint.host, e.what()));
  }
  return Result<int>::success(conn.release());
}

}  // namespace

Status write_all(Transport& transport, std::string_view data) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
  size_t offset = 0;
  while (offset < data.size()) {
    auto n = transport.write(bytes + offset, data.size() - offset);
    if (!n) return Status::error(n.get_error());
    if (n.value() == 0) {
      return fail(ErrorCode::kTransport, "Connection closed while writing");
    }
    offset += n.value();
  }
  return ok();
}

// ============================================================================
// TcpTransport
// ============================================================================

TcpTransport::TcpTransport(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {}

TcpTransport::~TcpTransport() {
  if (socket_.is_open()) socket_.close();
}

Result<size_t> TcpTransport::write(const uint8_t* data, size_t len) {
  while (true) {
    auto res = socket_.write(data, len);
    if (res) return Result<size_t>::success(res.value());
    if (res.error() != std::errc::interrupted) {
      return Result<size_t>::error(socket_error(res.error(), "Write error"));
    }
  }
}

Result<size_t> TcpTransport::read(uint8_t* buf, size_t len) {
  while (true) {
    auto res = socket_.read(buf, len);
    if (res) return Result<size_t>::success(res.value());
    if (res.error() != std::errc::interrupted) {
      return Result<size_t>::error(socket_error(res.error(), "Read error"));
    }
  }
}

Status TcpTransport::set_timeout(uint32_t timeout_ms) {
  auto r = socket_.read_timeout(to_micros(timeout_ms));
  if (!r) return Status::error(socket_error(r.error(), "Failed to set read timeout"));
  auto w = socket_.write_timeout(to_micros(timeout_ms));
  if (!w) return Status::error(socket_error(w.error(), "Failed to set write timeout"));
  return ok();
}

void TcpTransport::close() {
  if (!socket_.is_open()) return;
  socket_.shutdown(SHUT_RDWR);
  socket_.close();
}

void TcpTransport::abort() {
  if (!socket_.is_open()) return;
  struct linger lin;
  lin.l_onoff = 1;
  lin.l_linger = 0;
  ::setsockopt(socket_.handle(), SOL_SOCKET, SO_LINGER, &lin, sizeof(lin));
  socket_.close();
}

#ifdef EWSC_WITH_TLS

// ============================================================================
// TlsTransport
// ============================================================================

TlsTransport::TlsTransport(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {}

TlsTransport::~TlsTransport() {
  if (socket_.is_open()) socket_.close();
}

Status TlsTransport::start(const TlsConfig& config, const std::string& server_name,
                           uint32_t timeout_ms) {
  int ret = context_.init(config);
  if (ret != 0) {
    return fail(ErrorCode::kTransport, "TLS configuration failed", tls_error_string(ret));
  }
  context_.set_read_timeout(timeout_ms);

  ret = session_.setup(context_, socket_.handle(), server_name);
  if (ret != 0) {
    return fail(ErrorCode::kTransport, "TLS session setup failed", tls_error_string(ret));
  }

  ret = session_.handshake();
  if (ret == MBEDTLS_ERR_SSL_TIMEOUT) {
    return fail(ErrorCode::kTimeout, "TLS handshake timed out");
  }
  if (ret != 0) {
    std::string cause = tls_error_string(ret);
    if (ret == MBEDTLS_ERR_X509_CERT_VERIFY_FAILED) {
      char info[256];
      mbedtls_x509_crt_verify_info(info, sizeof(info), "", session_.verify_result());
      cause += ": ";
      cause += info;
    }
    return fail(ErrorCode::kTransport, "TLS handshake with " + server_name + " failed", cause);
  }
  established_ = true;
  return ok();
}

Result<size_t> TlsTransport::write(const uint8_t* data, size_t len) {
  while (true) {
    int ret = session_.write(data, len);
    if (ret >= 0) return Result<size_t>::success(static_cast<size_t>(ret));
    if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) continue;
    return Result<size_t>::error(Error(ErrorCode::kTransport, "TLS write error",
                                       tls_error_string(ret)));
  }
}

Result<size_t> TlsTransport::read(uint8_t* buf, size_t len) {
  while (true) {
    int ret = session_.read(buf, len);
    if (ret >= 0) return Result<size_t>::success(static_cast<size_t>(ret));
    switch (ret) {
      case MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY:
        return Result<size_t>::success(0);
      case MBEDTLS_ERR_SSL_WANT_READ:
      case MBEDTLS_ERR_SSL_WANT_WRITE:
#ifdef MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET
      case MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET:
#endif
        continue;
      case MBEDTLS_ERR_SSL_TIMEOUT:
        return Result<size_t>::error(Error(ErrorCode::kTimeout, "TLS read timed out"));
      default:
        return Result<size_t>::error(Error(ErrorCode::kTransport, "TLS read error",
                                           tls_error_string(ret)));
    }
  }
}

Status TlsTransport::set_timeout(uint32_t timeout_ms) {
  context_.set_read_timeout(timeout_ms);
  auto w = socket_.write_timeout(to_micros(timeout_ms));
  if (!w) return Status::error(socket_error(w.error(), "Failed to set write timeout"));
  return ok();
}

void TlsTransport::close() {
  if (!socket_.is_open()) return;
  if (established_) session_.close_notify();
  established_ = false;
  socket_.close();
}

void TlsTransport::abort() {
  if (!socket_.is_open()) return;
  established_ = false;
  struct linger lin;
  lin.l_onoff = 1;
  lin.l_linger = 0;
  ::setsockopt(socket_.handle(), SOL_SOCKET, SO_LINGER, &lin, sizeof(lin));
  socket_.close();
}

#endif  // EWSC_WITH_TLS

// ============================================================================
// SocketConnector
// ============================================================================

SocketConnector::SocketConnector() {
  // Ignores SIGPIPE so a peer reset surfaces as a write error.
  sockpp::initialize();
}

Result<std::unique_ptr<Transport>> SocketConnector::open(
    const Endpoint& endpoint, const TlsConfig* tls, const TransportOptions& options) {
  using R = Result<std::unique_ptr<Transport>>;

#ifndef EWSC_WITH_TLS
  if (tls != nullptr) {
    return R::error(Error(ErrorCode::kConfiguration,
                          "wss:// requires TLS support",
                          "rebuild with EWSC_WITH_TLS=ON"));
  }
#endif

  auto fd = endpoint.is_ipv6_literal()
                ? connect_socket<sockpp::tcp6_connector, sockpp::inet6_address>(
                      endpoint, options.timeout_ms)
                : connect_socket<sockpp::tcp_connector, sockpp::inet_address>(
                      endpoint, options.timeout_ms);
  if (!fd) return R::error(fd.get_error());

  sockpp::tcp_socket sock(fd.value());
  apply_tcp_tuning(sock.handle(), options.tcp_tuning);
  EWSC_LOG_DEBUG("TCP connected to " + endpoint.host_header());

#ifdef EWSC_WITH_TLS
  if (tls != nullptr) {
    auto transport = std::make_unique<TlsTransport>(std::move(sock));
    const std::string& name = tls->server_name.empty() ? endpoint.host : tls->server_name;
    auto started = transport->start(*tls, name, options.timeout_ms);
    if (!started) {
      transport->abort();
      return R::error(started.get_error());
    }
    return R::success(std::unique_ptr<Transport>(std::move(transport)));
  }
#endif

  return R::success(std::unique_ptr<Transport>(std::make_unique<TcpTransport>(std::move(sock))));
}

void SocketConnector::apply_tcp_tuning(int fd, const TcpTuning& tuning) {
  int opt = 1;
  if (tuning.tcp_nodelay)
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  if (tuning.so_keepalive) {
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef TCP_KEEPIDLE
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE,
               &tuning.keepalive_idle_s, sizeof(tuning.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL,
               &tuning.keepalive_interval_s, sizeof(tuning.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT,
               &tuning.keepalive_count, sizeof(tuning.keepalive_count));
#endif
  }
}

}  // namespace ewsc
