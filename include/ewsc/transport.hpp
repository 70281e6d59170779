#ifndef EWSC_TRANSPORT_HPP_
#define EWSC_TRANSPORT_HPP_

#include "tls.hpp"
#include "uri.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>

namespace ewsc {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = true;      // Disable Nagle algorithm
  bool so_keepalive = false;    // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;    // Seconds before first keepalive probe
  int keepalive_interval_s = 10;  // Seconds between probes
  int keepalive_count = 5;      // Max probes before dropping connection
};

// ============================================================================
// Transport - byte stream the handshake runs over
// ============================================================================

class Transport {
 public:
  virtual ~Transport() = default;

  // Returns bytes written (may be short), kTransport or kTimeout.
  virtual Result<size_t> write(const uint8_t* data, size_t len) = 0;

  // Returns bytes read; 0 means the peer closed the stream.
  virtual Result<size_t> read(uint8_t* buf, size_t len) = 0;

  // Bound every subsequent blocking read/write (0 = no limit).
  virtual Status set_timeout(uint32_t timeout_ms) = 0;

  // Orderly shutdown of an established session.
  virtual void close() = 0;

  // Immediate teardown: no close_notify, RST instead of FIN.
  virtual void abort() = 0;

  virtual bool is_open() const = 0;
};

// Write the whole buffer, looping over short writes.
Status write_all(Transport& transport, std::string_view data);

// ============================================================================
// TcpTransport - plain TCP over sockpp
// ============================================================================

class TcpTransport : public Transport {
 public:
  explicit TcpTransport(sockpp::tcp_socket&& sock);
  ~TcpTransport() override;

  Result<size_t> write(const uint8_t* data, size_t len) override;
  Result<size_t> read(uint8_t* buf, size_t len) override;
  Status set_timeout(uint32_t timeout_ms) override;
  void close() override;
  void abort() override;
  bool is_open() const override { return socket_.is_open(); }

 private:
  sockpp::tcp_socket socket_;
};

#ifdef EWSC_WITH_TLS

// ============================================================================
// TlsTransport - mbedTLS session on top of a connected TCP socket
// ============================================================================

class TlsTransport : public Transport {
 public:
  explicit TlsTransport(sockpp::tcp_socket&& sock);
  ~TlsTransport() override;

  // Run the TLS handshake against `server_name`. Certificate problems and
  // handshake failures are kTransport.
  Status start(const TlsConfig& config, const std::string& server_name,
               uint32_t timeout_ms);

  Result<size_t> write(const uint8_t* data, size_t len) override;
  Result<size_t> read(uint8_t* buf, size_t len) override;
  Status set_timeout(uint32_t timeout_ms) override;
  void close() override;
  void abort() override;
  bool is_open() const override { return socket_.is_open(); }

 private:
  sockpp::tcp_socket socket_;
  TlsContext context_;
  TlsSession session_;
  bool established_ = false;
};

#endif  // EWSC_WITH_TLS

// ============================================================================
// Connector - opens transports (the seam tests replace)
// ============================================================================

struct TransportOptions {
  uint32_t timeout_ms = 5000;   // connect + TLS negotiation bound
  TcpTuning tcp_tuning;
};

class Connector {
 public:
  virtual ~Connector() = default;

  // Open a transport to the endpoint; `tls` is null for plain TCP.
  virtual Result<std::unique_ptr<Transport>> open(
      const Endpoint& endpoint, const TlsConfig* tls,
      const TransportOptions& options) = 0;
};

// Default connector: DNS + TCP via sockpp, TLS via mbedTLS.
class SocketConnector : public Connector {
 public:
  SocketConnector();

  Result<std::unique_ptr<Transport>> open(const Endpoint& endpoint,
                                          const TlsConfig* tls,
                                          const TransportOptions& options) override;

 private:
  static void apply_tcp_tuning(int fd, const TcpTuning& tuning);
};

}  // namespace ewsc

#endif  // EWSC_TRANSPORT_HPP_
