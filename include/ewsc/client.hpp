#ifndef EWSC_CLIENT_HPP_
#define EWSC_CLIENT_HPP_

#include "connection.hpp"
#include "handshake.hpp"
#include "tls.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ewsc {

// ============================================================================
// Client configuration
// ============================================================================

struct ClientOptions : RequestOptions {
  // Only valid with wss:// URIs. Unset on wss:// means full verification
  // against the system trust store.
  optional<TlsConfig> tls;

  // Bounds the whole attempt: connect, TLS, request and response.
  uint32_t handshake_timeout_ms = 5000;

  TcpTuning tcp_tuning;
};

// ============================================================================
// ClientStats - Atomic counters
// ============================================================================

struct ClientStats {
  std::atomic<uint64_t> attempts{0};
  std::atomic<uint64_t> opened{0};

  // Failures by category
  std::atomic<uint64_t> uri_errors{0};
  std::atomic<uint64_t> configuration_errors{0};
  std::atomic<uint64_t> transport_errors{0};
  std::atomic<uint64_t> handshake_errors{0};
  std::atomic<uint64_t> timeouts{0};

  uint64_t failures() const {
    return uri_errors.load() + configuration_errors.load() + transport_errors.load() +
           handshake_errors.load() + timeouts.load();
  }

  void reset() {
    attempts = 0; opened = 0;
    uri_errors = 0; configuration_errors = 0; transport_errors = 0;
    handshake_errors = 0; timeouts = 0;
  }
};

// ============================================================================
// Client - runs the opening handshake and hands out OPEN connections
// ============================================================================

class Client {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  Client();
  explicit Client(ClientOptions options);

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // Resolve, connect, handshake. Returns an OPEN connection or the first
  // error; on error nothing stays open.
  Result<ConnPtr> connect(std::string_view uri);

  // Configuration
  Client& set_origin(std::string origin) {
    options_.origin = std::move(origin);
    return *this;
  }

  Client& set_extensions(std::vector<std::string> extensions) {
    options_.extensions = std::move(extensions);
    return *this;
  }

  Client& set_subprotocols(std::vector<std::string> subprotocols) {
    options_.subprotocols = std::move(subprotocols);
    return *this;
  }

  Client& set_extra_headers(ExtraHeaders headers) {
    options_.extra_headers = std::move(headers);
    return *this;
  }

  Client& set_user_agent(std::string user_agent) {
    options_.user_agent = std::move(user_agent);
    return *this;
  }

  Client& set_tls(TlsConfig tls) {
    options_.tls = std::move(tls);
    return *this;
  }

  Client& set_handshake_timeout_ms(uint32_t timeout) {
    options_.handshake_timeout_ms = timeout;
    return *this;
  }

  Client& set_tcp_tuning(const TcpTuning& tuning) {
    options_.tcp_tuning = tuning;
    return *this;
  }

  Client& set_connector(std::shared_ptr<Connector> connector) {
    connector_ = std::move(connector);
    return *this;
  }

  Client& set_frame_engine(std::shared_ptr<FrameEngine> engine) {
    engine_ = std::move(engine);
    return *this;
  }

  const ClientOptions& options() const { return options_; }

  // Callbacks
  std::function<void(const ConnPtr&)> on_open;
  std::function<void(std::string_view uri, const Error&)> on_error;

  // Statistics
  const ClientStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  Error record_failure(std::string_view uri, Error error);

  ClientOptions options_;
  std::shared_ptr<Connector> connector_;
  std::shared_ptr<FrameEngine> engine_;
  ClientStats stats_;
};

// One-shot connect with the default connector.
Result<std::shared_ptr<Connection>> connect(std::string_view uri,
                                            const ClientOptions& options = ClientOptions());

}  // namespace ewsc

#endif  // EWSC_CLIENT_HPP_
