#ifndef EWSC_TLS_HPP_
#define EWSC_TLS_HPP_

// ============================================================================
// TLS Configuration and Abstraction Layer
// ============================================================================
//
// Optional TLS support via mbedTLS. Enable with CMake option EWSC_WITH_TLS=ON.
// When disabled, wss:// endpoints are rejected with kConfiguration.
//
// Usage:
//   ewsc::TlsConfig tls;
//   tls.ca_path = "/path/to/ca.pem";   // default: system trust store
//   client.set_tls(tls);
//

#include "uri.hpp"
#include "vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <string>

#ifdef EWSC_WITH_TLS

#include <sys/stat.h>

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/error.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>

#endif  // EWSC_WITH_TLS

namespace ewsc {

// ============================================================================
// TLS Configuration
// ============================================================================

struct TlsConfig {
  static constexpr const char* kSystemCaPath = "/etc/ssl/certs";

  std::string ca_path;            // CA file or directory (empty: system store)
  std::string cert_path;          // Client certificate (PEM, optional)
  std::string key_path;           // Client private key (PEM, optional)
  std::string server_name;        // SNI / verified name (empty: endpoint host)

  // Full certificate verification unless explicitly disabled.
  bool verify_peer = true;

  int min_tls_version = 0;        // 0 = TLS 1.2 minimum, 3 = TLS 1.3
};

// Decide the TLS settings for an endpoint:
//   wss:// without a config -> default TlsConfig (verification on)
//   wss:// with half a client certificate -> kConfiguration
//   ws://  with a config    -> kConfiguration
//   ws://  without          -> no TLS
inline Result<optional<TlsConfig>> resolve_tls_policy(
    const Endpoint& endpoint, const optional<TlsConfig>& supplied) {
  using R = Result<optional<TlsConfig>>;
  if (endpoint.secure) {
    if (!supplied.has_value()) return R::success(optional<TlsConfig>(TlsConfig{}));
    const TlsConfig& config = supplied.value();
    if (config.cert_path.empty() != config.key_path.empty()) {
      return R::error(Error(ErrorCode::kConfiguration,
                            "Client certificate and key must be set together",
                            config.cert_path.empty() ? "key_path without cert_path"
                                                     : "cert_path without key_path"));
    }
    return R::success(supplied);
  }
  if (supplied.has_value()) {
    return R::error(Error(ErrorCode::kConfiguration,
                          "connect() received a TLS configuration for a ws:// URI",
                          "use a wss:// URI to enable TLS"));
  }
  return R::success(optional<TlsConfig>());
}

#ifdef EWSC_WITH_TLS

inline std::string tls_error_string(int code) {
  char buf[160];
  mbedtls_strerror(code, buf, sizeof(buf));
  return buf;
}

// ============================================================================
// TLS Context (one per connection attempt, manages trust anchors and config)
// ============================================================================

class TlsContext {
 public:
  TlsContext() {
    mbedtls_ssl_config_init(&conf_);
    mbedtls_x509_crt_init(&ca_chain_);
    mbedtls_x509_crt_init(&own_cert_);
    mbedtls_pk_init(&own_key_);
    mbedtls_entropy_init(&entropy_);
    mbedtls_ctr_drbg_init(&ctr_drbg_);
  }

  ~TlsContext() {
    mbedtls_ssl_config_free(&conf_);
    mbedtls_x509_crt_free(&ca_chain_);
    mbedtls_x509_crt_free(&own_cert_);
    mbedtls_pk_free(&own_key_);
    mbedtls_entropy_free(&entropy_);
    mbedtls_ctr_drbg_free(&ctr_drbg_);
  }

  // Non-copyable
  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  // Initialize client-side TLS context with config
  // Returns 0 on success, mbedtls error code on failure
  int init(const TlsConfig& config) {
    const char* pers = "ewsc_tls";

    int ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func,
                                    &entropy_,
                                    reinterpret_cast<const unsigned char*>(pers),
                                    std::strlen(pers));
    if (ret != 0) return ret;

    ret = mbedtls_ssl_config_defaults(&conf_,
                                      MBEDTLS_SSL_IS_CLIENT,
                                      MBEDTLS_SSL_TRANSPORT_STREAM,
                                      MBEDTLS_SSL_PRESET_DEFAULT);
    if (ret != 0) return ret;

    mbedtls_ssl_conf_rng(&conf_, mbedtls_ctr_drbg_random, &ctr_drbg_);

    if (config.verify_peer) {
      ret = load_trust_anchors(config.ca_path.empty() ? TlsConfig::kSystemCaPath
                                                      : config.ca_path);
      if (ret != 0) return ret;
      mbedtls_ssl_conf_ca_chain(&conf_, &ca_chain_, nullptr);
      mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_REQUIRED);
    } else {
      mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_NONE);
    }

    // Client certificate (mutual TLS)
    if (!config.cert_path.empty()) {
      ret = mbedtls_x509_crt_parse_file(&own_cert_, config.cert_path.c_str());
      if (ret != 0) return ret;
      ret = mbedtls_pk_parse_keyfile(&own_key_, config.key_path.c_str(),
                                     nullptr, mbedtls_ctr_drbg_random,
                                     &ctr_drbg_);
      if (ret != 0) return ret;
      ret = mbedtls_ssl_conf_own_cert(&conf_, &own_cert_, &own_key_);
      if (ret != 0) return ret;
    }

    mbedtls_ssl_conf_min_tls_version(&conf_, config.min_tls_version >= 3
                                                 ? MBEDTLS_SSL_VERSION_TLS1_3
                                                 : MBEDTLS_SSL_VERSION_TLS1_2);

    return 0;
  }

  void set_read_timeout(uint32_t timeout_ms) {
    mbedtls_ssl_conf_read_timeout(&conf_, timeout_ms);
  }

  const mbedtls_ssl_config* config() const { return &conf_; }

 private:
  int load_trust_anchors(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
      // Positive return: number of certificates that failed to parse
      int ret = mbedtls_x509_crt_parse_path(&ca_chain_, path.c_str());
      return ret < 0 ? ret : 0;
    }
    return mbedtls_x509_crt_parse_file(&ca_chain_, path.c_str());
  }

  mbedtls_ssl_config conf_;
  mbedtls_x509_crt ca_chain_;
  mbedtls_x509_crt own_cert_;
  mbedtls_pk_context own_key_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
};

// ============================================================================
// TLS Session (one per connection)
// ============================================================================

class TlsSession {
 public:
  TlsSession() {
    mbedtls_ssl_init(&ssl_);
    mbedtls_net_init(&net_);
  }

  ~TlsSession() {
    mbedtls_ssl_free(&ssl_);
    // The descriptor belongs to the socket object; keep mbedtls from closing it.
    net_.fd = -1;
    mbedtls_net_free(&net_);
  }

  // Non-copyable
  TlsSession(const TlsSession&) = delete;
  TlsSession& operator=(const TlsSession&) = delete;

  // Setup session with context, socket fd and the name to verify
  int setup(const TlsContext& ctx, int fd, const std::string& hostname) {
    int ret = mbedtls_ssl_setup(&ssl_, ctx.config());
    if (ret != 0) return ret;

    ret = mbedtls_ssl_set_hostname(&ssl_, hostname.c_str());
    if (ret != 0) return ret;

    net_.fd = fd;
    mbedtls_ssl_set_bio(&ssl_, &net_, mbedtls_net_send, mbedtls_net_recv,
                        mbedtls_net_recv_timeout);
    return 0;
  }

  // Perform TLS handshake (blocking socket)
  int handshake() {
    int ret;
    do {
      ret = mbedtls_ssl_handshake(&ssl_);
    } while (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE);
    return ret;
  }

  uint32_t verify_result() const { return mbedtls_ssl_get_verify_result(&ssl_); }

  // Read decrypted data
  int read(uint8_t* buf, size_t len) {
    return mbedtls_ssl_read(&ssl_, buf, len);
  }

  // Write data (encrypted)
  int write(const uint8_t* buf, size_t len) {
    return mbedtls_ssl_write(&ssl_, buf, len);
  }

  // Close TLS session
  int close_notify() {
    return mbedtls_ssl_close_notify(&ssl_);
  }

 private:
  mbedtls_ssl_context ssl_;
  mbedtls_net_context net_;
};

#endif  // EWSC_WITH_TLS

}  // namespace ewsc

#endif  // EWSC_TLS_HPP_
