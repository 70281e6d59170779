#include "ewsc/client.hpp"

#include "ewsc/http.hpp"
#include "ewsc/log.hpp"
#include "ewsc/uri.hpp"

namespace ewsc {

Client::Client() : connector_(std::make_shared<SocketConnector>()) {}

Client::Client(ClientOptions options)
    : options_(std::move(options)), connector_(std::make_shared<SocketConnector>()) {}

Error Client::record_failure(std::string_view uri, Error error) {
  switch (error.code) {
    case ErrorCode::kInvalidUri:
      stats_.uri_errors++;
      break;
    case ErrorCode::kConfiguration:
      stats_.configuration_errors++;
      break;
    case ErrorCode::kTimeout:
      stats_.timeouts++;
      break;
    case ErrorCode::kHandshake:
      stats_.handshake_errors++;
      break;
    default:
      stats_.transport_errors++;
      break;
  }
  EWSC_LOG_WARN("Connect to " + std::string(uri) + " failed: " + error.describe());
  if (on_error) on_error(uri, error);
  return error;
}

Result<Client::ConnPtr> Client::connect(std::string_view uri) {
  using R = Result<ConnPtr>;
  stats_.attempts++;
  EWSC_LOG_DEBUG("Connecting to " + std::string(uri));

  // Malformed URIs, TLS misuse and bad extra headers fail before any
  // network activity.
  auto endpoint = parse_uri(uri);
  if (!endpoint) return R::error(record_failure(uri, endpoint.get_error()));

  auto tls = resolve_tls_policy(endpoint.value(), options_.tls);
  if (!tls) return R::error(record_failure(uri, tls.get_error()));

  auto headers_ok = options_.extra_headers.validate();
  if (!headers_ok) return R::error(record_failure(uri, headers_ok.get_error()));

  if (!connector_) {
    return R::error(record_failure(uri, Error(ErrorCode::kConfiguration, "No connector set")));
  }

  const Deadline deadline =
      options_.handshake_timeout_ms > 0
          ? SteadyClock::now() + std::chrono::milliseconds(options_.handshake_timeout_ms)
          : kNoDeadline;

  TransportOptions transport_options;
  transport_options.timeout_ms = options_.handshake_timeout_ms;
  transport_options.tcp_tuning = options_.tcp_tuning;

  const TlsConfig* tls_config = tls.value().has_value() ? &tls.value().value() : nullptr;
  auto transport = connector_->open(endpoint.value(), tls_config, transport_options);
  if (!transport) return R::error(record_failure(uri, transport.get_error()));

  ConnPtr conn(new Connection(endpoint.value(), std::move(transport.value())));
  conn->attach_engine(engine_);

  // Every early return below leaves the connection CLOSED, transport dropped.
  Connection* raw = conn.get();
  ScopeGuard teardown([raw]() { raw->force_close(); });

  auto request = build_request(endpoint.value(), options_);
  if (!request) return R::error(record_failure(uri, request.get_error()));
  conn->set_request_headers(request.value().headers);

  auto sent = send_request(conn->transport(), endpoint.value().resource_name,
                           request.value().headers, deadline);
  if (!sent) return R::error(record_failure(uri, sent.get_error()));

  auto response = receive_response(conn->transport(), deadline);
  if (!response) return R::error(record_failure(uri, response.get_error()));

  auto result = validate_response(response.value().status_code, response.value().headers,
                                  request.value().key, options_.extensions,
                                  options_.subprotocols);
  if (!result) return R::error(record_failure(uri, result.get_error()));

  auto opened = conn->complete_handshake(std::move(result.value()),
                                         std::move(response.value().leftover));
  if (!opened) return R::error(record_failure(uri, opened.get_error()));

  // Restore the transport to blocking without a deadline for the frame stream.
  if (deadline != kNoDeadline) {
    auto cleared = conn->transport().set_timeout(0);
    if (!cleared) return R::error(record_failure(uri, cleared.get_error()));
  }
  teardown.release();

  stats_.opened++;
  EWSC_LOG_INFO("Connected to " + endpoint.value().to_string() +
                (conn->subprotocol().has_value() ? " (" + conn->subprotocol().value() + ")"
                                                 : std::string()));
  if (engine_) engine_->start(*conn);
  if (on_open) on_open(conn);
  return R::success(conn);
}

Result<std::shared_ptr<Connection>> connect(std::string_view uri, const ClientOptions& options) {
  Client client(options);
  return client.connect(uri);
}

}  // namespace ewsc
