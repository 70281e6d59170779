#ifndef EWSC_CONNECTION_HPP_
#define EWSC_CONNECTION_HPP_

#include "handshake.hpp"
#include "transport.hpp"
#include "uri.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ewsc {

// ============================================================================
// Connection state (function-pointer state machine, no virtual)
// ============================================================================

enum class ConnectionState : uint8_t {
  kConnecting,  // Opening handshake in progress
  kOpen,        // Handshake validated, messages may flow
  kClosed       // Terminal
};

inline const char* to_string(ConnectionState state) noexcept {
  switch (state) {
    case ConnectionState::kConnecting: return "CONNECTING";
    case ConnectionState::kOpen: return "OPEN";
    case ConnectionState::kClosed: return "CLOSED";
  }
  return "UNKNOWN";
}

struct Message {
  std::string payload;
  bool binary = false;
};

class Connection;  // Forward declaration

// ============================================================================
// FrameEngine - message protocol of an OPEN connection
// ============================================================================

/**
 * @brief Frame-level protocol plugged into a connection after the opening
 *        handshake (framing, masking, ping/pong, close frames).
 *
 * start() is called exactly once, after the connection is OPEN. Bytes that
 * arrived behind the handshake response are in Connection::leftover().
 */
class FrameEngine {
 public:
  virtual ~FrameEngine() = default;

  virtual void start(Connection& conn) = 0;
  virtual Status send(Connection& conn, std::string_view payload, bool binary) = 0;
  virtual Result<Message> receive(Connection& conn) = 0;
  virtual Status close(Connection& conn, uint16_t code) = 0;

  // Tear down a connection whose handshake failed.
  virtual void force_close(Transport& transport) { transport.abort(); }
};

// State handler function signatures
using StateSendHandler = Status (*)(Connection& conn, std::string_view payload, bool binary);
using StateReceiveHandler = Result<Message> (*)(Connection& conn);
using StateCloseHandler = Status (*)(Connection& conn, uint16_t code);

// Function pointer table
struct StateOps {
  ConnectionState state;
  StateSendHandler on_send;
  StateReceiveHandler on_receive;
  StateCloseHandler on_close;
};

// ============================================================================
// Connection - handle returned by Client::connect
// ============================================================================

class Connection : public std::enable_shared_from_this<Connection> {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- User API ---

  Status send(std::string_view payload) { return ops_->on_send(*this, payload, false); }
  Status send_binary(std::string_view payload) { return ops_->on_send(*this, payload, true); }
  Result<Message> receive() { return ops_->on_receive(*this); }
  Status close(uint16_t code = 1000) { return ops_->on_close(*this, code); }

  // --- Getters ---

  ConnectionState state() const { return ops_->state; }
  bool is_open() const { return ops_->state == ConnectionState::kOpen; }
  uint64_t id() const { return id_; }

  const Endpoint& endpoint() const { return endpoint_; }
  const std::vector<std::string>& extensions() const { return result_.extensions; }
  const optional<std::string>& subprotocol() const { return result_.subprotocol; }
  const HeaderSet& request_headers() const { return request_headers_; }
  const HeaderSet& response_headers() const { return result_.response_headers; }
  int status_code() const { return result_.status_code; }

  // Bytes received after the handshake response (start of the frame stream).
  const std::string& leftover() const { return leftover_; }
  std::string take_leftover() { return std::move(leftover_); }

  Transport& transport() { return *transport_; }

  // Enter CLOSED without touching the transport. Used by frame engines once
  // the closing handshake is done or the peer went away. No-op when CLOSED.
  void mark_closed();

 private:
  friend class Client;

  // Created by Client::connect only; starts in CONNECTING, owning the transport.
  Connection(Endpoint endpoint, std::unique_ptr<Transport> transport);

  // Forward-only: CONNECTING->OPEN, CONNECTING->CLOSED, OPEN->CLOSED.
  // Anything else is kInvalidState and leaves the state unchanged.
  Status transition_to_state(ConnectionState next);

  // Store the validated handshake and enter OPEN.
  Status complete_handshake(HandshakeResult result, std::string leftover);

  // Drop the transport without a closing handshake and enter CLOSED.
  void force_close();

  void set_request_headers(HeaderSet headers) { request_headers_ = std::move(headers); }
  void attach_engine(std::shared_ptr<FrameEngine> engine) { engine_ = std::move(engine); }

  static Status connecting_on_send(Connection& conn, std::string_view payload, bool binary);
  static Result<Message> connecting_on_receive(Connection& conn);
  static Status connecting_on_close(Connection& conn, uint16_t code);
  static Status open_on_send(Connection& conn, std::string_view payload, bool binary);
  static Result<Message> open_on_receive(Connection& conn);
  static Status open_on_close(Connection& conn, uint16_t code);
  static Status closed_on_send(Connection& conn, std::string_view payload, bool binary);
  static Result<Message> closed_on_receive(Connection& conn);
  static Status closed_on_close(Connection& conn, uint16_t code);

  static const StateOps kConnectingOps;
  static const StateOps kOpenOps;
  static const StateOps kClosedOps;

  uint64_t id_;
  Endpoint endpoint_;
  std::unique_ptr<Transport> transport_;
  std::shared_ptr<FrameEngine> engine_;
  const StateOps* ops_ = &kConnectingOps;

  HeaderSet request_headers_;
  HandshakeResult result_;
  std::string leftover_;
};

}  // namespace ewsc

#endif  // EWSC_CONNECTION_HPP_
