#include "ewsc/connection.hpp"

#include "ewsc/log.hpp"

#include <atomic>

namespace ewsc {

namespace {

std::atomic<uint64_t> g_next_conn_id{1};

Error not_open(const Connection& conn) {
  return Error(ErrorCode::kInvalidState,
               std::string("Connection is not open (") + to_string(conn.state()) + ")");
}

Error no_engine() {
  return Error(ErrorCode::kInvalidState, "No frame engine attached");
}

Error already_closed() {
  return Error(ErrorCode::kConnectionClosed, "Connection is closed");
}

}  // namespace

// State operation tables
const StateOps Connection::kConnectingOps = {
    ConnectionState::kConnecting,
    Connection::connecting_on_send, Connection::connecting_on_receive,
    Connection::connecting_on_close};
const StateOps Connection::kOpenOps = {
    ConnectionState::kOpen,
    Connection::open_on_send, Connection::open_on_receive, Connection::open_on_close};
const StateOps Connection::kClosedOps = {
    ConnectionState::kClosed,
    Connection::closed_on_send, Connection::closed_on_receive, Connection::closed_on_close};

Connection::Connection(Endpoint endpoint, std::unique_ptr<Transport> transport)
    : id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)),
      endpoint_(std::move(endpoint)),
      transport_(std::move(transport)) {}

Connection::~Connection() {
  if (transport_ && transport_->is_open()) transport_->close();
}

Status Connection::transition_to_state(ConnectionState next) {
  const ConnectionState current = state();
  bool allowed = (current == ConnectionState::kConnecting && next != ConnectionState::kConnecting) ||
                 (current == ConnectionState::kOpen && next == ConnectionState::kClosed);
  if (!allowed) {
    return fail(ErrorCode::kInvalidState,
                std::string("Invalid transition ") + to_string(current) + " -> " + to_string(next));
  }

  switch (next) {
    case ConnectionState::kConnecting:
      ops_ = &kConnectingOps;
      break;
    case ConnectionState::kOpen:
      ops_ = &kOpenOps;
      break;
    case ConnectionState::kClosed:
      ops_ = &kClosedOps;
      break;
  }
  EWSC_LOG_DEBUG("Connection " + std::to_string(id_) + ": " + to_string(current) + " -> " +
                 to_string(next));
  return ok();
}

Status Connection::complete_handshake(HandshakeResult result, std::string leftover) {
  auto moved = transition_to_state(ConnectionState::kOpen);
  if (!moved) return moved;
  result_ = std::move(result);
  leftover_ = std::move(leftover);
  return ok();
}

void Connection::mark_closed() {
  if (state() == ConnectionState::kClosed) return;
  auto moved = transition_to_state(ConnectionState::kClosed);
  EWSC_ASSERT(moved.has_value());
}

void Connection::force_close() {
  if (transport_ && transport_->is_open()) {
    if (engine_) {
      engine_->force_close(*transport_);
    } else {
      transport_->abort();
    }
  }
  ops_ = &kClosedOps;
}

// --- CONNECTING ---

Status Connection::connecting_on_send(Connection& conn, std::string_view, bool) {
  return Status::error(not_open(conn));
}

Result<Message> Connection::connecting_on_receive(Connection& conn) {
  return Result<Message>::error(not_open(conn));
}

Status Connection::connecting_on_close(Connection& conn, uint16_t) {
  return Status::error(not_open(conn));
}

// --- OPEN ---

Status Connection::open_on_send(Connection& conn, std::string_view payload, bool binary) {
  if (!conn.engine_) return Status::error(no_engine());
  return conn.engine_->send(conn, payload, binary);
}

Result<Message> Connection::open_on_receive(Connection& conn) {
  if (!conn.engine_) return Result<Message>::error(no_engine());
  return conn.engine_->receive(conn);
}

Status Connection::open_on_close(Connection& conn, uint16_t code) {
  Status status = ok();
  if (conn.engine_) status = conn.engine_->close(conn, code);
  if (conn.transport_ && conn.transport_->is_open()) conn.transport_->close();
  // The engine may already have moved the connection to CLOSED.
  if (conn.state() != ConnectionState::kClosed) {
    auto moved = conn.transition_to_state(ConnectionState::kClosed);
    if (!moved) return moved;
  }
  return status;
}

// --- CLOSED ---

Status Connection::closed_on_send(Connection&, std::string_view, bool) {
  return Status::error(already_closed());
}

Result<Message> Connection::closed_on_receive(Connection&) {
  return Result<Message>::error(already_closed());
}

Status Connection::closed_on_close(Connection&, uint16_t) {
  return Status::error(already_closed());
}

}  // namespace ewsc
