#include "ewsc.hpp"

#include <cstring>

#include <arpa/inet.h>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <functional>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace ewsc;

// ============================================================================
// Minimal handshake server (raw POSIX socket, one connection)
// ============================================================================

class TestServer {
 public:
  // Returns the bytes to answer with; empty means stay silent.
  using Responder = std::function<std::string(const std::string& request)>;

  // With `read_head` false the server answers after its first read instead of
  // waiting for a complete HTTP head (TLS records have none).
  explicit TestServer(Responder responder, bool read_head = true)
      : responder_(std::move(responder)), read_head_(read_head) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    set_recv_timeout(listen_fd_, 3000);

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");
    ::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    ::listen(listen_fd_, 1);

    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this]() { serve(); });
  }

  ~TestServer() {
    wait();
    if (listen_fd_ >= 0) ::close(listen_fd_);
  }

  void wait() {
    if (thread_.joinable()) thread_.join();
  }

  uint16_t port() const { return port_; }
  std::string uri(const std::string& path = "/") const {
    return "ws://127.0.0.1:" + std::to_string(port_) + path;
  }
  std::string secure_uri(const std::string& path = "/") const {
    return "wss://127.0.0.1:" + std::to_string(port_) + path;
  }

  // Valid after wait()
  std::string request;
  bool peer_closed = false;

 private:
  static void set_recv_timeout(int fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }

  void serve() {
    int fd = ::accept(listen_fd_, nullptr, nullptr);
    if (fd < 0) return;
    set_recv_timeout(fd, 3000);

    char buf[1024];
    while (request.find("\r\n\r\n") == std::string::npos) {
      ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) break;
      request.append(buf, static_cast<size_t>(n));
      if (!read_head_) break;
    }

    std::string response = responder_(request);
    if (!response.empty()) {
      ::send(fd, response.data(), response.size(), MSG_NOSIGNAL);
    }

    // Wait for the client to hang up (close, reset or timeout teardown).
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    peer_closed = n <= 0;
    ::close(fd);
  }

  Responder responder_;
  bool read_head_ = true;
  int listen_fd_ = -1;
  uint16_t port_ = 0;
  std::thread thread_;
};

namespace {

std::string header_value(const std::string& request, const std::string& name) {
  size_t pos = request.find("\r\n" + name + ": ");
  if (pos == std::string::npos) return {};
  pos += name.size() + 4;
  return request.substr(pos, request.find("\r\n", pos) - pos);
}

std::string accept_response(const std::string& request, const std::string& extra = {}) {
  return "HTTP/1.1 101 Switching Protocols\r\n"
         "Upgrade: websocket\r\n"
         "Connection: Upgrade\r\n"
         "Sec-WebSocket-Accept: " +
         ws::compute_accept_key(header_value(request, "Sec-WebSocket-Key")) + "\r\n" +
         extra + "\r\n";
}

}  // namespace

// ============================================================================
// Tests
// ============================================================================

TEST_CASE("Integration: handshake over TCP", "[integration]") {
  TestServer server([](const std::string& request) {
    return accept_response(request, "Sec-WebSocket-Protocol: chat\r\n");
  });

  {
    Client client;
    client.set_subprotocols({"chat", "superchat"});
    auto conn = client.connect(server.uri("/chat"));
    REQUIRE(conn.has_value());
    REQUIRE(conn.value()->state() == ConnectionState::kOpen);
    REQUIRE(conn.value()->subprotocol().value() == "chat");
    REQUIRE(conn.value()->close().has_value());
  }

  server.wait();
  REQUIRE(server.request.rfind("GET /chat HTTP/1.1\r\n", 0) == 0);
  REQUIRE(header_value(server.request, "Host") ==
          "127.0.0.1:" + std::to_string(server.port()));
  REQUIRE(header_value(server.request, "Sec-WebSocket-Protocol") == "chat, superchat");
  REQUIRE(header_value(server.request, "User-Agent") == kUserAgent);
  REQUIRE(server.peer_closed);
}

TEST_CASE("Integration: rejected handshake closes the socket", "[integration]") {
  TestServer server([](const std::string&) {
    return std::string("HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n");
  });

  Client client;
  auto conn = client.connect(server.uri());
  REQUIRE(!conn.has_value());
  REQUIRE(conn.get_error().code == ErrorCode::kHandshake);
  REQUIRE(conn.get_error().message == "Bad status code: 403");

  server.wait();
  REQUIRE(server.peer_closed);
}

TEST_CASE("Integration: silent server times out", "[integration]") {
  TestServer server([](const std::string&) { return std::string(); });

  Client client;
  client.set_handshake_timeout_ms(200);
  auto start = std::chrono::steady_clock::now();
  auto conn = client.connect(server.uri());
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(!conn.has_value());
  REQUIRE(conn.get_error().code == ErrorCode::kTimeout);
  REQUIRE(elapsed < std::chrono::seconds(2));
  REQUIRE(client.stats().timeouts.load() == 1);

  server.wait();
  REQUIRE(server.peer_closed);
}

TEST_CASE("Integration: connection refused", "[integration]") {
  // Grab a free port, then release it so nothing listens there.
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = inet_addr("127.0.0.1");
  REQUIRE(::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
  uint16_t port = ntohs(addr.sin_port);
  ::close(fd);

  Client client;
  auto conn = client.connect("ws://127.0.0.1:" + std::to_string(port) + "/");
  REQUIRE(!conn.has_value());
  REQUIRE(conn.get_error().code == ErrorCode::kTransport);
}

#ifdef EWSC_WITH_TLS

namespace {

std::string plain_http_reply(const std::string&) {
  return "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\n\r\n";
}

}  // namespace

TEST_CASE("Integration: wss:// against a plain HTTP server", "[integration][tls]") {
  TestServer server(plain_http_reply, false);

  TlsConfig tls;
  tls.verify_peer = false;
  Client client;
  client.set_tls(tls).set_handshake_timeout_ms(2000);
  auto conn = client.connect(server.secure_uri());
  REQUIRE(!conn.has_value());
  REQUIRE(conn.get_error().code == ErrorCode::kTransport);
  REQUIRE(conn.get_error().message == "TLS handshake with 127.0.0.1 failed");
  REQUIRE(client.stats().transport_errors.load() == 1);

  server.wait();
  // A ClientHello went out, never the HTTP upgrade request.
  REQUIRE(!server.request.empty());
  REQUIRE(server.request.find("GET ") == std::string::npos);
  REQUIRE(server.peer_closed);
}

TEST_CASE("Integration: wss:// with default verification fails as transport", "[integration][tls]") {
  TestServer server(plain_http_reply, false);

  Client client;
  client.set_handshake_timeout_ms(2000);
  auto conn = client.connect(server.secure_uri());
  REQUIRE(!conn.has_value());
  REQUIRE(conn.get_error().code == ErrorCode::kTransport);

  server.wait();
  REQUIRE(server.peer_closed);
}

#endif  // EWSC_WITH_TLS
