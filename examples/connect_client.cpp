// EWSC handshake probe
// Opens a WebSocket connection and prints what the server negotiated.
//
// Usage: ./connect_client <ws-uri> [subprotocol...]
//   EWSC_INSECURE=1 disables certificate verification for wss:// URIs.

#include "ewsc.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <ws-uri> [subprotocol...]" << std::endl;
    return 2;
  }

  const std::string uri = argv[1];
  std::vector<std::string> subprotocols(argv + 2, argv + argc);

  ewsc::Logger::set_level(ewsc::Logger::Level::kDebug);

  ewsc::Client client;
  client.set_subprotocols(subprotocols).set_origin("http://localhost");

  const char* insecure = std::getenv("EWSC_INSECURE");
  if (insecure != nullptr && uri.rfind("wss://", 0) == 0) {
    ewsc::TlsConfig tls;
    tls.verify_peer = false;
    client.set_tls(tls);
  }

  client.on_error = [](std::string_view failed_uri, const ewsc::Error& err) {
    std::cerr << failed_uri << ": " << err.describe() << std::endl;
  };

  auto result = client.connect(uri);
  if (!result) {
    return 1;
  }

  const auto& conn = result.value();
  std::cout << "Connection #" << conn->id() << " " << ewsc::to_string(conn->state())
            << " to " << conn->endpoint().to_string() << std::endl;
  std::cout << "Subprotocol: "
            << (conn->subprotocol().has_value() ? conn->subprotocol().value() : "(none)")
            << std::endl;
  for (const auto& ext : conn->extensions()) {
    std::cout << "Extension: " << ext << std::endl;
  }
  for (const auto& h : conn->response_headers()) {
    std::cout << "  " << h.name << ": " << h.value << std::endl;
  }

  auto closed = conn->close();
  if (!closed) {
    std::cerr << "Close: " << closed.get_error().describe() << std::endl;
    return 1;
  }
  return 0;
}
