#include "ewsc/handshake.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <string>
#include <vector>

using namespace ewsc;

namespace {

const std::array<uint8_t, ws::kKeyBytes> kSampleNonce = {'t', 'h', 'e', ' ', 's', 'a', 'm', 'p',
                                                         'l', 'e', ' ', 'n', 'o', 'n', 'c', 'e'};

// RFC 6455 section 1.3 example exchange
constexpr const char* kSampleAccept = "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=";

HeaderSet upgrade_headers(const std::string& accept = kSampleAccept) {
  return HeaderSet{{"Upgrade", "websocket"},
                   {"Connection", "Upgrade"},
                   {"Sec-WebSocket-Accept", accept}};
}

Result<HandshakeResult> validate(int status, const HeaderSet& headers,
                                 const std::vector<std::string>& extensions = {},
                                 const std::vector<std::string>& subprotocols = {}) {
  return validate_response(status, headers, HandshakeKey::from_bytes(kSampleNonce),
                           extensions, subprotocols);
}

}  // namespace

TEST_CASE("validate_response - accepts a conforming response", "[validator]") {
  auto result = validate(101, upgrade_headers());
  REQUIRE(result.has_value());
  REQUIRE(result.value().status_code == 101);
  REQUIRE(result.value().extensions.empty());
  REQUIRE(!result.value().subprotocol.has_value());
  REQUIRE(result.value().response_headers.size() == 3);
}

TEST_CASE("validate_response - status must be 101", "[validator]") {
  auto ok_status = validate(200, upgrade_headers());
  REQUIRE(!ok_status.has_value());
  REQUIRE(ok_status.get_error().code == ErrorCode::kHandshake);
  REQUIRE(ok_status.get_error().message == "Bad status code: 200");

  auto not_found = validate(404, HeaderSet{});
  REQUIRE(not_found.get_error().message == "Bad status code: 404");
}

TEST_CASE("validate_response - header names and values are case-insensitive", "[validator]") {
  HeaderSet headers = {{"upgrade", "WebSocket"},
                       {"CONNECTION", "keep-alive, UPGRADE"},
                       {"sec-websocket-accept", kSampleAccept}};
  REQUIRE(validate(101, headers).has_value());
}

TEST_CASE("validate_response - invalid challenge response", "[validator]") {
  SECTION("wrong accept value") {
    auto r = validate(101, upgrade_headers("dGhlIHNhbXBsZSBub25jZQ=="));
    REQUIRE(r.get_error().message == "Invalid challenge response");
  }
  SECTION("accept computed over the raw key bytes") {
    // base64(SHA1(raw nonce + GUID)) is not the RFC value
    std::string raw(reinterpret_cast<const char*>(kSampleNonce), 16);
    auto digest = SHA1::compute(raw + std::string(ws::kAcceptGuid));
    auto r = validate(101, upgrade_headers(Base64::encode(digest.data(), digest.size())));
    REQUIRE(r.get_error().message == "Invalid challenge response");
  }
  SECTION("SHA-1 of the key without the GUID") {
    auto digest = SHA1::compute("dGhlIHNhbXBsZSBub25jZQ==");
    auto r = validate(101, upgrade_headers(Base64::encode(digest.data(), digest.size())));
    REQUIRE(r.get_error().message == "Invalid challenge response");
  }
  SECTION("accept computed from a different key") {
    auto r = validate(101, upgrade_headers(ws::compute_accept_key("AQIDBAUGBwgJCgsMDQ4PEA==")));
    REQUIRE(r.get_error().message == "Invalid challenge response");
  }
  SECTION("missing accept") {
    HeaderSet headers = {{"Upgrade", "websocket"}, {"Connection", "Upgrade"}};
    REQUIRE(validate(101, headers).get_error().message == "Invalid challenge response");
  }
  SECTION("missing upgrade") {
    HeaderSet headers = {{"Connection", "Upgrade"}, {"Sec-WebSocket-Accept", kSampleAccept}};
    REQUIRE(validate(101, headers).get_error().message == "Invalid challenge response");
  }
  SECTION("wrong upgrade") {
    HeaderSet headers = {{"Upgrade", "h2c"},
                         {"Connection", "Upgrade"},
                         {"Sec-WebSocket-Accept", kSampleAccept}};
    REQUIRE(validate(101, headers).get_error().message == "Invalid challenge response");
  }
  SECTION("connection without upgrade token") {
    HeaderSet headers = {{"Upgrade", "websocket"},
                         {"Connection", "keep-alive"},
                         {"Sec-WebSocket-Accept", kSampleAccept}};
    auto r = validate(101, headers);
    REQUIRE(r.get_error().code == ErrorCode::kHandshake);
    REQUIRE(r.get_error().message == "Invalid challenge response");
  }
}

TEST_CASE("validate_response - status is checked before the challenge", "[validator]") {
  auto r = validate(403, HeaderSet{{"Upgrade", "nope"}});
  REQUIRE(r.get_error().message == "Bad status code: 403");
}

TEST_CASE("validate_response - offered extensions are accepted", "[validator]") {
  HeaderSet headers = upgrade_headers();
  headers.push_back({"Sec-WebSocket-Extensions", "x-b, x-a"});
  auto r = validate(101, headers, {"x-a", "x-b"});
  REQUIRE(r.has_value());
  REQUIRE(r.value().extensions == std::vector<std::string>{"x-b", "x-a"});
}

TEST_CASE("validate_response - repeated extension headers are combined", "[validator]") {
  HeaderSet headers = upgrade_headers();
  headers.push_back({"Sec-WebSocket-Extensions", "x-a"});
  headers.push_back({"Sec-WebSocket-Extensions", "x-b"});
  auto r = validate(101, headers, {"x-a", "x-b"});
  REQUIRE(r.has_value());
  REQUIRE(r.value().extensions.size() == 2);
}

TEST_CASE("validate_response - unknown extension", "[validator]") {
  HeaderSet headers = upgrade_headers();
  headers.push_back({"Sec-WebSocket-Extensions", "x-a, x-evil"});
  auto r = validate(101, headers, {"x-a"});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == ErrorCode::kHandshake);
  REQUIRE(r.get_error().message == "Unknown extension: x-evil");
}

TEST_CASE("validate_response - extension without any offer", "[validator]") {
  HeaderSet headers = upgrade_headers();
  headers.push_back({"Sec-WebSocket-Extensions", "permessage-deflate"});
  auto r = validate(101, headers);
  REQUIRE(r.get_error().message == "Unknown extension: permessage-deflate");
}

TEST_CASE("validate_response - offered subprotocol", "[validator]") {
  HeaderSet headers = upgrade_headers();
  headers.push_back({"Sec-WebSocket-Protocol", "chat"});
  auto r = validate(101, headers, {}, {"chat", "superchat"});
  REQUIRE(r.has_value());
  REQUIRE(r.value().subprotocol.has_value());
  REQUIRE(r.value().subprotocol.value() == "chat");
}

TEST_CASE("validate_response - unknown subprotocol", "[validator]") {
  HeaderSet headers = upgrade_headers();
  headers.push_back({"Sec-WebSocket-Protocol", "otherchat"});
  auto r = validate(101, headers, {}, {"chat", "superchat"});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().message == "Unknown subprotocol: otherchat");
}

TEST_CASE("validate_response - subprotocol match is exact", "[validator]") {
  HeaderSet headers = upgrade_headers();
  headers.push_back({"Sec-WebSocket-Protocol", "Chat"});
  auto r = validate(101, headers, {}, {"chat"});
  REQUIRE(r.get_error().message == "Unknown subprotocol: Chat");
}
