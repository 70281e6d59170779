#include "ewsc/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>

using namespace ewsc;

// ============================================================================
// Base64 (RFC 4648 section 10 vectors)
// ============================================================================

TEST_CASE("Base64 encode RFC 4648 vectors", "[crypto]") {
  REQUIRE(Base64::encode(nullptr, 0).empty());
  REQUIRE(Base64::encode("f") == "Zg==");
  REQUIRE(Base64::encode("fo") == "Zm8=");
  REQUIRE(Base64::encode("foo") == "Zm9v");
  REQUIRE(Base64::encode("foob") == "Zm9vYg==");
  REQUIRE(Base64::encode("fooba") == "Zm9vYmE=");
  REQUIRE(Base64::encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("Base64 encode sixteen byte nonce", "[crypto]") {
  // RFC 6455 section 4.1 example nonce
  const std::string nonce = "the sample nonce";
  REQUIRE(nonce.size() == 16);
  REQUIRE(Base64::encode(nonce) == "dGhlIHNhbXBsZSBub25jZQ==");
}

TEST_CASE("Base64 decode restores bytes", "[crypto]") {
  auto decoded = Base64::decode("SGVsbG8sIFdlYlNvY2tldCE=");
  REQUIRE(std::string(decoded.begin(), decoded.end()) == "Hello, WebSocket!");
}

TEST_CASE("Base64 decode rejects malformed input", "[crypto]") {
  REQUIRE(Base64::decode("abc").empty());     // not a multiple of 4
  REQUIRE(Base64::decode("ab!d").empty());    // outside the alphabet
  REQUIRE(Base64::decode("a=bc").empty());    // padding in the middle
}

// ============================================================================
// SHA-1 (FIPS 180 vectors)
// ============================================================================

TEST_CASE("SHA1 empty string", "[crypto]") {
  REQUIRE(SHA1::hex_digest("") == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_CASE("SHA1 quick brown fox", "[crypto]") {
  REQUIRE(SHA1::hex_digest("The quick brown fox jumps over the lazy dog") ==
          "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST_CASE("SHA1 abc", "[crypto]") {
  REQUIRE(SHA1::hex_digest("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE("SHA1 two block message", "[crypto]") {
  REQUIRE(SHA1::hex_digest("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
          "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST_CASE("SHA1 incremental update matches one shot", "[crypto]") {
  const std::string part1 = "The quick brown fox ";
  const std::string part2 = "jumps over the lazy dog";
  SHA1 sha1;
  sha1.update(reinterpret_cast<const uint8_t*>(part1.data()), part1.size());
  sha1.update(reinterpret_cast<const uint8_t*>(part2.data()), part2.size());
  REQUIRE(sha1.finalize() == SHA1::compute(part1 + part2));
}

TEST_CASE("SHA1 exactly 64 bytes (one block)", "[crypto]") {
  REQUIRE(SHA1::hex_digest(std::string(64, 'a')) ==
          "0098ba824b5c16427bd7a1122a5a442a25ec644d");
}

// ============================================================================
// Handshake helpers
// ============================================================================

TEST_CASE("Accept key for the RFC 6455 example", "[crypto]") {
  REQUIRE(ws::compute_accept_key("dGhlIHNhbXBsZSBub25jZQ==") ==
          "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("Accept key depends on the key text", "[crypto]") {
  REQUIRE(ws::compute_accept_key("dGhlIHNhbXBsZSBub25jZQ==") !=
          ws::compute_accept_key("AQIDBAUGBwgJCgsMDQ4PEA=="));
}

TEST_CASE("random_bytes fills the buffer", "[crypto]") {
  std::array<uint8_t, 16> a{};
  std::array<uint8_t, 16> b{};
  REQUIRE(random_bytes(a.data(), a.size()));
  REQUIRE(random_bytes(b.data(), b.size()));
  // 2^-128 chance of a false failure
  REQUIRE(a != b);
}

TEST_CASE("random_bytes with zero length", "[crypto]") {
  uint8_t byte = 0x5a;
  REQUIRE(random_bytes(&byte, 0));
  REQUIRE(byte == 0x5a);
}
