#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ewsc {

// ============================================================================
// Base64 encoding/decoding (RFC 4648, standard alphabet, padded)
// ============================================================================

class Base64 {
 public:
  static std::string encode(const uint8_t* data, size_t size) {
    static constexpr const char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve((size + 2) / 3 * 4);
    for (size_t i = 0; i < size; i += 3) {
      uint32_t b = static_cast<uint32_t>(data[i]) << 16;
      if (i + 1 < size) b |= static_cast<uint32_t>(data[i + 1]) << 8;
      if (i + 2 < size) b |= static_cast<uint32_t>(data[i + 2]);
      result.push_back(kAlphabet[(b >> 18) & 0x3F]);
      result.push_back(kAlphabet[(b >> 12) & 0x3F]);
      result.push_back(i + 1 < size ? kAlphabet[(b >> 6) & 0x3F] : '=');
      result.push_back(i + 2 < size ? kAlphabet[b & 0x3F] : '=');
    }
    return result;
  }

  static std::string encode(std::string_view text) {
    return encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
  }

  // Returns an empty vector on malformed input.
  static std::vector<uint8_t> decode(std::string_view encoded) {
    std::vector<uint8_t> result;
    if (encoded.size() % 4 != 0) return result;
    result.reserve(encoded.size() / 4 * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
      int v[4];
      size_t pad = 0;
      for (size_t j = 0; j < 4; ++j) {
        char c = encoded[i + j];
        if (c == '=' && i + 4 == encoded.size() && j >= 2) {
          v[j] = 0;
          ++pad;
          continue;
        }
        if (pad > 0) return {};
        v[j] = value_of(c);
        if (v[j] < 0) return {};
      }
      uint32_t b = (static_cast<uint32_t>(v[0]) << 18) |
                   (static_cast<uint32_t>(v[1]) << 12) |
                   (static_cast<uint32_t>(v[2]) << 6) |
                   static_cast<uint32_t>(v[3]);
      result.push_back(static_cast<uint8_t>((b >> 16) & 0xFF));
      if (pad < 2) result.push_back(static_cast<uint8_t>((b >> 8) & 0xFF));
      if (pad < 1) result.push_back(static_cast<uint8_t>(b & 0xFF));
    }
    return result;
  }

 private:
  static int value_of(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
  }
};

// ============================================================================
// SHA-1 hashing (for WebSocket accept key verification)
// ============================================================================

class SHA1 {
 public:
  using Digest = std::array<uint8_t, 20>;

  static Digest compute(const uint8_t* data, size_t size) {
    SHA1 sha1;
    sha1.update(data, size);
    return sha1.finalize();
  }

  static Digest compute(std::string_view text) {
    return compute(reinterpret_cast<const uint8_t*>(text.data()), text.size());
  }

  static std::string hex_digest(std::string_view input) {
    Digest hash = compute(input);
    std::string result;
    result.reserve(40);
    for (auto byte : hash) {
      result += "0123456789abcdef"[byte >> 4];
      result += "0123456789abcdef"[byte & 0x0f];
    }
    return result;
  }

  void update(const uint8_t* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
      block_[fill_++] = data[i];
      if (fill_ == block_.size()) {
        process_block();
        fill_ = 0;
      }
    }
    total_bytes_ += size;
  }

  Digest finalize() {
    const uint64_t total_bits = total_bytes_ * 8;
    block_[fill_++] = 0x80;
    if (fill_ > 56) {
      while (fill_ < 64) block_[fill_++] = 0;
      process_block();
      fill_ = 0;
    }
    while (fill_ < 56) block_[fill_++] = 0;
    for (size_t i = 0; i < 8; ++i) {
      block_[56 + i] = static_cast<uint8_t>(total_bits >> (56 - 8 * i));
    }
    process_block();
    fill_ = 0;

    Digest out;
    for (size_t i = 0; i < state_.size(); ++i) {
      out[i * 4] = static_cast<uint8_t>(state_[i] >> 24);
      out[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
      out[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
      out[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
    }
    return out;
  }

 private:
  std::array<uint32_t, 5> state_ = {0x67452301, 0xEFCDAB89, 0x98BADCFE,
                                    0x10325476, 0xC3D2E1F0};
  std::array<uint8_t, 64> block_{};
  size_t fill_ = 0;
  uint64_t total_bytes_ = 0;

  static uint32_t rol(uint32_t x, int n) { return (x << n) | (x >> (32 - n)); }

  void process_block() {
    std::array<uint32_t, 80> w;
    for (size_t i = 0; i < 16; ++i) {
      w[i] = (static_cast<uint32_t>(block_[i * 4]) << 24) |
             (static_cast<uint32_t>(block_[i * 4 + 1]) << 16) |
             (static_cast<uint32_t>(block_[i * 4 + 2]) << 8) |
             static_cast<uint32_t>(block_[i * 4 + 3]);
    }
    for (size_t i = 16; i < 80; ++i) {
      w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3],
             e = state_[4];
    for (size_t i = 0; i < 80; ++i) {
      uint32_t f, k;
      if (i < 20) {
        f = (b & c) | (~b & d);
        k = 0x5A827999;
      } else if (i < 40) {
        f = b ^ c ^ d;
        k = 0x6ED9EBA1;
      } else if (i < 60) {
        f = (b & c) | (b & d) | (c & d);
        k = 0x8F1BBCDC;
      } else {
        f = b ^ c ^ d;
        k = 0xCA62C1D6;
      }
      uint32_t tmp = rol(a, 5) + f + e + k + w[i];
      e = d;
      d = c;
      c = rol(b, 30);
      b = a;
      a = tmp;
    }
    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
  }
};

// Fill `out` with bytes from the kernel CSPRNG (getrandom, then /dev/urandom).
// Returns false if neither source delivered `len` bytes.
bool random_bytes(uint8_t* out, size_t len);

// ============================================================================
// WebSocket handshake helpers
// ============================================================================

namespace ws {

constexpr std::string_view kAcceptGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr std::string_view kVersion = "13";
constexpr size_t kKeyBytes = 16;

// Sec-WebSocket-Accept value for a Sec-WebSocket-Key (RFC 6455 4.2.2)
inline std::string compute_accept_key(std::string_view client_key) {
  std::string input(client_key);
  input.append(kAcceptGuid.data(), kAcceptGuid.size());
  SHA1::Digest hash = SHA1::compute(input);
  return Base64::encode(hash.data(), hash.size());
}

}  // namespace ws

}  // namespace ewsc
