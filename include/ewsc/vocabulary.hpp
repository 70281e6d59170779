/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types for EWSC: Error, expected, optional, FixedFunction,
 *        ScopeGuard.
 *
 * Derived from newosp vocabulary (iceoryx inspired). Error carries a message
 * and the underlying cause.
 */

#ifndef EWSC_VOCABULARY_HPP_
#define EWSC_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

// Assertion macro for embedded systems (no-op in release)
#ifndef EWSC_ASSERT
#define EWSC_ASSERT(cond) ((void)(cond))
#endif

namespace ewsc {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kConfiguration = 1,     // Caller misuse, detected before any network I/O
  kInvalidUri = 2,        // Malformed ws:// or wss:// URI
  kTransport = 3,         // DNS / TCP / TLS failure
  kHandshake = 4,         // Opening handshake rejected
  kTimeout = 5,           // Handshake deadline expired
  kInvalidState = 6,
  kConnectionClosed = 7,
  kInternalError = 255
};

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kConfiguration: return "configuration error";
    case ErrorCode::kInvalidUri: return "invalid uri";
    case ErrorCode::kTransport: return "transport error";
    case ErrorCode::kHandshake: return "handshake error";
    case ErrorCode::kTimeout: return "timeout";
    case ErrorCode::kInvalidState: return "invalid state";
    case ErrorCode::kConnectionClosed: return "connection closed";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown";
}

/**
 * @brief Error value: category, human readable message and the underlying
 *        cause (e.g. the parser or socket error that triggered it).
 */
struct Error {
  ErrorCode code = ErrorCode::kOk;
  std::string message;
  std::string cause;

  Error() = default;
  Error(ErrorCode c, std::string msg, std::string why = {})
      : code(c), message(std::move(msg)), cause(std::move(why)) {}

  // "<category>: <message> (<cause>)"
  std::string describe() const {
    std::string out = to_string(code);
    if (!message.empty()) {
      out += ": ";
      out += message;
    }
    if (!cause.empty()) {
      out += " (";
      out += cause;
      out += ")";
    }
    return out;
  }
};

// ============================================================================
// expected<V, E> - value or error
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Construct through success() / error(). The value lives in a union so an
 * error result never default-constructs V.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(V val) {
    expected e;
    e.emplace(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) {
    expected e;
    e.err_ = static_cast<E&&>(err);
    return e;
  }

  expected(const expected& other) : err_(other.err_) {
    if (other.has_value_) emplace(other.val_);
  }

  expected(expected&& other) noexcept : err_(static_cast<E&&>(other.err_)) {
    if (other.has_value_) emplace(static_cast<V&&>(other.val_));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      clear();
      err_ = other.err_;
      if (other.has_value_) emplace(other.val_);
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      clear();
      err_ = static_cast<E&&>(other.err_);
      if (other.has_value_) emplace(static_cast<V&&>(other.val_));
    }
    return *this;
  }

  ~expected() { clear(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    EWSC_ASSERT(has_value_);
    return val_;
  }

  const V& value() const& noexcept {
    EWSC_ASSERT(has_value_);
    return val_;
  }

  const E& get_error() const noexcept {
    EWSC_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const { return has_value_ ? val_ : fallback; }

 private:
  expected() noexcept {}

  template <typename U>
  void emplace(U&& val) {
    ::new (static_cast<void*>(&val_)) V(static_cast<U&&>(val));
    has_value_ = true;
  }

  void clear() noexcept {
    if (has_value_) {
      val_.~V();
      has_value_ = false;
    }
  }

  union {
    V val_;
  };
  E err_{};
  bool has_value_ = false;
};

/**
 * @brief Void specialization: success or an error, no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) {
    expected e;
    e.err_ = static_cast<E&&>(err);
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    EWSC_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept = default;

  E err_{};
  bool has_value_ = false;
};

// Shorthands used throughout the client
template <typename V>
using Result = expected<V, Error>;
using Status = expected<void, Error>;

inline Status ok() noexcept { return Status::success(); }

inline Status fail(ErrorCode code, std::string msg, std::string cause = {}) {
  return Status::error(Error(code, std::move(msg), std::move(cause)));
}

// ============================================================================
// optional<T> - nullable value
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept {}

  optional(const T& val) { emplace(val); }  // NOLINT
  optional(T&& val) { emplace(static_cast<T&&>(val)); }  // NOLINT

  optional(const optional& other) {
    if (other.has_value_) emplace(other.val_);
  }

  optional(optional&& other) noexcept {
    if (other.has_value_) emplace(static_cast<T&&>(other.val_));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) emplace(other.val_);
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) emplace(static_cast<T&&>(other.val_));
    }
    return *this;
  }

  ~optional() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    EWSC_ASSERT(has_value_);
    return val_;
  }

  const T& value() const noexcept {
    EWSC_ASSERT(has_value_);
    return val_;
  }

  T value_or(const T& fallback) const { return has_value_ ? val_ : fallback; }

  void reset() noexcept {
    if (has_value_) {
      val_.~T();
      has_value_ = false;
    }
  }

 private:
  template <typename U>
  void emplace(U&& val) {
    ::new (static_cast<void*>(&val_)) T(static_cast<U&&>(val));
    has_value_ = true;
  }

  union {
    T val_;
  };
  bool has_value_ = false;
};

// ============================================================================
// FixedFunction<Sig, BufferSize> - SBO callback
// ============================================================================

template <typename Signature, size_t BufferSize = 2 * sizeof(void*)>
class FixedFunction;

/**
 * @brief Non-allocating move-only callable. The target is stored inline and
 * must fit in BufferSize bytes.
 */
template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  FixedFunction(std::nullptr_t) noexcept {}

  template <typename F,
            typename D = typename std::decay<F>::type,
            typename = typename std::enable_if<
                !std::is_same<D, FixedFunction>::value &&
                !std::is_same<D, std::nullptr_t>::value>::type>
  FixedFunction(F&& f) noexcept {  // NOLINT
    static_assert(sizeof(D) <= BufferSize, "callable does not fit the inline buffer");
    static_assert(alignof(D) <= alignof(std::max_align_t), "over-aligned callable");
    ::new (static_cast<void*>(buf_)) D(static_cast<F&&>(f));
    call_ = &call_target<D>;
    manage_ = &manage_target<D>;
  }

  FixedFunction(FixedFunction&& other) noexcept { take(other); }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      drop();
      take(other);
    }
    return *this;
  }

  ~FixedFunction() { drop(); }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  Ret operator()(Args... args) const {
    EWSC_ASSERT(call_ != nullptr);
    return call_(buf_, static_cast<Args&&>(args)...);
  }

  explicit operator bool() const noexcept { return call_ != nullptr; }

 private:
  // dst == nullptr destroys src; otherwise move-constructs src into dst
  using Manager = void (*)(unsigned char* dst, unsigned char* src);
  using Caller = Ret (*)(const unsigned char*, Args...);

  template <typename D>
  static Ret call_target(const unsigned char* buf, Args... args) {
    return (*const_cast<D*>(reinterpret_cast<const D*>(buf)))(
        static_cast<Args&&>(args)...);
  }

  template <typename D>
  static void manage_target(unsigned char* dst, unsigned char* src) {
    D* from = reinterpret_cast<D*>(src);
    if (dst != nullptr) {
      ::new (static_cast<void*>(dst)) D(static_cast<D&&>(*from));
    }
    from->~D();
  }

  void take(FixedFunction& other) noexcept {
    if (other.manage_ == nullptr) return;
    other.manage_(buf_, other.buf_);
    call_ = other.call_;
    manage_ = other.manage_;
    other.call_ = nullptr;
    other.manage_ = nullptr;
  }

  void drop() noexcept {
    if (manage_ != nullptr) {
      manage_(nullptr, buf_);
      call_ = nullptr;
      manage_ = nullptr;
    }
  }

  alignas(std::max_align_t) unsigned char buf_[BufferSize] = {};
  Caller call_ = nullptr;
  Manager manage_ = nullptr;
};

// ============================================================================
// ScopeGuard - RAII cleanup guard
// ============================================================================

/**
 * @brief Executes a cleanup callback on scope exit unless released.
 *
 * Used by the connect sequence to tear the transport down on every early
 * return; release() is called once the connection is OPEN.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(FixedFunction<void()> cleanup) noexcept
      : cleanup_(static_cast<FixedFunction<void()>&&>(cleanup)) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }
  bool active() const noexcept { return active_; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  FixedFunction<void()> cleanup_;
  bool active_{true};
};

}  // namespace ewsc

#endif  // EWSC_VOCABULARY_HPP_
