/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, FixedString, error codes.
 *
 * expected<V, E> is the error channel of every fallible sift operation.
 * The core never throws; callers branch on has_value() and read
 * get_error() for the reason.
 *
 * Usage:
 * @code
 *   sift::expected<uint64_t, sift::FrameError> r = ReadLength();
 *   if (!r) { return r.get_error(); }
 *   uint64_t len = r.value();
 * @endcode
 */

#ifndef SIFT_VOCABULARY_HPP_
#define SIFT_VOCABULARY_HPP_

#include "sift/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace sift {

// ============================================================================
// Error Codes
// ============================================================================

/// Bounded channel failures. Capacity is never a failure reason.
enum class ChannelError : uint8_t {
  kInterrupted = 0,  ///< Blocking call cancelled via Interrupt()
  kClosed,           ///< Channel closed (Put rejected, or Take drained)
  kTimeout,          ///< TakeFor() deadline elapsed
};

/// Frame reader / materializer outcomes.
enum class FrameError : uint8_t {
  kEndOfStream = 0,   ///< Clean end exactly on a frame boundary
  kTruncated,         ///< Stream ended inside a frame
  kMetadataTooLarge,  ///< Declared metadata length above the configured cap
  kSpillFailed,       ///< Temp file could not be created, sized or written
  kIoError,           ///< Read failure from the input stream
  kInterrupted,       ///< Buffer acquisition interrupted
};

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

inline const char* FrameErrorName(FrameError e) noexcept {
  switch (e) {
    case FrameError::kEndOfStream:
      return "end of stream";
    case FrameError::kTruncated:
      return "truncated frame";
    case FrameError::kMetadataTooLarge:
      return "metadata too large";
    case FrameError::kSpillFailed:
      return "spill failed";
    case FrameError::kIoError:
      return "i/o error";
    case FrameError::kInterrupted:
      return "interrupted";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error return type.
 *
 * V may be move-only. Construct through success() / error().
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    SIFT_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    SIFT_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    SIFT_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    SIFT_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const { return has_value_ ? storage_.value : fallback; }

 private:
  struct ErrorTag {};

  explicit expected(const V& v) : has_value_(true) { ::new (&storage_.value) V(v); }
  explicit expected(V&& v) : has_value_(true) { ::new (&storage_.value) V(std::move(v)); }
  expected(ErrorTag, E e) noexcept : has_value_(false) { storage_.err = e; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/// @brief void specialization: success carries no payload.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    SIFT_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

/// @brief Minimal optional for trivially destructible scalars.
template <typename T>
class optional final {
  static_assert(std::is_trivially_destructible<T>::value,
                "sift::optional supports trivially destructible types only");

 public:
  optional() noexcept : value_(), has_value_(false) {}
  optional(const T& v) noexcept : value_(v), has_value_(true) {}  // NOLINT

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const T& value() const noexcept {
    SIFT_ASSERT(has_value_);
    return value_;
  }

  T value_or(const T& fallback) const noexcept { return has_value_ ? value_ : fallback; }

  void reset() noexcept { has_value_ = false; }

 private:
  T value_;
  bool has_value_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Fixed-capacity, null-terminated string stored inline.
 *
 * Used for names (dispatcher, categories) that must not allocate.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  FixedString(const char* s) noexcept { assign(TruncateToCapacity, s); }  // NOLINT

  FixedString(TruncateToCapacity_t, const char* s) noexcept { assign(TruncateToCapacity, s); }

  void assign(TruncateToCapacity_t, const char* s) noexcept {
    size_ = 0;
    if (s != nullptr) {
      while (size_ < Capacity && s[size_] != '\0') {
        buf_[size_] = s[size_];
        ++size_;
      }
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  template <uint32_t N>
  bool operator==(const FixedString<N>& other) const noexcept {
    return size_ == other.size() && std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  bool operator==(const char* s) const noexcept {
    return s != nullptr && std::strlen(s) == size_ && std::memcmp(buf_, s, size_) == 0;
  }

 private:
  char buf_[Capacity + 1];
  uint32_t size_{0};
};

}  // namespace sift

#endif  // SIFT_VOCABULARY_HPP_
