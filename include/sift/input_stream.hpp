/**
 * @file input_stream.hpp
 * @brief Byte sources the frame reader consumes.
 *
 * InputStream models a finite, non-rewindable stream. A single Read() may
 * return fewer bytes than requested; 0 means end of stream. ReadUpTo() loops
 * over short reads and is what every consumer in sift uses.
 *
 * Implementations:
 *   - FdInputStream     : POSIX file descriptor (pipe, file, stdin)
 *   - MemoryInputStream : borrowed byte range, optional max chunk per read
 */

#ifndef SIFT_INPUT_STREAM_HPP_
#define SIFT_INPUT_STREAM_HPP_

#include "sift/platform.hpp"
#include "sift/vocabulary.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace sift {

enum class IoError : uint8_t {
  kInvalidFd = 0,
  kOpenFailed,
  kReadFailed,
};

// ============================================================================
// InputStream
// ============================================================================

class InputStream {
 public:
  virtual ~InputStream() = default;

  /**
   * @brief Read up to @p len bytes into @p buf.
   * @return Bytes read (0 at end of stream), or IoError.
   */
  virtual expected<size_t, IoError> Read(uint8_t* buf, size_t len) noexcept = 0;
};

/**
 * @brief Read until @p len bytes arrive or the stream ends.
 * @return Bytes actually read; less than @p len only at end of stream.
 */
inline expected<size_t, IoError> ReadUpTo(InputStream& in, uint8_t* buf, size_t len) noexcept {
  size_t got = 0;
  while (got < len) {
    auto r = in.Read(buf + got, len - got);
    if (!r.has_value()) {
      return r;
    }
    if (r.value() == 0U) {
      break;
    }
    got += r.value();
  }
  return expected<size_t, IoError>::success(got);
}

// ============================================================================
// FdInputStream
// ============================================================================

/**
 * @brief InputStream over a POSIX file descriptor.
 *
 * Move-only. Closes the descriptor on destruction when it owns it.
 */
class FdInputStream final : public InputStream {
 public:
  FdInputStream() noexcept = default;

  /// @param fd    Open descriptor.
  /// @param owned Close @p fd on destruction.
  explicit FdInputStream(int fd, bool owned = false) noexcept : fd_(fd), owned_(owned) {}

  ~FdInputStream() override { Close(); }

  FdInputStream(FdInputStream&& other) noexcept : fd_(other.fd_), owned_(other.owned_) {
    other.fd_ = -1;
    other.owned_ = false;
  }

  FdInputStream& operator=(FdInputStream&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      owned_ = other.owned_;
      other.fd_ = -1;
      other.owned_ = false;
    }
    return *this;
  }

  FdInputStream(const FdInputStream&) = delete;
  FdInputStream& operator=(const FdInputStream&) = delete;

  /// @brief Open @p path read-only and own the descriptor.
  static expected<FdInputStream, IoError> Open(const char* path) noexcept {
    int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      return expected<FdInputStream, IoError>::error(IoError::kOpenFailed);
    }
    return expected<FdInputStream, IoError>::success(FdInputStream(fd, true));
  }

  expected<size_t, IoError> Read(uint8_t* buf, size_t len) noexcept override {
    if (fd_ < 0) {
      return expected<size_t, IoError>::error(IoError::kInvalidFd);
    }
    while (true) {
      ssize_t n = ::read(fd_, buf, len);
      if (n >= 0) {
        return expected<size_t, IoError>::success(static_cast<size_t>(n));
      }
      if (errno != EINTR) {
        return expected<size_t, IoError>::error(IoError::kReadFailed);
      }
    }
  }

  /** @brief Close the descriptor if owned. Idempotent. */
  void Close() noexcept {
    if (owned_ && fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = -1;
    owned_ = false;
  }

  int Fd() const noexcept { return fd_; }

 private:
  int fd_{-1};
  bool owned_{false};
};

// ============================================================================
// MemoryInputStream
// ============================================================================

/**
 * @brief InputStream over a borrowed byte range.
 *
 * @p max_chunk caps each Read() (0 = no cap) to exercise short-read paths.
 */
class MemoryInputStream final : public InputStream {
 public:
  MemoryInputStream(const uint8_t* data, size_t size, size_t max_chunk = 0) noexcept
      : data_(data), size_(size), max_chunk_(max_chunk) {}

  expected<size_t, IoError> Read(uint8_t* buf, size_t len) noexcept override {
    size_t remaining = size_ - offset_;
    size_t n = len < remaining ? len : remaining;
    if (max_chunk_ > 0U && n > max_chunk_) {
      n = max_chunk_;
    }
    if (n > 0U) {
      std::memcpy(buf, data_ + offset_, n);
      offset_ += n;
    }
    return expected<size_t, IoError>::success(n);
  }

  size_t Offset() const noexcept { return offset_; }

 private:
  const uint8_t* data_;
  size_t size_;
  size_t max_chunk_;
  size_t offset_{0};
};

}  // namespace sift

#endif  // SIFT_INPUT_STREAM_HPP_
