/**
 * @file spill.hpp
 * @brief Temp-file materialization for record content above the large-file
 *        threshold.
 *
 * WriteSpillFile() creates a unique file in the temp directory, sizes it to
 * the declared length up front, copies the payload in 64 KiB chunks and
 * reopens it read-only. The returned SpillFile owns the file: destroying it
 * closes the descriptor and unlinks the path. Every live path is also listed
 * in SpillRegistry, which unlinks leftovers at process exit.
 */

#ifndef SIFT_SPILL_HPP_
#define SIFT_SPILL_HPP_

#include "sift/input_stream.hpp"
#include "sift/log.hpp"
#include "sift/platform.hpp"
#include "sift/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace sift {

static constexpr size_t kSpillChunkSize = static_cast<size_t>(64U * kKiB);
static constexpr const char* kSpillPrefix = "sift";

// ============================================================================
// SpillRegistry
// ============================================================================

/**
 * @brief Process-wide list of spill files still on disk.
 *
 * The first Instance() call registers an atexit hook that unlinks whatever
 * is still listed.
 */
class SpillRegistry final {
 public:
  static SpillRegistry& Instance() {
    static SpillRegistry registry;
    static const bool hooked = (std::atexit(&SpillRegistry::RemoveAllAtExit) == 0);
    (void)hooked;
    return registry;
  }

  void Add(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    paths_.insert(path);
  }

  void Remove(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    paths_.erase(path);
  }

  size_t Count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return paths_.size();
  }

  /// @brief Unlink every listed path and clear the list.
  void RemoveAll() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& p : paths_) {
      (void)::unlink(p.c_str());
    }
    paths_.clear();
  }

 private:
  SpillRegistry() = default;

  static void RemoveAllAtExit() { Instance().RemoveAll(); }

  mutable std::mutex mtx_;
  std::set<std::string> paths_;
};

// ============================================================================
// SpillFile
// ============================================================================

/**
 * @brief Owned, fully written temp file opened for sequential reading.
 *
 * Move-only.
 */
class SpillFile final {
 public:
  SpillFile() noexcept = default;

  SpillFile(std::string path, int read_fd, uint64_t size) noexcept
      : path_(std::move(path)), fd_(read_fd), size_(size) {}

  ~SpillFile() { Remove(); }

  SpillFile(SpillFile&& other) noexcept
      : path_(std::move(other.path_)), fd_(other.fd_), size_(other.size_), offset_(other.offset_) {
    other.path_.clear();
    other.fd_ = -1;
    other.size_ = 0;
    other.offset_ = 0;
  }

  SpillFile& operator=(SpillFile&& other) noexcept {
    if (this != &other) {
      Remove();
      path_ = std::move(other.path_);
      fd_ = other.fd_;
      size_ = other.size_;
      offset_ = other.offset_;
      other.path_.clear();
      other.fd_ = -1;
      other.size_ = 0;
      other.offset_ = 0;
    }
    return *this;
  }

  SpillFile(const SpillFile&) = delete;
  SpillFile& operator=(const SpillFile&) = delete;

  /// @brief Sequential read from the current offset; 0 at end of file.
  expected<size_t, IoError> Read(uint8_t* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<size_t, IoError>::error(IoError::kInvalidFd);
    }
    while (true) {
      ssize_t n = ::read(fd_, buf, len);
      if (n >= 0) {
        offset_ += static_cast<uint64_t>(n);
        return expected<size_t, IoError>::success(static_cast<size_t>(n));
      }
      if (errno != EINTR) {
        return expected<size_t, IoError>::error(IoError::kReadFailed);
      }
    }
  }

  /// @brief Close and unlink now instead of waiting for destruction.
  void Remove() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    if (!path_.empty()) {
      if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        SIFT_LOG_WARN("Spill", "unlink %s failed: %s", path_.c_str(), std::strerror(errno));
      }
      SpillRegistry::Instance().Remove(path_);
      path_.clear();
    }
  }

  const std::string& Path() const noexcept { return path_; }
  int Fd() const noexcept { return fd_; }
  uint64_t Size() const noexcept { return size_; }
  bool valid() const noexcept { return fd_ >= 0; }

 private:
  std::string path_;
  int fd_{-1};
  uint64_t size_{0};
  uint64_t offset_{0};
};

// ============================================================================
// WriteSpillFile
// ============================================================================

namespace detail {

/// @brief Closes a descriptor on scope exit unless released.
struct FdGuard {
  int fd;
  ~FdGuard() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
  int release() noexcept {
    int f = fd;
    fd = -1;
    return f;
  }
};

inline bool WriteAll(int fd, const uint8_t* buf, size_t len) noexcept {
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::write(fd, buf + done, len - done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    done += static_cast<size_t>(n);
  }
  return true;
}

}  // namespace detail

/**
 * @brief Copy exactly @p raw_size bytes of @p in into a new temp file.
 *
 * @param in        Stream positioned at the first content byte.
 * @param raw_size  Declared content length.
 * @param temp_dir  Directory for the file.
 * @param consumed  Out: bytes taken from @p in, also on failure. May be null.
 * @return The reopened file, kTruncated when @p in ends early, kIoError on a
 *         stream read failure, or kSpillFailed for any filesystem error.
 */
inline expected<SpillFile, FrameError> WriteSpillFile(InputStream& in, uint64_t raw_size,
                                                      const std::string& temp_dir,
                                                      uint64_t* consumed = nullptr) {
  if (consumed != nullptr) {
    *consumed = 0;
  }
  std::string path = temp_dir;
  if (path.empty()) {
    path = ".";
  }
  if (path.back() != '/') {
    path += '/';
  }
  path += kSpillPrefix;
  path += "XXXXXX";

  int wfd = ::mkstemp(&path[0]);
  if (wfd < 0) {
    SIFT_LOG_ERROR("Spill", "could not create temp file in %s: %s", temp_dir.c_str(), std::strerror(errno));
    return expected<SpillFile, FrameError>::error(FrameError::kSpillFailed);
  }
  detail::FdGuard wguard{wfd};
  SpillRegistry::Instance().Add(path);

  auto fail = [&path](FrameError e) {
    (void)::unlink(path.c_str());
    SpillRegistry::Instance().Remove(path);
    return expected<SpillFile, FrameError>::error(e);
  };

  if (::ftruncate(wfd, static_cast<off_t>(raw_size)) != 0) {
    SIFT_LOG_ERROR("Spill", "could not allocate %llu bytes for %s: %s", static_cast<unsigned long long>(raw_size),
                   path.c_str(), std::strerror(errno));
    return fail(FrameError::kSpillFailed);
  }

  std::unique_ptr<uint8_t[]> chunk(new uint8_t[kSpillChunkSize]);
  uint64_t copied = 0;
  while (copied < raw_size) {
    uint64_t left = raw_size - copied;
    size_t want = left < kSpillChunkSize ? static_cast<size_t>(left) : kSpillChunkSize;
    auto r = in.Read(chunk.get(), want);
    if (!r.has_value()) {
      SIFT_LOG_ERROR("Spill", "stream read failed after %llu of %llu bytes",
                     static_cast<unsigned long long>(copied), static_cast<unsigned long long>(raw_size));
      return fail(FrameError::kIoError);
    }
    size_t n = r.value();
    if (n == 0U) {
      SIFT_LOG_ERROR("Spill", "unexpected end of stream, expected %llu bytes, got %llu",
                     static_cast<unsigned long long>(raw_size), static_cast<unsigned long long>(copied));
      return fail(FrameError::kTruncated);
    }
    copied += n;
    if (consumed != nullptr) {
      *consumed = copied;
    }
    if (!detail::WriteAll(wfd, chunk.get(), n)) {
      SIFT_LOG_ERROR("Spill", "write to %s failed: %s", path.c_str(), std::strerror(errno));
      return fail(FrameError::kSpillFailed);
    }
  }

  if (::close(wguard.release()) != 0) {
    SIFT_LOG_ERROR("Spill", "close of %s failed: %s", path.c_str(), std::strerror(errno));
    return fail(FrameError::kSpillFailed);
  }

  int rfd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (rfd < 0) {
    SIFT_LOG_ERROR("Spill", "could not reopen %s: %s", path.c_str(), std::strerror(errno));
    return fail(FrameError::kSpillFailed);
  }
  SIFT_LOG_DEBUG("Spill", "spilled %llu bytes to %s", static_cast<unsigned long long>(raw_size), path.c_str());
  return expected<SpillFile, FrameError>::success(SpillFile(std::move(path), rfd, raw_size));
}

}  // namespace sift

#endif  // SIFT_SPILL_HPP_
