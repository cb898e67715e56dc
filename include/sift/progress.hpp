/**
 * @file progress.hpp
 * @brief Live ingest counters.
 *
 * Written by the reader thread only, read from any thread. Stores use
 * release ordering and loads use acquire, so a caller polling Snapshot()
 * from another thread sees values no older than the last completed field.
 * The three values are read independently; a snapshot is not atomic as a
 * whole.
 */

#ifndef SIFT_PROGRESS_HPP_
#define SIFT_PROGRESS_HPP_

#include "sift/log.hpp"
#include "sift/platform.hpp"

#include <atomic>
#include <cstdint>

namespace sift {

struct ProgressSnapshot {
  uint64_t bytes_read{0};       ///< All stream bytes consumed (headers + payloads)
  uint64_t file_bytes_read{0};  ///< Content bytes only
  uint64_t files_read{0};       ///< Records fully read and handed off
};

class IngestProgress final {
 public:
  /// Crossing a multiple of this many stream bytes emits an INFO line.
  static constexpr uint64_t kLogInterval = kGiB;

  IngestProgress() noexcept = default;
  IngestProgress(const IngestProgress&) = delete;
  IngestProgress& operator=(const IngestProgress&) = delete;

  uint64_t BytesRead() const noexcept { return bytes_read_.load(std::memory_order_acquire); }
  uint64_t FileBytesRead() const noexcept { return file_bytes_read_.load(std::memory_order_acquire); }
  uint64_t FilesRead() const noexcept { return files_read_.load(std::memory_order_acquire); }

  ProgressSnapshot Snapshot() const noexcept {
    ProgressSnapshot s;
    s.bytes_read = BytesRead();
    s.file_bytes_read = FileBytesRead();
    s.files_read = FilesRead();
    return s;
  }

  // --------------------------------------------------------------------------
  // Writer side (reader thread)
  // --------------------------------------------------------------------------

  /// @brief Account for @p n stream bytes (header, metadata or partial field).
  void AddStreamBytes(uint64_t n) noexcept {
    if (n == 0U) {
      return;
    }
    uint64_t before = bytes_read_.load(std::memory_order_relaxed);
    uint64_t after = before + n;
    bytes_read_.store(after, std::memory_order_release);
    if (before / kLogInterval != after / kLogInterval) {
      SIFT_LOG_INFO("Ingest", "progress: bytes=%llu file_bytes=%llu files=%llu",
                    static_cast<unsigned long long>(after),
                    static_cast<unsigned long long>(FileBytesRead()),
                    static_cast<unsigned long long>(FilesRead()));
    }
  }

  /// @brief Account for @p n content bytes; also counted as stream bytes.
  void AddContentBytes(uint64_t n) noexcept {
    file_bytes_read_.store(file_bytes_read_.load(std::memory_order_relaxed) + n, std::memory_order_release);
    AddStreamBytes(n);
  }

  void AddFile() noexcept {
    files_read_.store(files_read_.load(std::memory_order_relaxed) + 1U, std::memory_order_release);
  }

 private:
  std::atomic<uint64_t> bytes_read_{0};
  std::atomic<uint64_t> file_bytes_read_{0};
  std::atomic<uint64_t> files_read_{0};
};

}  // namespace sift

#endif  // SIFT_PROGRESS_HPP_
