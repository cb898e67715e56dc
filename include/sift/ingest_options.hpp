/**
 * @file ingest_options.hpp
 * @brief Construction parameters of the ingest engine.
 */

#ifndef SIFT_INGEST_OPTIONS_HPP_
#define SIFT_INGEST_OPTIONS_HPP_

#include "sift/frame_reader.hpp"
#include "sift/log.hpp"
#include "sift/platform.hpp"
#include "sift/vocabulary.hpp"

#include <cstdint>

#include <string>

namespace sift {

static constexpr uint32_t kDefaultWorkerCount = 4U;
static constexpr uint32_t kDefaultLargeFileThresholdMb = 10U;
static constexpr uint64_t kDefaultShutdownTimeoutMs = 60ULL * 60ULL * 1000ULL;  // 1 h

/// Buffers beyond the worker count, so the reader can fill one ahead.
static constexpr uint32_t kBufferPoolSlack = 2U;

struct IngestOptions {
  uint32_t worker_count{kDefaultWorkerCount};
  uint32_t large_file_threshold_mb{kDefaultLargeFileThresholdMb};
  /// Exact threshold in bytes; overrides large_file_threshold_mb when non-zero.
  uint64_t large_file_threshold_bytes{0};
  std::string temp_dir{"/tmp"};
  std::string model_path;
  uint64_t max_metadata_bytes{kDefaultMaxMetadataBytes};
  uint64_t shutdown_timeout_ms{kDefaultShutdownTimeoutMs};

  uint64_t ThresholdBytes() const noexcept {
    return large_file_threshold_bytes != 0U ? large_file_threshold_bytes
                                            : static_cast<uint64_t>(large_file_threshold_mb) * kMiB;
  }

  uint32_t BufferCount() const noexcept { return worker_count + kBufferPoolSlack; }
};

/**
 * @brief Reject options the engine cannot run with.
 * @return kInvalidValue with a logged reason.
 */
inline expected<void, ConfigError> ValidateIngestOptions(const IngestOptions& opts) {
  if (opts.worker_count == 0U) {
    SIFT_LOG_ERROR("Ingest", "worker_count must be at least 1");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (opts.ThresholdBytes() == 0U) {
    SIFT_LOG_ERROR("Ingest", "large file threshold must be positive");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (opts.ThresholdBytes() > static_cast<uint64_t>(SIZE_MAX)) {
    SIFT_LOG_ERROR("Ingest", "large file threshold exceeds addressable memory");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (opts.temp_dir.empty()) {
    SIFT_LOG_ERROR("Ingest", "temp_dir must not be empty");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

}  // namespace sift

#endif  // SIFT_INGEST_OPTIONS_HPP_
