/**
 * @file materializer.hpp
 * @brief Chooses where record content lands: pooled buffer or temp file.
 *
 * raw_size > threshold goes to a spill file, everything else (including
 * raw_size == threshold) is copied into a pooled buffer. Both paths consume
 * exactly raw_size bytes or fail with kTruncated.
 */

#ifndef SIFT_MATERIALIZER_HPP_
#define SIFT_MATERIALIZER_HPP_

#include "sift/buffer_pool.hpp"
#include "sift/input_stream.hpp"
#include "sift/log.hpp"
#include "sift/record.hpp"
#include "sift/spill.hpp"
#include "sift/vocabulary.hpp"

#include <cstdint>

#include <string>
#include <utility>

namespace sift {

class Materializer final {
 public:
  /// @param pool           Buffers of at least @p threshold bytes.
  /// @param threshold      Largest payload kept in memory, in bytes.
  /// @param temp_dir       Directory for spill files.
  Materializer(BufferPool& pool, uint64_t threshold, std::string temp_dir)
      : pool_(pool), threshold_(threshold), temp_dir_(std::move(temp_dir)) {
    SIFT_ASSERT(pool_.BufferSize() >= threshold_);
  }

  Materializer(const Materializer&) = delete;
  Materializer& operator=(const Materializer&) = delete;

  bool ShouldSpill(uint64_t raw_size) const noexcept { return raw_size > threshold_; }

  /**
   * @brief Materialize @p raw_size bytes of @p in.
   * @param consumed Out: bytes taken from @p in, also on failure. May be null.
   */
  expected<Content, FrameError> Materialize(InputStream& in, uint64_t raw_size, uint64_t* consumed = nullptr) {
    if (ShouldSpill(raw_size)) {
      return ToSpill(in, raw_size, consumed);
    }
    return ToBuffer(in, raw_size, consumed);
  }

  expected<Content, FrameError> ToBuffer(InputStream& in, uint64_t raw_size, uint64_t* consumed = nullptr) {
    if (consumed != nullptr) {
      *consumed = 0;
    }
    auto buf = pool_.Acquire();
    if (!buf.has_value()) {
      SIFT_LOG_WARN("Pool", "buffer acquisition interrupted");
      return expected<Content, FrameError>::error(FrameError::kInterrupted);
    }
    PooledBuffer buffer = std::move(buf).value();
    const size_t len = static_cast<size_t>(raw_size);
    SIFT_ASSERT(len <= buffer.capacity());

    auto r = ReadUpTo(in, buffer.data(), len);
    if (!r.has_value()) {
      SIFT_LOG_ERROR("Frame", "stream read failed while filling %zu byte buffer", len);
      return expected<Content, FrameError>::error(FrameError::kIoError);
    }
    if (consumed != nullptr) {
      *consumed = r.value();
    }
    if (r.value() < len) {
      SIFT_LOG_ERROR("Frame", "unexpected end of stream, expected %zu bytes, got %zu", len, r.value());
      return expected<Content, FrameError>::error(FrameError::kTruncated);
    }
    ++buffered_;
    return expected<Content, FrameError>::success(Content::FromBuffer(std::move(buffer), len));
  }

  expected<Content, FrameError> ToSpill(InputStream& in, uint64_t raw_size, uint64_t* consumed = nullptr) {
    auto file = WriteSpillFile(in, raw_size, temp_dir_, consumed);
    if (!file.has_value()) {
      return expected<Content, FrameError>::error(file.get_error());
    }
    ++spilled_;
    return expected<Content, FrameError>::success(Content::FromSpill(std::move(file).value()));
  }

  uint64_t Threshold() const noexcept { return threshold_; }
  const std::string& TempDir() const noexcept { return temp_dir_; }

  /// Reader-thread counters of which path fired.
  uint64_t BufferedCount() const noexcept { return buffered_; }
  uint64_t SpilledCount() const noexcept { return spilled_; }

 private:
  BufferPool& pool_;
  const uint64_t threshold_;
  const std::string temp_dir_;
  uint64_t buffered_{0};
  uint64_t spilled_{0};
};

}  // namespace sift

#endif  // SIFT_MATERIALIZER_HPP_
