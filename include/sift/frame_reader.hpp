/**
 * @file frame_reader.hpp
 * @brief Parses the extracted-file stream into Records.
 *
 * Wire format, repeated until end of stream:
 *
 *   metadata_len : uint64 LE
 *   metadata     : metadata_len bytes (opaque)
 *   content_len  : uint64 LE
 *   content      : content_len bytes
 *
 * State machine per frame:
 *
 *   kReadingMetadataLength -> kReadingMetadata -> kReadingContentLength
 *     -> kReadingContent -> (next frame) ... -> kDone | kFailed
 *
 * End of stream is clean only when it arrives before the first byte of a
 * new frame. The position at the start of each attempt is captured once,
 * and every byte taken from the stream (including the bytes of a partial
 * length header) advances the cursor, so any stop inside a frame is a
 * truncation.
 */

#ifndef SIFT_FRAME_READER_HPP_
#define SIFT_FRAME_READER_HPP_

#include "sift/input_stream.hpp"
#include "sift/log.hpp"
#include "sift/materializer.hpp"
#include "sift/progress.hpp"
#include "sift/record.hpp"
#include "sift/vocabulary.hpp"

#include <cstdint>

#include <utility>
#include <vector>

namespace sift {

static constexpr uint64_t kDefaultMaxMetadataBytes = 64ULL * kMiB;
static constexpr size_t kLengthFieldSize = 8U;

enum class FrameState : uint8_t {
  kReadingMetadataLength = 0,
  kReadingMetadata,
  kReadingContentLength,
  kReadingContent,
  kDone,
  kFailed,
};

inline const char* FrameStateName(FrameState s) noexcept {
  switch (s) {
    case FrameState::kReadingMetadataLength:
      return "metadata length";
    case FrameState::kReadingMetadata:
      return "metadata";
    case FrameState::kReadingContentLength:
      return "content length";
    case FrameState::kReadingContent:
      return "content";
    case FrameState::kDone:
      return "done";
    case FrameState::kFailed:
      return "failed";
  }
  return "unknown";
}

/// @brief Decode a little-endian uint64 independent of host byte order.
inline uint64_t DecodeLe64(const uint8_t* p) noexcept {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8U) | p[i];
  }
  return v;
}

inline void EncodeLe64(uint64_t v, uint8_t* p) noexcept {
  for (int i = 0; i < 8; ++i) {
    p[i] = static_cast<uint8_t>(v & 0xFFU);
    v >>= 8U;
  }
}

// ============================================================================
// FrameReader
// ============================================================================

class FrameReader final {
 public:
  FrameReader(InputStream& in, Materializer& materializer, IngestProgress& progress,
              uint64_t max_metadata_bytes = kDefaultMaxMetadataBytes) noexcept
      : in_(in), materializer_(materializer), progress_(progress), max_metadata_bytes_(max_metadata_bytes) {}

  FrameReader(const FrameReader&) = delete;
  FrameReader& operator=(const FrameReader&) = delete;

  /**
   * @brief Read the next frame and materialize its content.
   *
   * @return The record, or:
   *   - kEndOfStream      : stream ended on a frame boundary (state kDone)
   *   - kTruncated        : stream ended inside a frame (state kFailed)
   *   - kMetadataTooLarge : metadata length above the cap (state kFailed)
   *   - kSpillFailed / kIoError / kInterrupted (state kFailed)
   * Once terminal, every further call returns the same error.
   */
  expected<Record, FrameError> ReadNext() {
    if (state_ == FrameState::kDone || state_ == FrameState::kFailed) {
      return expected<Record, FrameError>::error(last_error_);
    }

    frame_start_ = cursor_;
    uint8_t len_buf[kLengthFieldSize];

    state_ = FrameState::kReadingMetadataLength;
    auto r = ReadExact(len_buf, kLengthFieldSize);
    if (!r.has_value()) {
      return expected<Record, FrameError>::error(r.get_error());
    }
    const uint64_t metadata_len = DecodeLe64(len_buf);
    if (metadata_len > max_metadata_bytes_) {
      SIFT_LOG_ERROR("Frame", "frame at %llu declares %llu metadata bytes (limit %llu)",
                     static_cast<unsigned long long>(frame_start_), static_cast<unsigned long long>(metadata_len),
                     static_cast<unsigned long long>(max_metadata_bytes_));
      return Fail(FrameError::kMetadataTooLarge);
    }

    state_ = FrameState::kReadingMetadata;
    std::vector<uint8_t> metadata(static_cast<size_t>(metadata_len));
    r = ReadExact(metadata.data(), metadata.size());
    if (!r.has_value()) {
      return expected<Record, FrameError>::error(r.get_error());
    }

    state_ = FrameState::kReadingContentLength;
    r = ReadExact(len_buf, kLengthFieldSize);
    if (!r.has_value()) {
      return expected<Record, FrameError>::error(r.get_error());
    }
    const uint64_t raw_size = DecodeLe64(len_buf);

    state_ = FrameState::kReadingContent;
    uint64_t consumed = 0;
    auto content = materializer_.Materialize(in_, raw_size, &consumed);
    cursor_ += consumed;
    progress_.AddContentBytes(consumed);
    if (!content.has_value()) {
      SIFT_LOG_ERROR("Frame", "frame at %llu failed while reading content (%s): expected %llu bytes, got %llu",
                     static_cast<unsigned long long>(frame_start_), FrameErrorName(content.get_error()),
                     static_cast<unsigned long long>(raw_size), static_cast<unsigned long long>(consumed));
      return Fail(content.get_error());
    }

    const uint64_t id = records_ * 2U;
    ++records_;
    progress_.AddFile();
    state_ = FrameState::kReadingMetadataLength;
    return expected<Record, FrameError>::success(
        Record(id, std::move(metadata), raw_size, std::move(content).value()));
  }

  FrameState State() const noexcept { return state_; }

  /// @brief Exact bytes consumed from the stream, partial fields included.
  uint64_t Cursor() const noexcept { return cursor_; }

  /// @brief Stream offset at which the current (or last) frame started.
  uint64_t FrameStart() const noexcept { return frame_start_; }

  uint64_t RecordsRead() const noexcept { return records_; }

 private:
  expected<void, FrameError> ReadExact(uint8_t* buf, size_t len) {
    auto r = ReadUpTo(in_, buf, len);
    if (!r.has_value()) {
      SIFT_LOG_ERROR("Frame", "stream read failed at %llu while reading %s",
                     static_cast<unsigned long long>(cursor_), FrameStateName(state_));
      last_error_ = FrameError::kIoError;
      state_ = FrameState::kFailed;
      return expected<void, FrameError>::error(FrameError::kIoError);
    }
    const size_t got = r.value();
    cursor_ += got;
    progress_.AddStreamBytes(got);
    if (got < len) {
      return EndOfStream(len, got);
    }
    return expected<void, FrameError>::success();
  }

  expected<void, FrameError> EndOfStream(size_t wanted, size_t got) {
    if (cursor_ == frame_start_) {
      state_ = FrameState::kDone;
      last_error_ = FrameError::kEndOfStream;
      SIFT_LOG_DEBUG("Frame", "clean end of stream at %llu after %llu records",
                     static_cast<unsigned long long>(cursor_), static_cast<unsigned long long>(records_));
      return expected<void, FrameError>::error(FrameError::kEndOfStream);
    }
    SIFT_LOG_ERROR("Frame", "unexpected end of stream in frame at %llu while reading %s: expected %zu bytes, got %zu",
                   static_cast<unsigned long long>(frame_start_), FrameStateName(state_), wanted, got);
    state_ = FrameState::kFailed;
    last_error_ = FrameError::kTruncated;
    return expected<void, FrameError>::error(FrameError::kTruncated);
  }

  expected<Record, FrameError> Fail(FrameError e) {
    state_ = FrameState::kFailed;
    last_error_ = e;
    return expected<Record, FrameError>::error(e);
  }

  InputStream& in_;
  Materializer& materializer_;
  IngestProgress& progress_;
  const uint64_t max_metadata_bytes_;

  FrameState state_{FrameState::kReadingMetadataLength};
  FrameError last_error_{FrameError::kEndOfStream};
  uint64_t cursor_{0};
  uint64_t frame_start_{0};
  uint64_t records_{0};
};

}  // namespace sift

#endif  // SIFT_FRAME_READER_HPP_
