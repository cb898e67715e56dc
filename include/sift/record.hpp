/**
 * @file record.hpp
 * @brief Record: one extracted file (metadata + materialized content) as it
 *        travels from the frame reader to a worker.
 */

#ifndef SIFT_RECORD_HPP_
#define SIFT_RECORD_HPP_

#include "sift/buffer_pool.hpp"
#include "sift/input_stream.hpp"
#include "sift/spill.hpp"
#include "sift/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <utility>
#include <variant>
#include <vector>

namespace sift {

enum class ContentKind : uint8_t {
  kNone = 0,
  kBuffer,  ///< Prefix of a pooled buffer
  kSpill,   ///< Temp file on disk
};

// ============================================================================
// Content
// ============================================================================

/**
 * @brief Readable byte source backing a Record.
 *
 * Holds either a pooled buffer (valid prefix [0, Size())) or a SpillFile.
 * Move-only; destruction returns the buffer or deletes the file.
 */
class Content final : public InputStream {
 public:
  Content() noexcept = default;

  static Content FromBuffer(PooledBuffer buffer, size_t length) noexcept {
    Content c;
    c.source_.emplace<BufferSource>(BufferSource{std::move(buffer), length, 0});
    return c;
  }

  static Content FromSpill(SpillFile file) noexcept {
    Content c;
    c.source_.emplace<SpillFile>(std::move(file));
    return c;
  }

  Content(Content&&) noexcept = default;
  Content& operator=(Content&&) noexcept = default;
  Content(const Content&) = delete;
  Content& operator=(const Content&) = delete;
  ~Content() override = default;

  ContentKind Kind() const noexcept {
    switch (source_.index()) {
      case 1:
        return ContentKind::kBuffer;
      case 2:
        return ContentKind::kSpill;
      default:
        return ContentKind::kNone;
    }
  }

  /// @brief Number of valid content bytes.
  uint64_t Size() const noexcept {
    if (const auto* b = std::get_if<BufferSource>(&source_)) {
      return b->length;
    }
    if (const auto* f = std::get_if<SpillFile>(&source_)) {
      return f->Size();
    }
    return 0;
  }

  /// @brief Direct view of buffer-backed content; nullptr for spill files.
  const uint8_t* Data() const noexcept {
    const auto* b = std::get_if<BufferSource>(&source_);
    return b != nullptr ? b->buffer.data() : nullptr;
  }

  /// @brief Capacity of the backing pooled buffer (0 when not buffer-backed).
  size_t BufferCapacity() const noexcept {
    const auto* b = std::get_if<BufferSource>(&source_);
    return b != nullptr ? b->buffer.capacity() : 0U;
  }

  /// @brief Temp file backing spill content (nullptr when buffer-backed).
  const SpillFile* Spill() const noexcept { return std::get_if<SpillFile>(&source_); }

  /// @brief Sequential read over the content from its current position.
  expected<size_t, IoError> Read(uint8_t* buf, size_t len) noexcept override {
    if (auto* b = std::get_if<BufferSource>(&source_)) {
      size_t left = b->length - b->offset;
      size_t n = len < left ? len : left;
      if (n > 0U) {
        std::memcpy(buf, b->buffer.data() + b->offset, n);
        b->offset += n;
      }
      return expected<size_t, IoError>::success(n);
    }
    if (auto* f = std::get_if<SpillFile>(&source_)) {
      return f->Read(buf, len);
    }
    return expected<size_t, IoError>::success(0U);
  }

  /// @brief Return the buffer / delete the file now.
  void Reset() noexcept { source_.emplace<std::monostate>(); }

 private:
  struct BufferSource {
    PooledBuffer buffer;
    size_t length;
    size_t offset;
  };

  std::variant<std::monostate, BufferSource, SpillFile> source_;
};

// ============================================================================
// Record
// ============================================================================

/**
 * @brief One parsed frame.
 *
 * id is even; id + 1 is reserved for content a worker derives from this
 * record. metadata is passed through uninterpreted.
 */
struct Record {
  uint64_t id{0};
  std::vector<uint8_t> metadata;
  uint64_t raw_size{0};
  Content content;

  Record() = default;
  Record(uint64_t rid, std::vector<uint8_t> meta, uint64_t size, Content body) noexcept
      : id(rid), metadata(std::move(meta)), raw_size(size), content(std::move(body)) {}

  Record(Record&&) noexcept = default;
  Record& operator=(Record&&) noexcept = default;
  Record(const Record&) = delete;
  Record& operator=(const Record&) = delete;

  /// @brief Id reserved for derived content (embedded files, extracted text).
  uint64_t SlackId() const noexcept { return id + 1U; }
};

}  // namespace sift

#endif  // SIFT_RECORD_HPP_
