/**
 * @file buffer_pool.hpp
 * @brief Fixed set of pre-allocated byte buffers recycled through a
 *        BoundedChannel free-list.
 *
 * Acquire() takes a buffer off the free-list and blocks while all of them are
 * checked out; PooledBuffer hands it back exactly once, on Release() or on
 * destruction. Buffers are not cleared between checkouts: only the prefix a
 * consumer wrote is meaningful.
 *
 * The ingest engine sizes the pool to worker_count + 2 so the reader can fill
 * one buffer ahead while every worker holds one.
 */

#ifndef SIFT_BUFFER_POOL_HPP_
#define SIFT_BUFFER_POOL_HPP_

#include "sift/channel.hpp"
#include "sift/log.hpp"
#include "sift/platform.hpp"
#include "sift/vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <memory>
#include <utility>
#include <vector>

namespace sift {

class BufferPool;

// ============================================================================
// PooledBuffer
//
// Move-only checkout handle. Owns one pool buffer until released.
// ============================================================================

class PooledBuffer final {
 public:
  PooledBuffer() noexcept = default;

  PooledBuffer(PooledBuffer&& other) noexcept : pool_(other.pool_), data_(other.data_) {
    other.pool_ = nullptr;
    other.data_ = nullptr;
  }

  PooledBuffer& operator=(PooledBuffer&& other) noexcept {
    if (this != &other) {
      Release();
      pool_ = other.pool_;
      data_ = other.data_;
      other.pool_ = nullptr;
      other.data_ = nullptr;
    }
    return *this;
  }

  PooledBuffer(const PooledBuffer&) = delete;
  PooledBuffer& operator=(const PooledBuffer&) = delete;

  ~PooledBuffer() { Release(); }

  /// @brief Return the buffer to its pool. No-op on an empty handle.
  inline void Release() noexcept;

  uint8_t* data() noexcept { return data_; }
  const uint8_t* data() const noexcept { return data_; }

  /// @brief Fixed capacity of the underlying buffer (0 for an empty handle).
  inline size_t capacity() const noexcept;

  bool valid() const noexcept { return data_ != nullptr; }
  explicit operator bool() const noexcept { return valid(); }

 private:
  friend class BufferPool;

  PooledBuffer(BufferPool* pool, uint8_t* data) noexcept : pool_(pool), data_(data) {}

  BufferPool* pool_{nullptr};
  uint8_t* data_{nullptr};
};

// ============================================================================
// BufferPool
// ============================================================================

class BufferPool final {
 public:
  /// @brief Allocate @p buffer_count buffers of @p buffer_size bytes each.
  BufferPool(uint32_t buffer_count, size_t buffer_size)
      : buffer_size_(buffer_size), free_list_(buffer_count) {
    const uint32_t count = free_list_.Capacity();
    storage_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
      storage_.emplace_back(new uint8_t[buffer_size_ > 0 ? buffer_size_ : 1]);
      uint8_t* raw = storage_.back().get();
      // Capacity equals buffer count, so this never blocks.
      auto r = free_list_.Put(std::move(raw));
      SIFT_ASSERT(r.has_value());
      (void)r;
    }
    SIFT_LOG_DEBUG("Pool", "buffer pool ready: %u x %zu bytes", count, buffer_size_);
  }

  ~BufferPool() {
    uint32_t out = outstanding_.load(std::memory_order_acquire);
    if (out != 0U) {
      SIFT_LOG_ERROR("Pool", "destroyed with %u buffers still checked out", out);
    }
  }

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;
  BufferPool(BufferPool&&) = delete;
  BufferPool& operator=(BufferPool&&) = delete;

  // --------------------------------------------------------------------------
  // Checkout / Return
  // --------------------------------------------------------------------------

  /// @brief Check out a buffer, blocking while none is free.
  /// @return The buffer handle, or kInterrupted after Interrupt().
  expected<PooledBuffer, ChannelError> Acquire() {
    auto r = free_list_.Take();
    if (!r.has_value()) {
      return expected<PooledBuffer, ChannelError>::error(r.get_error());
    }
    NoteCheckout();
    return expected<PooledBuffer, ChannelError>::success(PooledBuffer(this, r.value()));
  }

  /// @brief Explicit return; equivalent to buffer.Release().
  void Release(PooledBuffer& buffer) noexcept { buffer.Release(); }

  /// @brief Cancel blocked Acquire() calls, and later ones that would block,
  ///        until ClearInterrupt(). Returns are never affected.
  void Interrupt() noexcept { free_list_.Interrupt(); }

  void ClearInterrupt() noexcept { free_list_.ClearInterrupt(); }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  uint32_t Capacity() const noexcept { return free_list_.Capacity(); }

  size_t BufferSize() const noexcept { return buffer_size_; }

  /// @brief Buffers currently on the free-list.
  uint32_t Available() const noexcept { return free_list_.Size(); }

  /// @brief Buffers currently checked out.
  uint32_t Outstanding() const noexcept { return outstanding_.load(std::memory_order_acquire); }

  /// @brief Largest number of simultaneous checkouts observed.
  uint32_t HighWatermark() const noexcept { return high_watermark_.load(std::memory_order_acquire); }

 private:
  friend class PooledBuffer;

  void NoteCheckout() noexcept {
    uint32_t now = outstanding_.fetch_add(1U, std::memory_order_acq_rel) + 1U;
    uint32_t seen = high_watermark_.load(std::memory_order_relaxed);
    while (now > seen && !high_watermark_.compare_exchange_weak(seen, now, std::memory_order_acq_rel)) {
    }
  }

  void Return(uint8_t* data) noexcept {
    outstanding_.fetch_sub(1U, std::memory_order_acq_rel);
    // The free-list holds every buffer and is never closed, so there is
    // always room and the Put never waits.
    auto r = free_list_.Put(std::move(data));
    if (!r.has_value()) {
      SIFT_LOG_ERROR("Pool", "buffer not returned to the free-list");
    }
  }

  const size_t buffer_size_;
  std::vector<std::unique_ptr<uint8_t[]>> storage_;
  BoundedChannel<uint8_t*> free_list_;
  std::atomic<uint32_t> outstanding_{0U};
  std::atomic<uint32_t> high_watermark_{0U};
};

// ============================================================================
// PooledBuffer inline definitions
// ============================================================================

inline void PooledBuffer::Release() noexcept {
  if (pool_ != nullptr && data_ != nullptr) {
    pool_->Return(data_);
  }
  pool_ = nullptr;
  data_ = nullptr;
}

inline size_t PooledBuffer::capacity() const noexcept {
  return pool_ != nullptr ? pool_->BufferSize() : 0U;
}

}  // namespace sift

#endif  // SIFT_BUFFER_POOL_HPP_
