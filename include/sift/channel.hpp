/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
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
 * @file channel.hpp
 * @brief Fixed-capacity blocking FIFO with guaranteed-delivery Put().
 *
 * BoundedChannel<T> exposes only Put / Take (plus a timed Take and
 * cancellation). There is no non-blocking insert: Put() waits for space for
 * as long as it takes and never drops an item. The two ways out of a
 * blocking wait are Interrupt() and Close().
 *
 * Interrupt() cancels waiting, not transfer: every Put/Take that is blocked,
 * or would have to block, returns ChannelError::kInterrupted until
 * ClearInterrupt(). A Put that finds space, or a Take that finds an item,
 * still completes. A Put that fails leaves the item with the caller, so
 * nothing in flight is lost.
 *
 * Used twice by the ingest engine: as the buffer pool free-list and as the
 * work queue in front of the worker threads.
 *
 * Usage:
 * @code
 *   sift::BoundedChannel<int> ch(2);
 *   ch.Put(1);                  // returns immediately
 *   ch.Put(2);                  // returns immediately
 *   // ch.Put(3) would block until another thread calls Take()
 *   auto v = ch.Take();         // v.value() == 1
 * @endcode
 */

#ifndef SIFT_CHANNEL_HPP_
#define SIFT_CHANNEL_HPP_

#include "sift/platform.hpp"
#include "sift/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <utility>
#include <vector>

namespace sift {

/**
 * @brief Bounded blocking channel.
 *
 * @tparam T Element type. Must be default constructible and move assignable
 *           (slots are pre-allocated at construction).
 */
template <typename T>
class BoundedChannel final {
 public:
  /**
   * @brief Construct with a fixed capacity.
   * @param capacity Maximum number of queued items (clamped to >= 1).
   */
  explicit BoundedChannel(uint32_t capacity)
      : capacity_(capacity > 0U ? capacity : 1U), slots_(capacity_) {}

  ~BoundedChannel() = default;

  // Non-copyable, non-movable
  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;
  BoundedChannel(BoundedChannel&&) = delete;
  BoundedChannel& operator=(BoundedChannel&&) = delete;

  // ==========================================================================
  // Public API
  // ==========================================================================

  /**
   * @brief Insert an item, blocking until space is available.
   *
   * The item is moved from only on success. On kInterrupted or kClosed it
   * is untouched and still owned by the caller.
   */
  expected<void, ChannelError> Put(T&& item) {
    std::unique_lock<std::mutex> lk(mtx_);
    not_full_.wait(lk, [this] { return count_ < capacity_ || interrupted_ || closed_; });
    if (closed_) {
      return expected<void, ChannelError>::error(ChannelError::kClosed);
    }
    if (count_ == capacity_) {
      return expected<void, ChannelError>::error(ChannelError::kInterrupted);
    }
    slots_[(head_ + count_) % capacity_] = std::move(item);
    ++count_;
    lk.unlock();
    not_empty_.notify_one();
    return expected<void, ChannelError>::success();
  }

  /**
   * @brief Remove the oldest item, blocking until one is available.
   *
   * After Close(), queued items are still handed out; kClosed is returned
   * only once the channel is empty.
   */
  expected<T, ChannelError> Take() {
    std::unique_lock<std::mutex> lk(mtx_);
    not_empty_.wait(lk, [this] { return count_ > 0U || interrupted_ || closed_; });
    return PopLocked(lk);
  }

  /**
   * @brief Take() with a deadline.
   * @param timeout_ms Maximum time to wait in milliseconds.
   */
  expected<T, ChannelError> TakeFor(uint64_t timeout_ms) {
    std::unique_lock<std::mutex> lk(mtx_);
    bool ready = not_empty_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                                     [this] { return count_ > 0U || interrupted_ || closed_; });
    if (!ready) {
      return expected<T, ChannelError>::error(ChannelError::kTimeout);
    }
    return PopLocked(lk);
  }

  /**
   * @brief Cancel every blocked Put/Take, and every later one that would
   *        block, until ClearInterrupt().
   */
  void Interrupt() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      interrupted_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  void ClearInterrupt() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    interrupted_ = false;
  }

  /**
   * @brief Reject further Put() calls; Take() drains what is queued.
   */
  void Close() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  // ==========================================================================
  // Query
  // ==========================================================================

  uint32_t Size() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
  }

  uint32_t Capacity() const noexcept { return capacity_; }

  bool IsInterrupted() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return interrupted_;
  }

  bool IsClosed() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

 private:
  expected<T, ChannelError> PopLocked(std::unique_lock<std::mutex>& lk) {
    if (count_ == 0U) {
      return expected<T, ChannelError>::error(interrupted_ ? ChannelError::kInterrupted : ChannelError::kClosed);
    }
    T item = std::move(slots_[head_]);
    head_ = (head_ + 1U) % capacity_;
    --count_;
    lk.unlock();
    not_full_.notify_one();
    return expected<T, ChannelError>::success(std::move(item));
  }

  const uint32_t capacity_;
  std::vector<T> slots_;
  uint32_t head_{0U};
  uint32_t count_{0U};
  bool interrupted_{false};
  bool closed_{false};

  mutable std::mutex mtx_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
};

}  // namespace sift

#endif  // SIFT_CHANNEL_HPP_
