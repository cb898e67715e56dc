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
 * @file sift/worker_dispatcher.hpp
 * @brief WorkerDispatcher - fixed-size thread pool behind a BoundedChannel.
 *
 * Architecture:
 *   Submit() -> BoundedChannel<Job> (capacity = worker_num, blocking Put)
 *                    |
 *              Worker[0..N-1] Take() -> Handler(job, ctx)
 *
 * Features:
 * - Submit() blocks while the queue is full: the pipeline's backpressure
 * - Function pointer handler with a context pointer (no std::function)
 * - Shutdown() stops intake; queued jobs still run
 * - AwaitTermination() waits for the drain with a deadline
 *
 * A job is owned by the worker while its handler runs and destroyed right
 * after, so resources held by the job are released even if the handler does
 * not release them itself.
 *
 * @tparam Job Move-only or copyable, default constructible work item.
 *
 * Usage:
 *   sift::WorkerDispatcherConfig cfg;
 *   cfg.name = "ingest";
 *   cfg.worker_num = 4;
 *
 *   sift::WorkerDispatcher<Record> workers(cfg, &HandleRecord, &ctx);
 *   workers.Start();
 *   workers.Submit(std::move(record));
 *   workers.Shutdown();
 *   workers.AwaitTermination(60000);
 */

#ifndef SIFT_WORKER_DISPATCHER_HPP_
#define SIFT_WORKER_DISPATCHER_HPP_

#include "sift/channel.hpp"
#include "sift/log.hpp"
#include "sift/platform.hpp"
#include "sift/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace sift {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief WorkerDispatcher configuration.
 */
struct WorkerDispatcherConfig {
  sift::FixedString<32> name{"workers"};
  uint32_t worker_num{1U};
};

// ============================================================================
// WorkerDispatcher Statistics
// ============================================================================

struct WorkerDispatcherStats {
  uint64_t submitted{0U};
  uint64_t completed{0U};
  uint64_t failed{0U};  ///< Handler threw
  uint32_t workers_alive{0U};
  uint32_t queue_depth{0U};
};

// ============================================================================
// WorkerDispatcher
// ============================================================================

template <typename Job>
class WorkerDispatcher {
 public:
  using Handler = void (*)(Job& job, void* ctx);

  WorkerDispatcher(const WorkerDispatcherConfig& cfg, Handler handler, void* ctx)
      : name_(cfg.name),
        worker_num_(cfg.worker_num > 0U ? cfg.worker_num : 1U),
        handler_(handler),
        ctx_(ctx),
        queue_(worker_num_) {
    SIFT_ASSERT(handler_ != nullptr);
  }

  ~WorkerDispatcher() {
    Shutdown();
    JoinAll();
  }

  WorkerDispatcher(const WorkerDispatcher&) = delete;
  WorkerDispatcher& operator=(const WorkerDispatcher&) = delete;
  WorkerDispatcher(WorkerDispatcher&&) = delete;
  WorkerDispatcher& operator=(WorkerDispatcher&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Start the worker threads. No-op if already started.
   */
  void Start() {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    accepting_.store(true, std::memory_order_release);
    alive_.store(worker_num_, std::memory_order_release);
    threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      threads_.emplace_back(&WorkerDispatcher::WorkerLoop, this, i);
    }
    SIFT_LOG_DEBUG("Dispatch", "%s: started %u workers", name_.c_str(), worker_num_);
  }

  /**
   * @brief Stop accepting jobs. Already queued jobs still run.
   */
  void Shutdown() noexcept {
    accepting_.store(false, std::memory_order_release);
    queue_.Close();
  }

  /**
   * @brief Abandon queued jobs and wake every blocked Submit()/worker.
   *
   * Running handlers finish; queued jobs are destroyed without running.
   */
  void Interrupt() noexcept {
    accepting_.store(false, std::memory_order_release);
    interrupted_.store(true, std::memory_order_release);
    queue_.Interrupt();
  }

  /**
   * @brief Wait for every worker to finish after Shutdown().
   * @param timeout_ms Grace period in milliseconds.
   * @return true if all workers exited (and were joined) in time.
   */
  bool AwaitTermination(uint64_t timeout_ms) {
    {
      std::unique_lock<std::mutex> lk(done_mtx_);
      bool done = done_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                                    [this] { return alive_.load(std::memory_order_acquire) == 0U; });
      if (!done) {
        return false;
      }
    }
    JoinAll();
    return true;
  }

  // ======================== Submit API ========================

  /**
   * @brief Queue a job, blocking while the queue is full.
   *
   * @return success, kClosed after Shutdown() or before Start(), or
   *         kInterrupted. On failure @p job is untouched.
   */
  expected<void, ChannelError> Submit(Job&& job) {
    if (!accepting_.load(std::memory_order_acquire)) {
      return expected<void, ChannelError>::error(ChannelError::kClosed);
    }
    auto r = queue_.Put(std::move(job));
    if (r.has_value()) {
      submitted_.fetch_add(1U, std::memory_order_relaxed);
    }
    return r;
  }

  // ======================== Query ========================

  WorkerDispatcherStats GetStats() const noexcept {
    WorkerDispatcherStats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_acquire);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.workers_alive = alive_.load(std::memory_order_acquire);
    s.queue_depth = queue_.Size();
    return s;
  }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

  uint32_t QueueCapacity() const noexcept { return queue_.Capacity(); }

  bool IsAccepting() const noexcept { return accepting_.load(std::memory_order_acquire); }

 private:
  // ======================== Worker thread ========================

  void WorkerLoop(uint32_t worker_id) noexcept {
    while (!interrupted_.load(std::memory_order_acquire)) {
      auto item = queue_.Take();
      if (!item.has_value()) {
        break;  // closed and drained, or interrupted
      }
      Job job = std::move(item).value();
      if (interrupted_.load(std::memory_order_acquire)) {
        break;  // abandoned; job destroyed unrun
      }
      RunJob(job, worker_id);
    }

    {
      std::lock_guard<std::mutex> lk(done_mtx_);
      alive_.fetch_sub(1U, std::memory_order_acq_rel);
    }
    done_cv_.notify_all();
  }

  void RunJob(Job& job, uint32_t worker_id) noexcept {
    try {
      handler_(job, ctx_);
      completed_.fetch_add(1U, std::memory_order_release);
    } catch (const std::exception& e) {
      failed_.fetch_add(1U, std::memory_order_relaxed);
      SIFT_LOG_ERROR("Dispatch", "%s: worker %u job failed: %s", name_.c_str(), worker_id, e.what());
    }
  }

  void JoinAll() noexcept {
    std::lock_guard<std::mutex> lk(join_mtx_);
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  // ======================== Data members ========================

  sift::FixedString<32> name_;
  const uint32_t worker_num_;
  const Handler handler_;
  void* const ctx_;

  BoundedChannel<Job> queue_;

  std::atomic<bool> started_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<bool> interrupted_{false};
  std::atomic<uint32_t> alive_{0U};

  alignas(sift::kCacheLineSize) std::atomic<uint64_t> submitted_{0U};
  alignas(sift::kCacheLineSize) std::atomic<uint64_t> completed_{0U};
  alignas(sift::kCacheLineSize) std::atomic<uint64_t> failed_{0U};

  std::mutex done_mtx_;
  std::condition_variable done_cv_;
  std::mutex join_mtx_;
  std::vector<std::thread> threads_;
};

}  // namespace sift

#endif  // SIFT_WORKER_DISPATCHER_HPP_
