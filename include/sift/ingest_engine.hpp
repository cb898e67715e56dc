/**
 * @file ingest_engine.hpp
 * @brief IngestEngine - stream of extracted files in, index documents out.
 *
 * Architecture:
 *   caller thread                          worker threads (worker_count)
 *   -------------                          -----------------------------
 *   FrameReader::ReadNext()
 *     +-- Materializer
 *     |     +-- BufferPool::Acquire()      (blocks: pool exhausted)
 *     |     +-- WriteSpillFile()           (raw_size > threshold)
 *   WorkerDispatcher::Submit()   ------->  DocumentTask::Run(record, ...)
 *     (blocks: queue full)                   record destroyed -> buffer back
 *
 * Ingest() returns true only for a clean end of stream. Every exit path
 * shuts the workers down and waits up to shutdown_timeout_ms for them.
 *
 * Usage:
 * @code
 *   sift::IngestOptions opts;
 *   opts.worker_count = 8;
 *   opts.temp_dir = "/var/tmp";
 *   auto engine = sift::IngestEngine::Create(opts, {&parser, &classifier, &task});
 *   if (!engine) { ... }
 *   auto in = sift::FdInputStream(STDIN_FILENO);
 *   bool ok = engine.value()->Ingest(in, index);
 * @endcode
 */

#ifndef SIFT_INGEST_ENGINE_HPP_
#define SIFT_INGEST_ENGINE_HPP_

#include "sift/buffer_pool.hpp"
#include "sift/collaborators.hpp"
#include "sift/frame_reader.hpp"
#include "sift/ingest_options.hpp"
#include "sift/input_stream.hpp"
#include "sift/log.hpp"
#include "sift/materializer.hpp"
#include "sift/progress.hpp"
#include "sift/record.hpp"
#include "sift/vocabulary.hpp"
#include "sift/worker_dispatcher.hpp"

#include <cstdint>

#include <memory>
#include <mutex>
#include <utility>

namespace sift {

/// Non-owning collaborator set; all three must outlive the engine.
struct Collaborators {
  ContentParser* parser{nullptr};
  Classifier* classifier{nullptr};
  DocumentTask* task{nullptr};
};

class IngestEngine final {
 public:
  /**
   * @brief Validate @p opts, load the classifier model and build the engine.
   * @return kInvalidValue for bad options or missing collaborators,
   *         kFileNotFound when the classifier rejects model_path.
   */
  static expected<std::unique_ptr<IngestEngine>, ConfigError> Create(const IngestOptions& opts,
                                                                      const Collaborators& collab) {
    auto valid = ValidateIngestOptions(opts);
    if (!valid.has_value()) {
      return expected<std::unique_ptr<IngestEngine>, ConfigError>::error(valid.get_error());
    }
    if (collab.parser == nullptr || collab.classifier == nullptr || collab.task == nullptr) {
      SIFT_LOG_ERROR("Ingest", "parser, classifier and document task are all required");
      return expected<std::unique_ptr<IngestEngine>, ConfigError>::error(ConfigError::kInvalidValue);
    }
    if (!opts.model_path.empty() && !collab.classifier->LoadModel(opts.model_path)) {
      SIFT_LOG_ERROR("Ingest", "could not load classifier model %s", opts.model_path.c_str());
      return expected<std::unique_ptr<IngestEngine>, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return expected<std::unique_ptr<IngestEngine>, ConfigError>::success(
        std::unique_ptr<IngestEngine>(new IngestEngine(opts, collab)));
  }

  ~IngestEngine() = default;

  IngestEngine(const IngestEngine&) = delete;
  IngestEngine& operator=(const IngestEngine&) = delete;
  IngestEngine(IngestEngine&&) = delete;
  IngestEngine& operator=(IngestEngine&&) = delete;

  /**
   * @brief Read @p in to its end, handing every record to the workers.
   *
   * Blocks the calling thread. Calls are serialized.
   *
   * @return true when the stream ended cleanly on a frame boundary; false on
   *         truncation, I/O or temp-file failure.
   */
  bool Ingest(InputStream& in, IndexWriter& index) {
    std::lock_guard<std::mutex> lk(ingest_mtx_);

    // Workers left over from a previous call that outlived its grace period.
    dispatcher_.reset();

    work_.index = &index;
    WorkerDispatcherConfig cfg;
    cfg.name = "ingest";
    cfg.worker_num = opts_.worker_count;
    dispatcher_.reset(new WorkerDispatcher<Record>(cfg, &IngestEngine::HandleRecord, &work_));
    dispatcher_->Start();

    FrameReader reader(in, materializer_, progress_, opts_.max_metadata_bytes);
    bool ok = false;
    while (true) {
      auto next = reader.ReadNext();
      if (!next.has_value()) {
        ok = (next.get_error() == FrameError::kEndOfStream);
        if (!ok) {
          SIFT_LOG_ERROR("Ingest", "reading stream failed: %s, bytes read %llu", FrameErrorName(next.get_error()),
                         static_cast<unsigned long long>(reader.Cursor()));
        }
        break;
      }
      Record record = std::move(next).value();
      auto submitted = dispatcher_->Submit(std::move(record));
      if (!submitted.has_value()) {
        // record is still ours and is released on scope exit.
        SIFT_LOG_ERROR("Ingest", "record %llu not submitted: %s", static_cast<unsigned long long>(record.id),
                       submitted.get_error() == ChannelError::kInterrupted ? "interrupted" : "dispatcher closed");
        break;
      }
    }

    SIFT_LOG_INFO("Ingest", "finished ingesting data (files=%llu bytes=%llu), waiting for workers to shut down",
                  static_cast<unsigned long long>(progress_.FilesRead()),
                  static_cast<unsigned long long>(progress_.BytesRead()));
    dispatcher_->Shutdown();
    if (!dispatcher_->AwaitTermination(opts_.shutdown_timeout_ms)) {
      SIFT_LOG_WARN("Ingest", "workers still busy after %llu ms grace period",
                    static_cast<unsigned long long>(opts_.shutdown_timeout_ms));
    } else {
      WorkerDispatcherStats s = dispatcher_->GetStats();
      SIFT_LOG_INFO("Ingest", "workers done: submitted=%llu completed=%llu failed=%llu",
                    static_cast<unsigned long long>(s.submitted), static_cast<unsigned long long>(s.completed),
                    static_cast<unsigned long long>(s.failed));
    }
    return ok;
  }

  // ======================== Status ========================

  /// @brief Live counters; safe to read from any thread during Ingest().
  const IngestProgress& Progress() const noexcept { return progress_; }

  const IngestOptions& Options() const noexcept { return opts_; }

  const BufferPool& Pool() const noexcept { return pool_; }

  const Materializer& Materialization() const noexcept { return materializer_; }

  /// @brief Stats of the last Ingest() call's workers. Call between Ingest()
  ///        calls; use Progress() for live status.
  WorkerDispatcherStats DispatcherStats() const noexcept {
    return dispatcher_ ? dispatcher_->GetStats() : WorkerDispatcherStats{};
  }

 private:
  struct WorkContext {
    ContentParser* parser;
    Classifier* classifier;
    DocumentTask* task;
    IndexWriter* index;
  };

  IngestEngine(const IngestOptions& opts, const Collaborators& collab)
      : opts_(opts),
        pool_(opts_.BufferCount(), static_cast<size_t>(opts_.ThresholdBytes())),
        materializer_(pool_, opts_.ThresholdBytes(), opts_.temp_dir),
        work_{collab.parser, collab.classifier, collab.task, nullptr} {
    SIFT_LOG_INFO("Ingest", "engine ready: workers=%u threshold=%llu bytes buffers=%u temp_dir=%s",
                  opts_.worker_count, static_cast<unsigned long long>(opts_.ThresholdBytes()), pool_.Capacity(),
                  opts_.temp_dir.c_str());
  }

  static void HandleRecord(Record& record, void* ctx) {
    auto* work = static_cast<WorkContext*>(ctx);
    work->task->Run(std::move(record), *work->index, *work->parser, *work->classifier);
  }

  const IngestOptions opts_;
  IngestProgress progress_;
  BufferPool pool_;
  Materializer materializer_;
  WorkContext work_;
  std::mutex ingest_mtx_;
  // Declared last: workers hold pooled buffers, so they stop before pool_ goes.
  std::unique_ptr<WorkerDispatcher<Record>> dispatcher_;
};

}  // namespace sift

#endif  // SIFT_INGEST_ENGINE_HPP_
