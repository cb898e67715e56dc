// Copyright (c) 2024 liudegui. MIT License.
//
// ingest_demo.cpp -- IngestEngine end-to-end demo.
//
// Demonstrates:
//   1. Building IngestOptions from a ConfigStore ([ingest] section)
//   2. Synthetic stream: small files in pooled buffers, large ones spilled
//   3. Live progress polling from a second thread
//   4. Truncated stream detection
//
// Usage:
//   ingest_demo                  run on a generated in-memory stream
//   ingest_demo <file|->         ingest a frame stream from a file or stdin
//   ingest_demo <file> <conf>    same, with an [ingest] config file
//                                (needs an INI, JSON or YAML config backend)

#include "sift/config.hpp"
#include "sift/ingest_engine.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

// ============================================================================
// Demo collaborators
// ============================================================================

class SniffParser final : public sift::ContentParser {
 public:
  bool Parse(sift::Record& record, sift::Document& doc) override {
    uint8_t head[8] = {};
    auto r = sift::ReadUpTo(record.content, head, sizeof(head));
    if (!r.has_value()) return false;
    if (r.value() >= 4 && std::memcmp(head, "%PDF", 4) == 0) {
      doc.mime_type = "application/pdf";
    } else if (r.value() >= 2 && head[0] == 'P' && head[1] == 'K') {
      doc.mime_type = "application/zip";
    } else {
      doc.mime_type = "text/plain";
    }
    return true;
  }
};

class SizeClassifier final : public sift::Classifier {
 public:
  bool LoadModel(const std::string& model_path) override {
    printf("  classifier model: %s\n", model_path.c_str());
    return true;
  }

  bool Classify(sift::Record& record, sift::Document& doc) override {
    doc.file_type = record.raw_size == 0U ? "empty" : (record.content.Kind() == sift::ContentKind::kSpill ? "large" : "regular");
    return true;
  }
};

class PrintingIndex final : public sift::IndexWriter {
 public:
  explicit PrintingIndex(bool verbose) : verbose_(verbose) {}

  bool AddDocument(sift::Document&& doc) override {
    std::lock_guard<std::mutex> lk(mtx_);
    ++count_;
    if (verbose_) {
      printf("  doc %-6llu %-24s %-8s %llu bytes\n", static_cast<unsigned long long>(doc.id), doc.mime_type.c_str(),
             doc.file_type.c_str(), static_cast<unsigned long long>(doc.size));
    }
    return true;
  }

  uint64_t Count() {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
  }

 private:
  std::mutex mtx_;
  bool verbose_;
  uint64_t count_{0};
};

class DemoTask final : public sift::DocumentTask {
 public:
  void Run(sift::Record&& record, sift::IndexWriter& index, sift::ContentParser& parser,
           sift::Classifier& classifier) override {
    sift::Document doc;
    doc.id = record.id;
    doc.metadata = record.metadata;
    doc.size = record.raw_size;
    if (!classifier.Classify(record, doc) || !parser.Parse(record, doc)) {
      SIFT_LOG_WARN("Demo", "record %llu could not be parsed", static_cast<unsigned long long>(record.id));
      return;
    }
    record.content.Reset();  // buffer back to the pool before indexing
    if (!index.AddDocument(std::move(doc))) {
      SIFT_LOG_WARN("Demo", "record %llu not indexed", static_cast<unsigned long long>(record.id));
    }
  }
};

// ============================================================================
// Stream builder
// ============================================================================

static void AppendFrame(std::vector<uint8_t>& out, const std::string& metadata, const std::string& content) {
  uint8_t len[8];
  sift::EncodeLe64(metadata.size(), len);
  out.insert(out.end(), len, len + 8);
  out.insert(out.end(), metadata.begin(), metadata.end());
  sift::EncodeLe64(content.size(), len);
  out.insert(out.end(), len, len + 8);
  out.insert(out.end(), content.begin(), content.end());
}

static std::vector<uint8_t> BuildStream(uint32_t files, uint64_t threshold) {
  std::vector<uint8_t> stream;
  for (uint32_t i = 0; i < files; ++i) {
    std::string name = "{\"path\":\"/evidence/file" + std::to_string(i) + "\"}";
    std::string body;
    if (i % 10 == 9) {
      body.assign(static_cast<size_t>(threshold) + 1024U, 'L');
    } else if (i % 3 == 0) {
      body = "%PDF-1.4 " + std::string(2000, 'p');
    } else if (i % 3 == 1) {
      body = "PK" + std::string(500, 'z');
    } else {
      body = "plain text " + std::to_string(i);
    }
    AppendFrame(stream, name, body);
  }
  return stream;
}

// ============================================================================
// Demo 1: Generated stream with progress polling
// ============================================================================

static void DemoGenerated(const sift::IngestOptions& opts) {
  printf("\n=== Demo 1: Generated Stream ===\n");
  SniffParser parser;
  SizeClassifier classifier;
  DemoTask task;
  PrintingIndex index(false);

  auto engine = sift::IngestEngine::Create(opts, {&parser, &classifier, &task});
  if (!engine) {
    printf("  engine creation failed\n");
    return;
  }

  std::vector<uint8_t> stream = BuildStream(200, opts.ThresholdBytes());
  sift::MemoryInputStream in(stream.data(), stream.size(), 4096);

  std::atomic<bool> done{false};
  std::thread poller([&] {
    while (!done.load(std::memory_order_acquire)) {
      sift::ProgressSnapshot s = engine.value()->Progress().Snapshot();
      printf("  progress: files=%llu bytes=%llu\n", static_cast<unsigned long long>(s.files_read),
             static_cast<unsigned long long>(s.bytes_read));
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  });

  auto t0 = std::chrono::steady_clock::now();
  bool ok = engine.value()->Ingest(in, index);
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - t0).count();
  done.store(true, std::memory_order_release);
  poller.join();

  const sift::IngestEngine& e = *engine.value();
  printf("  result: %s in %lld us\n", ok ? "clean end of stream" : "FAILED", static_cast<long long>(us));
  printf("  indexed=%llu buffered=%llu spilled=%llu pool high-water=%u/%u\n",
         static_cast<unsigned long long>(index.Count()),
         static_cast<unsigned long long>(e.Materialization().BufferedCount()),
         static_cast<unsigned long long>(e.Materialization().SpilledCount()), e.Pool().HighWatermark(),
         e.Pool().Capacity());
}

// ============================================================================
// Demo 2: Truncated stream
// ============================================================================

static void DemoTruncated(const sift::IngestOptions& opts) {
  printf("\n=== Demo 2: Truncated Stream ===\n");
  SniffParser parser;
  SizeClassifier classifier;
  DemoTask task;
  PrintingIndex index(true);

  auto engine = sift::IngestEngine::Create(opts, {&parser, &classifier, &task});
  if (!engine) return;

  std::vector<uint8_t> stream = BuildStream(3, opts.ThresholdBytes());
  stream.resize(stream.size() - 5);
  sift::MemoryInputStream in(stream.data(), stream.size());
  bool ok = engine.value()->Ingest(in, index);
  printf("  result: %s after %llu bytes\n", ok ? "clean" : "truncation detected",
         static_cast<unsigned long long>(engine.value()->Progress().BytesRead()));
}

// ============================================================================
// Real input
// ============================================================================

static int IngestFile(const char* path, const sift::IngestOptions& opts) {
  SniffParser parser;
  SizeClassifier classifier;
  DemoTask task;
  PrintingIndex index(true);

  auto engine = sift::IngestEngine::Create(opts, {&parser, &classifier, &task});
  if (!engine) return 2;

  bool ok = false;
  if (std::strcmp(path, "-") == 0) {
    sift::FdInputStream in(STDIN_FILENO);
    ok = engine.value()->Ingest(in, index);
  } else {
    auto in = sift::FdInputStream::Open(path);
    if (!in) {
      SIFT_LOG_ERROR("Demo", "cannot open %s", path);
      return 2;
    }
    ok = engine.value()->Ingest(in.value(), index);
  }
  printf("indexed %llu documents, %llu bytes\n", static_cast<unsigned long long>(index.Count()),
         static_cast<unsigned long long>(engine.value()->Progress().BytesRead()));
  return ok ? 0 : 1;
}

int main(int argc, char* argv[]) {
  sift::log::Init();
  sift::log::SetLevel(sift::log::Level::kInfo);

  sift::IngestOptions base;
  base.worker_count = 4;
  base.large_file_threshold_bytes = 64U * 1024U;

  sift::IngestOptions opts = base;
  if (argc > 2) {
#if defined(SIFT_CONFIG_INI_ENABLED) || defined(SIFT_CONFIG_JSON_ENABLED) || defined(SIFT_CONFIG_YAML_ENABLED)
    sift::MultiConfig cfg;
    auto loaded = cfg.LoadFile(argv[2]);
    if (!loaded) {
      SIFT_LOG_ERROR("Demo", "cannot load %s", argv[2]);
      return 2;
    }
    auto mapped = sift::LoadIngestOptions(cfg, base);
    if (!mapped) return 2;
    opts = mapped.value();
#else
    SIFT_LOG_ERROR("Demo", "config files need SIFT_CONFIG_INI, SIFT_CONFIG_JSON or SIFT_CONFIG_YAML");
    return 2;
#endif
  }

  int rc = 0;
  if (argc > 1) {
    rc = IngestFile(argv[1], opts);
  } else {
    DemoGenerated(opts);
    DemoTruncated(opts);
  }

  sift::log::Shutdown();
  return rc;
}
