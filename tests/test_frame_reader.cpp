/**
 * @file test_frame_reader.cpp
 * @brief Tests for frame_reader.hpp (wire parsing, EOF handling, ids).
 */

#include "sift/frame_reader.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

void AppendFrame(std::vector<uint8_t>& out, const std::string& metadata, const std::vector<uint8_t>& content) {
  uint8_t len[8];
  sift::EncodeLe64(metadata.size(), len);
  out.insert(out.end(), len, len + 8);
  out.insert(out.end(), metadata.begin(), metadata.end());
  sift::EncodeLe64(content.size(), len);
  out.insert(out.end(), len, len + 8);
  out.insert(out.end(), content.begin(), content.end());
}

std::vector<uint8_t> Bytes(size_t n, uint8_t seed) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; ++i) {
    v[i] = static_cast<uint8_t>(seed + i * 13U);
  }
  return v;
}

std::vector<uint8_t> ReadContent(sift::Content& c) {
  std::vector<uint8_t> out;
  uint8_t buf[1024];
  while (true) {
    auto r = c.Read(buf, sizeof(buf));
    if (!r.has_value() || r.value() == 0U) break;
    out.insert(out.end(), buf, buf + r.value());
  }
  return out;
}

/// Read failure after a fixed number of good bytes.
class FailingStream final : public sift::InputStream {
 public:
  FailingStream(const std::vector<uint8_t>& data, size_t fail_at) : inner_(data.data(), data.size()), left_(fail_at) {}

  sift::expected<size_t, sift::IoError> Read(uint8_t* buf, size_t len) noexcept override {
    if (left_ == 0U) {
      return sift::expected<size_t, sift::IoError>::error(sift::IoError::kReadFailed);
    }
    auto r = inner_.Read(buf, len < left_ ? len : left_);
    if (r.has_value()) left_ -= r.value();
    return r;
  }

 private:
  sift::MemoryInputStream inner_;
  size_t left_;
};

struct Fixture {
  explicit Fixture(uint64_t threshold = 64) : pool(2, threshold), materializer(pool, threshold, "/tmp") {}
  sift::BufferPool pool;
  sift::Materializer materializer;
  sift::IngestProgress progress;
};

}  // namespace

TEST_CASE("frame_reader - little-endian length codec", "[frame_reader]") {
  uint8_t b[8];
  sift::EncodeLe64(0x0102030405060708ULL, b);
  REQUIRE(b[0] == 0x08);
  REQUIRE(b[7] == 0x01);
  REQUIRE(sift::DecodeLe64(b) == 0x0102030405060708ULL);
}

TEST_CASE("frame_reader - empty stream is a clean end", "[frame_reader]") {
  Fixture fx;
  sift::MemoryInputStream in(nullptr, 0);
  sift::FrameReader reader(in, fx.materializer, fx.progress);

  auto r = reader.ReadNext();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sift::FrameError::kEndOfStream);
  REQUIRE(reader.State() == sift::FrameState::kDone);

  // Terminal: repeated calls keep answering the same way.
  auto again = reader.ReadNext();
  REQUIRE(again.get_error() == sift::FrameError::kEndOfStream);
  REQUIRE(reader.RecordsRead() == 0U);
}

TEST_CASE("frame_reader - N frames yield N records with stride-2 ids", "[frame_reader]") {
  Fixture fx;
  std::vector<uint8_t> stream;
  const int kFrames = 5;
  for (int i = 0; i < kFrames; ++i) {
    AppendFrame(stream, "{\"n\":" + std::to_string(i) + "}", Bytes(static_cast<size_t>(i * 10), static_cast<uint8_t>(i)));
  }
  sift::MemoryInputStream in(stream.data(), stream.size(), 5);
  sift::FrameReader reader(in, fx.materializer, fx.progress);

  uint64_t payload_total = 0;
  for (int i = 0; i < kFrames; ++i) {
    auto r = reader.ReadNext();
    REQUIRE(r.has_value());
    sift::Record rec = std::move(r).value();
    REQUIRE(rec.id == static_cast<uint64_t>(i) * 2U);
    REQUIRE(rec.SlackId() == rec.id + 1U);
    REQUIRE(std::string(rec.metadata.begin(), rec.metadata.end()) == "{\"n\":" + std::to_string(i) + "}");
    REQUIRE(rec.raw_size == static_cast<uint64_t>(i) * 10U);
    REQUIRE(ReadContent(rec.content) == Bytes(static_cast<size_t>(i * 10), static_cast<uint8_t>(i)));
    payload_total += rec.raw_size;
  }
  auto end = reader.ReadNext();
  REQUIRE(end.get_error() == sift::FrameError::kEndOfStream);

  REQUIRE(reader.RecordsRead() == static_cast<uint64_t>(kFrames));
  REQUIRE(reader.Cursor() == stream.size());
  REQUIRE(fx.progress.FilesRead() == static_cast<uint64_t>(kFrames));
  REQUIRE(fx.progress.BytesRead() == stream.size());
  REQUIRE(fx.progress.FileBytesRead() == payload_total);
}

TEST_CASE("frame_reader - 100-byte metadata and 5000-byte payload round-trip", "[frame_reader]") {
  Fixture fx(10000);
  std::string metadata(100, 'm');
  auto payload = Bytes(5000, 3);
  std::vector<uint8_t> stream;
  AppendFrame(stream, metadata, payload);

  sift::MemoryInputStream in(stream.data(), stream.size());
  sift::FrameReader reader(in, fx.materializer, fx.progress);
  auto r = reader.ReadNext();
  REQUIRE(r.has_value());
  sift::Record rec = std::move(r).value();

  REQUIRE(rec.metadata.size() == 100U);
  REQUIRE(std::string(rec.metadata.begin(), rec.metadata.end()) == metadata);
  REQUIRE(rec.content.Kind() == sift::ContentKind::kBuffer);
  REQUIRE(rec.content.Size() == 5000U);
  REQUIRE(ReadContent(rec.content) == payload);
  REQUIRE(fx.progress.BytesRead() == 8U + 100U + 8U + 5000U);
}

TEST_CASE("frame_reader - content size decides buffer or spill", "[frame_reader]") {
  Fixture fx(64);
  std::vector<uint8_t> stream;
  AppendFrame(stream, "a", Bytes(64, 1));
  AppendFrame(stream, "b", Bytes(65, 2));

  sift::MemoryInputStream in(stream.data(), stream.size());
  sift::FrameReader reader(in, fx.materializer, fx.progress);

  auto at = reader.ReadNext();
  REQUIRE(at.has_value());
  REQUIRE(at.value().content.Kind() == sift::ContentKind::kBuffer);

  auto above = reader.ReadNext();
  REQUIRE(above.has_value());
  REQUIRE(above.value().content.Kind() == sift::ContentKind::kSpill);
  REQUIRE(ReadContent(above.value().content) == Bytes(65, 2));
}

TEST_CASE("frame_reader - end of stream at every offset", "[frame_reader]") {
  std::vector<uint8_t> stream;
  std::set<size_t> boundaries{0};
  AppendFrame(stream, "first", Bytes(20, 1));
  boundaries.insert(stream.size());
  AppendFrame(stream, "", Bytes(100, 2));  // spills at threshold 64
  boundaries.insert(stream.size());
  AppendFrame(stream, "third", {});
  boundaries.insert(stream.size());

  for (size_t cut = 0; cut <= stream.size(); ++cut) {
    CAPTURE(cut);
    Fixture fx(64);
    sift::MemoryInputStream in(stream.data(), cut);
    sift::FrameReader reader(in, fx.materializer, fx.progress);

    sift::FrameError last = sift::FrameError::kEndOfStream;
    uint64_t records = 0;
    while (true) {
      auto r = reader.ReadNext();
      if (!r.has_value()) {
        last = r.get_error();
        break;
      }
      ++records;
    }

    REQUIRE(reader.Cursor() == cut);
    REQUIRE(fx.progress.BytesRead() == cut);
    REQUIRE(fx.pool.Outstanding() == 0U);
    if (boundaries.count(cut) != 0U) {
      REQUIRE(last == sift::FrameError::kEndOfStream);
      REQUIRE(reader.State() == sift::FrameState::kDone);
    } else {
      REQUIRE(last == sift::FrameError::kTruncated);
      REQUIRE(reader.State() == sift::FrameState::kFailed);
      REQUIRE(reader.ReadNext().get_error() == sift::FrameError::kTruncated);
    }
    REQUIRE(records == fx.progress.FilesRead());
  }
}

TEST_CASE("frame_reader - partial length header is a truncation", "[frame_reader]") {
  Fixture fx;
  std::vector<uint8_t> stream;
  AppendFrame(stream, "x", Bytes(4, 0));
  stream.push_back(0x01);
  stream.push_back(0x00);
  stream.push_back(0x00);

  sift::MemoryInputStream in(stream.data(), stream.size());
  sift::FrameReader reader(in, fx.materializer, fx.progress);
  REQUIRE(reader.ReadNext().has_value());

  auto r = reader.ReadNext();
  REQUIRE(r.get_error() == sift::FrameError::kTruncated);
  REQUIRE(reader.FrameStart() == stream.size() - 3U);
  REQUIRE(reader.Cursor() == stream.size());
}

TEST_CASE("frame_reader - oversized metadata length is rejected", "[frame_reader]") {
  Fixture fx;
  std::vector<uint8_t> stream(8);
  sift::EncodeLe64(1ULL << 40U, stream.data());

  sift::MemoryInputStream in(stream.data(), stream.size());
  sift::FrameReader reader(in, fx.materializer, fx.progress, 1024);
  auto r = reader.ReadNext();
  REQUIRE(r.get_error() == sift::FrameError::kMetadataTooLarge);
  REQUIRE(reader.State() == sift::FrameState::kFailed);
}

TEST_CASE("frame_reader - stream read failure is an i/o error", "[frame_reader]") {
  Fixture fx;
  std::vector<uint8_t> stream;
  AppendFrame(stream, "meta", Bytes(30, 9));

  SECTION("inside the header") {
    FailingStream in(stream, 10);
    sift::FrameReader reader(in, fx.materializer, fx.progress);
    REQUIRE(reader.ReadNext().get_error() == sift::FrameError::kIoError);
  }

  SECTION("inside the content") {
    FailingStream in(stream, stream.size() - 5);
    sift::FrameReader reader(in, fx.materializer, fx.progress);
    REQUIRE(reader.ReadNext().get_error() == sift::FrameError::kIoError);
    REQUIRE(fx.pool.Outstanding() == 0U);
  }
}

TEST_CASE("frame_reader - state names", "[frame_reader]") {
  REQUIRE(std::string(sift::FrameStateName(sift::FrameState::kReadingContentLength)) == "content length");
  REQUIRE(std::string(sift::FrameStateName(sift::FrameState::kDone)) == "done");
}
