/**
 * @file test_spill.cpp
 * @brief Tests for spill.hpp and materializer.hpp
 */

#include "sift/materializer.hpp"
#include "sift/spill.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

/// Scratch directory removed (with its contents) on scope exit.
class TempDir {
 public:
  TempDir() {
    char tmpl[] = "/tmp/sift_test_XXXXXX";
    char* p = ::mkdtemp(tmpl);
    path_ = (p != nullptr) ? p : "";
  }
  ~TempDir() {
    DIR* d = ::opendir(path_.c_str());
    if (d != nullptr) {
      while (dirent* e = ::readdir(d)) {
        std::string name = e->d_name;
        if (name != "." && name != "..") {
          (void)::unlink((path_ + "/" + name).c_str());
        }
      }
      ::closedir(d);
    }
    (void)::rmdir(path_.c_str());
  }
  const std::string& path() const { return path_; }

  size_t FileCount() const {
    size_t n = 0;
    DIR* d = ::opendir(path_.c_str());
    if (d == nullptr) return 0;
    while (dirent* e = ::readdir(d)) {
      std::string name = e->d_name;
      if (name != "." && name != "..") ++n;
    }
    ::closedir(d);
    return n;
  }

 private:
  std::string path_;
};

std::vector<uint8_t> Pattern(size_t n) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; ++i) {
    v[i] = static_cast<uint8_t>((i * 31U + 7U) & 0xFFU);
  }
  return v;
}

std::vector<uint8_t> ReadAll(sift::InputStream& in) {
  std::vector<uint8_t> out;
  uint8_t buf[4096];
  while (true) {
    auto r = in.Read(buf, sizeof(buf));
    if (!r.has_value() || r.value() == 0U) break;
    out.insert(out.end(), buf, buf + r.value());
  }
  return out;
}

bool PathExists(const std::string& p) {
  struct stat st;
  return ::stat(p.c_str(), &st) == 0;
}

}  // namespace

// ============================================================================
// WriteSpillFile
// ============================================================================

TEST_CASE("spill - file is sized exactly and holds the payload", "[spill]") {
  TempDir dir;
  REQUIRE(!dir.path().empty());
  const size_t kSize = 3 * sift::kSpillChunkSize + 123;  // spans several chunks
  auto payload = Pattern(kSize);
  payload.push_back(0xEE);  // trailing byte of the next frame, must stay unread
  sift::MemoryInputStream in(payload.data(), payload.size(), 1000);

  uint64_t consumed = 0;
  auto r = sift::WriteSpillFile(in, kSize, dir.path(), &consumed);
  REQUIRE(r.has_value());
  sift::SpillFile file = std::move(r).value();

  REQUIRE(consumed == kSize);
  REQUIRE(in.Offset() == kSize);
  REQUIRE(file.valid());
  REQUIRE(file.Size() == kSize);

  struct stat st;
  REQUIRE(::stat(file.Path().c_str(), &st) == 0);
  REQUIRE(static_cast<uint64_t>(st.st_size) == kSize);

  std::string name = file.Path().substr(dir.path().size() + 1);
  REQUIRE(name.compare(0, 4, "sift") == 0);

  std::vector<uint8_t> back;
  uint8_t buf[8192];
  while (true) {
    auto n = file.Read(buf, sizeof(buf));
    REQUIRE(n.has_value());
    if (n.value() == 0U) break;
    back.insert(back.end(), buf, buf + n.value());
  }
  payload.pop_back();
  REQUIRE(back == payload);
}

TEST_CASE("spill - destruction deletes the file and unregisters it", "[spill]") {
  TempDir dir;
  auto payload = Pattern(100);
  const size_t before = sift::SpillRegistry::Instance().Count();
  std::string path;
  {
    sift::MemoryInputStream in(payload.data(), payload.size());
    auto r = sift::WriteSpillFile(in, payload.size(), dir.path());
    REQUIRE(r.has_value());
    path = r.value().Path();
    REQUIRE(PathExists(path));
    REQUIRE(sift::SpillRegistry::Instance().Count() == before + 1);
  }
  REQUIRE_FALSE(PathExists(path));
  REQUIRE(sift::SpillRegistry::Instance().Count() == before);
}

TEST_CASE("spill - explicit Remove and moves", "[spill]") {
  TempDir dir;
  auto payload = Pattern(10);
  sift::MemoryInputStream in(payload.data(), payload.size());
  sift::SpillFile a = std::move(sift::WriteSpillFile(in, payload.size(), dir.path())).value();
  const std::string path = a.Path();

  sift::SpillFile b(std::move(a));
  REQUIRE_FALSE(a.valid());
  REQUIRE(a.Path().empty());
  REQUIRE(b.Path() == path);

  b.Remove();
  REQUIRE_FALSE(b.valid());
  REQUIRE_FALSE(PathExists(path));
  b.Remove();  // idempotent
}

TEST_CASE("spill - early end of stream is a truncation and leaves no file", "[spill]") {
  TempDir dir;
  auto payload = Pattern(500);
  sift::MemoryInputStream in(payload.data(), payload.size());

  const size_t before = sift::SpillRegistry::Instance().Count();
  uint64_t consumed = 0;
  auto r = sift::WriteSpillFile(in, 800, dir.path(), &consumed);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sift::FrameError::kTruncated);
  REQUIRE(consumed == 500U);
  REQUIRE(dir.FileCount() == 0U);
  REQUIRE(sift::SpillRegistry::Instance().Count() == before);
}

TEST_CASE("spill - missing temp directory fails", "[spill]") {
  auto payload = Pattern(16);
  sift::MemoryInputStream in(payload.data(), payload.size());
  auto r = sift::WriteSpillFile(in, payload.size(), "/nonexistent/sift/dir");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sift::FrameError::kSpillFailed);
  REQUIRE(in.Offset() == 0U);
}

TEST_CASE("spill - empty payload produces an empty file", "[spill]") {
  TempDir dir;
  sift::MemoryInputStream in(nullptr, 0);
  auto r = sift::WriteSpillFile(in, 0, dir.path());
  REQUIRE(r.has_value());
  REQUIRE(r.value().Size() == 0U);
}

TEST_CASE("spill - registry RemoveAll unlinks leftovers", "[spill]") {
  TempDir dir;
  std::string path = dir.path() + "/leftover";
  FILE* f = std::fopen(path.c_str(), "w");
  REQUIRE(f != nullptr);
  std::fclose(f);

  sift::SpillRegistry::Instance().Add(path);
  sift::SpillRegistry::Instance().RemoveAll();
  REQUIRE_FALSE(PathExists(path));
  REQUIRE(sift::SpillRegistry::Instance().Count() == 0U);
}

// ============================================================================
// Materializer
// ============================================================================

TEST_CASE("materializer - payload at the threshold uses a pooled buffer", "[spill][materializer]") {
  TempDir dir;
  sift::BufferPool pool(2, 1000);
  sift::Materializer m(pool, 1000, dir.path());

  REQUIRE_FALSE(m.ShouldSpill(1000));
  REQUIRE(m.ShouldSpill(1001));

  auto payload = Pattern(1000);
  sift::MemoryInputStream in(payload.data(), payload.size(), 77);
  uint64_t consumed = 0;
  auto r = m.Materialize(in, 1000, &consumed);
  REQUIRE(r.has_value());
  sift::Content content = std::move(r).value();

  REQUIRE(consumed == 1000U);
  REQUIRE(content.Kind() == sift::ContentKind::kBuffer);
  REQUIRE(content.Size() == 1000U);
  REQUIRE(content.BufferCapacity() == 1000U);
  REQUIRE(std::equal(payload.begin(), payload.end(), content.Data()));
  REQUIRE(pool.Outstanding() == 1U);
  REQUIRE(m.BufferedCount() == 1U);
  REQUIRE(dir.FileCount() == 0U);

  content.Reset();
  REQUIRE(pool.Outstanding() == 0U);
}

TEST_CASE("materializer - payload above the threshold spills", "[spill][materializer]") {
  TempDir dir;
  sift::BufferPool pool(2, 1000);
  sift::Materializer m(pool, 1000, dir.path());

  auto payload = Pattern(1001);
  sift::MemoryInputStream in(payload.data(), payload.size());
  auto r = m.Materialize(in, 1001);
  REQUIRE(r.has_value());
  sift::Content content = std::move(r).value();

  REQUIRE(content.Kind() == sift::ContentKind::kSpill);
  REQUIRE(content.Spill() != nullptr);
  REQUIRE(content.Data() == nullptr);
  REQUIRE(content.Size() == 1001U);
  REQUIRE(pool.Outstanding() == 0U);
  REQUIRE(m.SpilledCount() == 1U);
  REQUIRE(dir.FileCount() == 1U);
  REQUIRE(ReadAll(content) == payload);

  content.Reset();
  REQUIRE(dir.FileCount() == 0U);
}

TEST_CASE("materializer - short buffer payload is truncated and returns the buffer", "[spill][materializer]") {
  sift::BufferPool pool(1, 64);
  sift::Materializer m(pool, 64, "/tmp");

  auto payload = Pattern(10);
  sift::MemoryInputStream in(payload.data(), payload.size());
  uint64_t consumed = 0;
  auto r = m.Materialize(in, 40, &consumed);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sift::FrameError::kTruncated);
  REQUIRE(consumed == 10U);
  REQUIRE(pool.Outstanding() == 0U);
}

TEST_CASE("materializer - interrupted pool reports kInterrupted", "[spill][materializer]") {
  sift::BufferPool pool(1, 64);
  sift::Materializer m(pool, 64, "/tmp");
  sift::PooledBuffer held = std::move(pool.Acquire()).value();
  pool.Interrupt();

  auto payload = Pattern(8);
  sift::MemoryInputStream in(payload.data(), payload.size());
  auto r = m.Materialize(in, 8);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == sift::FrameError::kInterrupted);
  REQUIRE(in.Offset() == 0U);
}
