/**
 * @file log.hpp
 * @brief Synchronous leveled logging to stderr.
 *
 * printf-style, category-tagged, thread-safe (one mutex around the write).
 * Each line carries a wall-clock timestamp, the level tag, the category and,
 * in debug builds, the source location:
 *
 *   [2024-05-01 12:00:00.123] [INFO] [Ingest] finished (ingest_engine.hpp:210)
 *
 * Two filters apply: SIFT_LOG_MIN_LEVEL removes calls at compile time, and
 * SetLevel() filters at run time. The default run-time level is kDebug in
 * debug builds and kInfo when NDEBUG is defined.
 */

#ifndef SIFT_LOG_HPP_
#define SIFT_LOG_HPP_

#include "sift/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

// ============================================================================
// Compile-Time Configuration
// ============================================================================

/// 0=debug 1=info 2=warn 3=error 4=fatal. Calls below this level compile out.
#ifndef SIFT_LOG_MIN_LEVEL
#define SIFT_LOG_MIN_LEVEL 0
#endif

namespace sift {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<uint8_t>& LevelStorage() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitializedFlag() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      return "OFF";
  }
  return "?";
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') {
      base = p + 1;
    }
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  struct tm tm_buf;
  localtime_r(&secs, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03d", static_cast<int>(ms));
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelStorage().store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(detail::LevelStorage().load(std::memory_order_relaxed));
}

/// Marks the logger ready. Logging works without Init(); the flag lets
/// applications pair startup and teardown banners.
inline void Init() noexcept { detail::InitializedFlag().store(true, std::memory_order_release); }

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedFlag().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept { return detail::InitializedFlag().load(std::memory_order_acquire); }

inline void LogWriteVa(Level level, const char* category, const char* file, int line, const char* fmt,
                       va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  char ts[48];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lk(detail::WriteMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level), category, message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts, detail::LevelTag(level), category, message,
                     detail::Basename(file), line);
#endif
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file, int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace sift

// ============================================================================
// Macros
// ============================================================================

#define SIFT_LOG_DEBUG(cat, fmt, ...)                                                              \
  do {                                                                                             \
    if (SIFT_LOG_MIN_LEVEL <= 0) {                                                                 \
      ::sift::log::LogWrite(::sift::log::Level::kDebug, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                              \
  } while (0)

#define SIFT_LOG_INFO(cat, fmt, ...)                                                              \
  do {                                                                                            \
    if (SIFT_LOG_MIN_LEVEL <= 1) {                                                                \
      ::sift::log::LogWrite(::sift::log::Level::kInfo, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                             \
  } while (0)

#define SIFT_LOG_WARN(cat, fmt, ...)                                                              \
  do {                                                                                            \
    if (SIFT_LOG_MIN_LEVEL <= 2) {                                                                \
      ::sift::log::LogWrite(::sift::log::Level::kWarn, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                             \
  } while (0)

#define SIFT_LOG_ERROR(cat, fmt, ...)                                                              \
  do {                                                                                             \
    if (SIFT_LOG_MIN_LEVEL <= 3) {                                                                 \
      ::sift::log::LogWrite(::sift::log::Level::kError, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                              \
  } while (0)

#define SIFT_LOG_FATAL(cat, fmt, ...)                                                              \
  do {                                                                                             \
    ::sift::log::LogWrite(::sift::log::Level::kFatal, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    std::abort();                                                                                  \
  } while (0)

#endif  // SIFT_LOG_HPP_
