/**
 * @file platform.hpp
 * @brief Size constants and the debug assertion macro.
 */

#ifndef SIFT_PLATFORM_HPP_
#define SIFT_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace sift {

// ============================================================================
// Sizes
// ============================================================================

/// Alignment for counters written by different threads.
static constexpr size_t kCacheLineSize = 64;

static constexpr uint64_t kKiB = 1024ULL;
static constexpr uint64_t kMiB = 1024ULL * kKiB;
static constexpr uint64_t kGiB = 1024ULL * kMiB;

// ============================================================================
// SIFT_ASSERT
//
// Programmer errors only. Compiled out with NDEBUG; runtime failures are
// reported through expected<> instead.
// ============================================================================

namespace detail {

[[noreturn]] inline void AssertFail(const char* cond, const char* func, const char* file, int line) {
  (void)std::fprintf(stderr, "sift: assertion '%s' failed in %s (%s:%d)\n", cond, func, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define SIFT_ASSERT(cond) ((void)0)
#else
#define SIFT_ASSERT(cond) \
  ((cond) ? ((void)0) : ::sift::detail::AssertFail(#cond, __func__, __FILE__, __LINE__))
#endif

}  // namespace sift

#endif  // SIFT_PLATFORM_HPP_
