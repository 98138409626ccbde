#pragma once
// hmb/core/assert.h
//
// Internal invariant checks (programmer errors only). Bad plans, scheduler
// failures and I/O problems are reported through hmb::Error, never here.
//
//   HMB_ASSERT(cond)            always on
//   HMB_ASSERT_MSG(cond, msg)   always on, with context
//   HMB_DASSERT(cond)           compiled out under NDEBUG
//
// A failed check writes one line to stderr (bypassing the logger, whose sink
// may be redirected) and aborts.

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string_view>

namespace hmb {
namespace detail {

[[noreturn]] inline void AssertFail(std::string_view expr, std::string_view msg, const char* file,
                                    int line, const char* func) {
  std::ostringstream oss;
  oss << "hmb: internal check failed: " << expr;
  if (!msg.empty()) oss << " (" << msg << ")";
  oss << " at " << file << ":" << line << " in " << func << "\n";
  std::cerr << oss.str() << std::flush;
  std::abort();
}

}  // namespace detail
}  // namespace hmb

#if defined(__GNUC__) || defined(__clang__)
  #define HMB_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
  #define HMB_UNLIKELY(x) (x)
#endif

#define HMB_ASSERT_MSG(cond, msg)                                                  \
  do {                                                                             \
    if (HMB_UNLIKELY(!(cond))) {                                                   \
      ::hmb::detail::AssertFail(#cond, (msg), __FILE__, __LINE__, __func__);       \
    }                                                                              \
  } while (0)

#define HMB_ASSERT(cond) HMB_ASSERT_MSG(cond, "")

#ifndef NDEBUG
  #define HMB_DASSERT(cond) HMB_ASSERT(cond)
#else
  #define HMB_DASSERT(cond) do { (void)sizeof(cond); } while (0)
#endif
