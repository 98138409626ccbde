#pragma once
// hmb/core/types.h
//
// Core, dependency-light types shared across the project:
// integer aliases, run lifecycle states and metric selectors.

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace hmb {

// --------------------------
// Fixed-width integer aliases
// --------------------------
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;

// Opaque scheduler job identifier (e.g., a Slurm job id "123456").
using JobHandle = std::string;

// --------------------------
// Run lifecycle
// --------------------------
//   Pending -> Submitted -> Running -> {Completed | Failed | Cancelled}
enum class RunStatus : u8 {
  Pending = 0,
  Submitted = 1,
  Running = 2,
  Completed = 3,
  Failed = 4,
  Cancelled = 5,
};

inline constexpr bool IsTerminal(RunStatus s) noexcept {
  return s == RunStatus::Completed || s == RunStatus::Failed || s == RunStatus::Cancelled;
}

inline constexpr std::string_view ToString(RunStatus s) noexcept {
  switch (s) {
    case RunStatus::Pending: return "pending";
    case RunStatus::Submitted: return "submitted";
    case RunStatus::Running: return "running";
    case RunStatus::Completed: return "completed";
    case RunStatus::Failed: return "failed";
    case RunStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

// --------------------------
// Metric selectors
// --------------------------
enum class MetricType : u8 {
  Numeric = 0,
  Text = 1,
};

enum class MetricTarget : u8 {
  Stdout = 0,
  Stderr = 1,
  File = 2,
};

inline constexpr std::string_view ToString(MetricType t) noexcept {
  switch (t) {
    case MetricType::Numeric: return "numeric";
    case MetricType::Text: return "text";
  }
  return "unknown";
}

inline constexpr std::string_view ToString(MetricTarget t) noexcept {
  switch (t) {
    case MetricTarget::Stdout: return "stdout";
    case MetricTarget::Stderr: return "stderr";
    case MetricTarget::File: return "file";
  }
  return "unknown";
}

namespace detail {
inline constexpr char LowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (usize i = 0; i < a.size(); ++i) {
    if (LowerAscii(a[i]) != LowerAscii(b[i])) return false;
  }
  return true;
}
}  // namespace detail

inline bool ParseRunStatus(std::string_view s, RunStatus* out) noexcept {
  if (!out) return false;
  auto eq = detail::EqualsIgnoreCase;
  if (eq(s, "pending")) { *out = RunStatus::Pending; return true; }
  if (eq(s, "submitted")) { *out = RunStatus::Submitted; return true; }
  if (eq(s, "running")) { *out = RunStatus::Running; return true; }
  if (eq(s, "completed")) { *out = RunStatus::Completed; return true; }
  if (eq(s, "failed")) { *out = RunStatus::Failed; return true; }
  if (eq(s, "cancelled") || eq(s, "canceled")) { *out = RunStatus::Cancelled; return true; }
  return false;
}

inline bool ParseMetricType(std::string_view s, MetricType* out) noexcept {
  if (!out) return false;
  auto eq = detail::EqualsIgnoreCase;
  if (eq(s, "numeric") || eq(s, "number") || eq(s, "float") || eq(s, "double")) {
    *out = MetricType::Numeric;
    return true;
  }
  if (eq(s, "text") || eq(s, "textual") || eq(s, "string")) {
    *out = MetricType::Text;
    return true;
  }
  return false;
}

inline std::ostream& operator<<(std::ostream& os, RunStatus s) {
  os << ToString(s);
  return os;
}
inline std::ostream& operator<<(std::ostream& os, MetricType t) {
  os << ToString(t);
  return os;
}

}  // namespace hmb
