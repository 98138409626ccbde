#pragma once
// hmb/analysis/metric_value.h
//
// Extracted metric values: numeric, textual, or missing (with the reason).

#include "hmb/core/types.h"

#include <sstream>
#include <string>
#include <string_view>
#include <variant>

namespace hmb {
namespace analysis {

enum class MissingReason : u8 {
  NotCompleted = 0,
  NoArtifact = 1,
  NoMatch = 2,
  CoercionFailed = 3,
};

inline constexpr std::string_view ToString(MissingReason r) noexcept {
  switch (r) {
    case MissingReason::NotCompleted: return "not_completed";
    case MissingReason::NoArtifact: return "no_artifact";
    case MissingReason::NoMatch: return "no_match";
    case MissingReason::CoercionFailed: return "coercion_failed";
  }
  return "unknown";
}

struct Missing {
  MissingReason reason = MissingReason::NoMatch;
};

using MetricValue = std::variant<double, std::string, Missing>;

inline bool IsPresent(const MetricValue& v) noexcept {
  return !std::holds_alternative<Missing>(v);
}

// Cell text for reports: the number, the text, or "" when missing.
inline std::string FormatValue(const MetricValue& v) {
  if (const double* d = std::get_if<double>(&v)) {
    std::ostringstream oss;
    oss.precision(15);
    oss << *d;
    return oss.str();
  }
  if (const std::string* s = std::get_if<std::string>(&v)) return *s;
  return std::string();
}

struct ExtractedMetric {
  std::string run_id;
  std::string group_key;
  std::string metric;
  MetricValue value;
};

}  // namespace analysis
}  // namespace hmb
