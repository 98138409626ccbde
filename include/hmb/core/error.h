#pragma once
// hmb/core/error.h
//
// Error reporting for the engine.
//
// Convention (same as the rest of the codebase):
//   bool DoThing(..., Error* err = nullptr);
// returns false and fills *err (when non-null) on failure.
//
// The kind tells callers how far a failure propagates:
//   Config        fatal, aborts before any dispatch
//   Template      fatal for one test bench
//   Submission    one run instance (marked Failed), siblings continue
//   Store         one run instance, reported
//   TypeCoercion  demoted to a missing metric value with a warning

#include "hmb/core/types.h"

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace hmb {

enum class ErrorKind : u8 {
  None = 0,
  Config = 1,
  Template = 2,
  Submission = 3,
  Store = 4,
  TypeCoercion = 5,
};

inline constexpr std::string_view ToString(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None: return "none";
    case ErrorKind::Config: return "ConfigError";
    case ErrorKind::Template: return "TemplateError";
    case ErrorKind::Submission: return "SubmissionError";
    case ErrorKind::Store: return "StoreError";
    case ErrorKind::TypeCoercion: return "TypeCoercionError";
  }
  return "UnknownError";
}

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool Ok() const noexcept { return kind == ErrorKind::None; }

  void Clear() {
    kind = ErrorKind::None;
    message.clear();
  }

  // "ConfigError: bench 'x' ..." (empty string when Ok()).
  std::string ToString() const {
    if (Ok()) return std::string();
    return std::string(hmb::ToString(kind)) + ": " + message;
  }
};

inline void SetErr(Error* err, ErrorKind kind, std::string msg) {
  if (!err) return;
  err->kind = kind;
  err->message = std::move(msg);
}

// Prefix an existing error message with context (keeps the kind).
inline void AddContext(Error* err, std::string_view context) {
  if (!err || err->Ok()) return;
  err->message = std::string(context) + ": " + err->message;
}

inline std::ostream& operator<<(std::ostream& os, const Error& e) {
  os << e.ToString();
  return os;
}

}  // namespace hmb
