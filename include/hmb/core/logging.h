#pragma once
// hmb/core/logging.h
//
// Process-wide logger for the engine and the hmb app.
//
//   HMB_LOG_INFO("submitted", id, "as", handle);
//   -> 2026-10-17 09:41:07.318 INFO  submitted grid__threads=1__r0__1a2b3c4d as 81723
//
// Arguments are streamed with operator<< and joined by single spaces. Lines
// are assembled off-lock and written whole, so dispatcher and extractor
// worker threads never interleave within a line. Default sink is stderr;
// stdout stays free for dry-run scripts and the presentation feed.

#include "hmb/core/types.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace hmb {

enum class LogLevel : u8 {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Off = 5,
};

inline constexpr std::string_view ToString(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off: return "OFF";
  }
  return "?";
}

// Case-insensitive; "warning" is accepted for Warn.
inline bool ParseLogLevel(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  static constexpr std::pair<std::string_view, LogLevel> kNames[] = {
      {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug}, {"info", LogLevel::Info},
      {"warn", LogLevel::Warn},   {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
      {"off", LogLevel::Off},
  };
  for (const auto& kv : kNames) {
    if (detail::EqualsIgnoreCase(s, kv.first)) {
      *out = kv.second;
      return true;
    }
  }
  return false;
}

struct LoggingConfig {
  LogLevel level = LogLevel::Info;
  bool with_timestamp = true;
  bool with_thread_id = false;
};

namespace detail {

// "YYYY-mm-dd HH:MM:SS.mmm " in local time.
inline void AppendTimestamp(std::ostringstream& oss) {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t t = clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << ms << std::setfill(' ') << ' ';
}

template <class... Args>
inline void AppendSpaceSeparated(std::ostringstream& oss, Args&&... args) {
  bool first = true;
  auto append_one = [&](auto&& v) {
    if (!first) oss << ' ';
    first = false;
    oss << std::forward<decltype(v)>(v);
  };
  (append_one(std::forward<Args>(args)), ...);
}

}  // namespace detail

class Logger {
 public:
  static Logger& Instance() {
    static Logger inst;
    return inst;
  }

  void SetConfig(const LoggingConfig& cfg) {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = cfg;
    level_.store(cfg.level, std::memory_order_relaxed);
  }

  LoggingConfig Config() const {
    std::lock_guard<std::mutex> lk(mu_);
    LoggingConfig c = cfg_;
    c.level = Level();
    return c;
  }

  void SetLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
  LogLevel Level() const { return level_.load(std::memory_order_relaxed); }

  bool Enabled(LogLevel lvl) const {
    const LogLevel cur = Level();
    return cur != LogLevel::Off && lvl >= cur;
  }

  // Redirect output (null restores stderr). Returns the previous sink; the
  // caller keeps ownership of both.
  std::ostream* SetOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostream* prev = out_;
    out_ = out ? out : &std::cerr;
    return prev;
  }

  template <class... Args>
  void Log(LogLevel lvl, Args&&... args) {
    if (!Enabled(lvl)) return;

    bool ts = false;
    bool tid = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      ts = cfg_.with_timestamp;
      tid = cfg_.with_thread_id;
    }

    std::ostringstream oss;
    if (ts) detail::AppendTimestamp(oss);
    oss << std::left << std::setw(5) << ToString(lvl) << std::right << ' ';
    if (tid) oss << "[tid=" << std::this_thread::get_id() << "] ";
    detail::AppendSpaceSeparated(oss, std::forward<Args>(args)...);
    oss << '\n';

    std::lock_guard<std::mutex> lk(mu_);
    (*out_) << oss.str() << std::flush;
  }

 private:
  Logger() : level_(LogLevel::Info), out_(&std::cerr) {}

  std::atomic<LogLevel> level_;
  LoggingConfig cfg_{};
  std::ostream* out_;
  mutable std::mutex mu_;
};

// Collects log output for the lifetime of the object (tests), then restores
// the previous sink and level.
class ScopedLogCapture {
 public:
  explicit ScopedLogCapture(LogLevel lvl = LogLevel::Trace)
      : prev_level_(Logger::Instance().Level()) {
    prev_out_ = Logger::Instance().SetOutput(&buf_);
    Logger::Instance().SetLevel(lvl);
  }

  ~ScopedLogCapture() {
    Logger::Instance().SetOutput(prev_out_);
    Logger::Instance().SetLevel(prev_level_);
  }

  ScopedLogCapture(const ScopedLogCapture&) = delete;
  ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

  std::string Text() const { return buf_.str(); }

 private:
  std::ostringstream buf_;
  std::ostream* prev_out_ = nullptr;
  LogLevel prev_level_;
};

#define HMB_LOG_TRACE(...) ::hmb::Logger::Instance().Log(::hmb::LogLevel::Trace, __VA_ARGS__)
#define HMB_LOG_DEBUG(...) ::hmb::Logger::Instance().Log(::hmb::LogLevel::Debug, __VA_ARGS__)
#define HMB_LOG_INFO(...)  ::hmb::Logger::Instance().Log(::hmb::LogLevel::Info, __VA_ARGS__)
#define HMB_LOG_WARN(...)  ::hmb::Logger::Instance().Log(::hmb::LogLevel::Warn, __VA_ARGS__)
#define HMB_LOG_ERROR(...) ::hmb::Logger::Instance().Log(::hmb::LogLevel::Error, __VA_ARGS__)

}  // namespace hmb
