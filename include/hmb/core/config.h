#pragma once
// hmb/core/config.h
//
// Engine configuration (CLI-friendly).
//
// Design goals:
//  - Keep core free of heavy dependencies.
//  - Provide a single EngineConfig used by the record/report/interactive flows.
//  - The plan document itself (benches, axes, metrics) is loaded separately,
//    see hmb/plan/plan_loader.h.
//
// Convention:
//  - CLI uses --key=value or --key value (e.g., --mode=record --threads 8).
//  - Unknown keys are stored into `extra` so new knobs do not break old scripts.

#include "hmb/core/error.h"
#include "hmb/core/logging.h"
#include "hmb/core/types.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hmb {

enum class Mode : u8 {
  Record = 0,
  Report = 1,
  Interactive = 2,
  All = 3,
};

inline constexpr std::string_view ToString(Mode m) noexcept {
  switch (m) {
    case Mode::Record: return "record";
    case Mode::Report: return "report";
    case Mode::Interactive: return "interactive";
    case Mode::All: return "all";
  }
  return "unknown";
}

inline bool ParseMode(std::string_view s, Mode* out) noexcept {
  if (!out) return false;
  auto eq = detail::EqualsIgnoreCase;
  if (eq(s, "record") || eq(s, "run")) { *out = Mode::Record; return true; }
  if (eq(s, "report") || eq(s, "analyse") || eq(s, "analyze")) { *out = Mode::Report; return true; }
  if (eq(s, "interactive")) { *out = Mode::Interactive; return true; }
  if (eq(s, "all")) { *out = Mode::All; return true; }
  return false;
}

// --------------------------
// Small key/value argument map
// --------------------------
class ArgMap {
 public:
  ArgMap() = default;

  // Accepts "--key=value", "--key value", "-k value" and bare boolean flags;
  // anything not starting with '-' is positional. A repeated key keeps the
  // last value.
  static ArgMap FromArgv(int argc, char** argv) {
    ArgMap m;
    for (int i = 1; i < argc; ++i) {
      std::string_view token(argv[i]);
      if (token.size() < 2 || token[0] != '-') {
        m.positional_.emplace_back(token);
        continue;
      }
      token.remove_prefix(token.rfind("--", 0) == 0 ? 2 : 1);

      const auto eq_pos = token.find('=');
      if (eq_pos != std::string_view::npos) {
        m.Set(token.substr(0, eq_pos), token.substr(eq_pos + 1));
        continue;
      }
      const bool takes_value = !IsBooleanFlag(token) && i + 1 < argc && argv[i + 1][0] != '-';
      m.Set(token, takes_value ? std::string_view(argv[++i]) : std::string_view("true"));
    }
    return m;
  }

  void Set(std::string_view key, std::string_view value) {
    kv_[std::string(key)] = std::string(value);
  }

  bool Has(std::string_view key) const {
    return kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string_view> Get(std::string_view key) const {
    auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return std::nullopt;
    return std::string_view(it->second);
  }

  const std::unordered_map<std::string, std::string>& KV() const { return kv_; }
  const std::vector<std::string>& Positional() const { return positional_; }

 private:
  // Flags that never consume the following token (so "--dry_run plan.json"
  // keeps plan.json positional).
  static bool IsBooleanFlag(std::string_view key) {
    return key == "dry_run" || key == "clobber" || key == "no_clobber" || key == "wait" ||
           key == "build_once" ||
           key == "help" || key == "h" || key == "i" || key == "interactive";
  }

  std::unordered_map<std::string, std::string> kv_;
  std::vector<std::string> positional_;
};

namespace detail {

inline bool ParseBool(std::string_view s, bool* out) noexcept {
  if (!out || s.empty()) return false;
  for (std::string_view yes : {"1", "true", "yes", "y", "on"}) {
    if (EqualsIgnoreCase(s, yes)) {
      *out = true;
      return true;
    }
  }
  for (std::string_view no : {"0", "false", "no", "n", "off"}) {
    if (EqualsIgnoreCase(s, no)) {
      *out = false;
      return true;
    }
  }
  return false;
}

// Whole-token numeric parse through one of the std::sto* functions.
template <class T, class Fn>
inline bool ParseWhole(std::string_view s, T* out, Fn&& conv) {
  if (!out || s.empty()) return false;
  try {
    std::size_t idx = 0;
    const auto v = conv(std::string(s), &idx);
    if (idx != s.size()) return false;
    *out = static_cast<T>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

inline bool ParseU64(std::string_view s, u64* out) {
  if (!s.empty() && s.front() == '-') return false;
  return ParseWhole(s, out, [](const std::string& x, std::size_t* i) { return std::stoull(x, i, 10); });
}

inline bool ParseI32(std::string_view s, i32* out) {
  return ParseWhole(s, out, [](const std::string& x, std::size_t* i) { return std::stoi(x, i, 10); });
}

inline bool ParseDouble(std::string_view s, double* out) {
  return ParseWhole(s, out, [](const std::string& x, std::size_t* i) { return std::stod(x, i); });
}

// Comma-separated list of seconds, e.g. "5,10,15,30,60".
inline bool ParseSecondsList(std::string_view s, std::vector<double>* out) {
  if (!out) return false;
  std::vector<double> vals;
  std::string item;
  std::istringstream iss{std::string(s)};
  while (std::getline(iss, item, ',')) {
    double v = 0.0;
    if (!ParseDouble(item, &v) || !(v > 0.0)) return false;
    vals.push_back(v);
  }
  if (vals.empty()) return false;
  *out = std::move(vals);
  return true;
}

// Every key not in `known_keys` (unrecognized flags are reported, not fatal).
inline std::unordered_map<std::string, std::string> CollectExtras(
    const std::unordered_map<std::string, std::string>& all_kv,
    const std::vector<std::string>& known_keys) {
  std::unordered_map<std::string, std::string> extra;
  for (const auto& kv : all_kv) {
    if (std::find(known_keys.begin(), known_keys.end(), kv.first) == known_keys.end()) {
      extra.emplace(kv.first, kv.second);
    }
  }
  return extra;
}

}  // namespace detail

// Upper bound on any duration knob (about 31 years); keeps every conversion
// to a clock duration in range.
inline constexpr double kMaxSeconds = 1e9;

inline bool IsSaneSeconds(double s) noexcept {
  return std::isfinite(s) && s >= 0.0 && s <= kMaxSeconds;
}

// --------------------------
// Record-path knobs
// --------------------------
struct RecordConfig {
  // Print rendered submissions instead of submitting.
  bool dry_run = false;

  // No-clobber is the safe default; --clobber switches to overwrite.
  bool clobber = false;

  // Block until every submitted instance is terminal (or timeout).
  bool wait = false;

  // 0 = wait forever. Default matches the historical two-day cap.
  double timeout_s = 172800.0;

  // Dispatch one instance per distinct build (bench, run configuration,
  // build commands); the others run pre-built and depend on it.
  bool build_once = false;

  // Poll interval schedule; the last value repeats.
  std::vector<double> poll_backoff_s = {5.0, 10.0, 15.0, 30.0, 60.0};

  // Per-query retry budget against the scheduler.
  u64 query_retries = 3;
  double query_retry_base_s = 1.0;
};

struct SchedulerConfig {
  std::string backend = "slurm";  // slurm|local
};

struct OutputConfig {
  std::string out_dir = "results";
};

struct SystemConfig {
  i32 threads = 4;
};

struct EngineConfig {
  std::string plan_path;
  Mode mode = Mode::Record;

  // Restrict to one bench (empty = all enabled benches).
  std::string only_bench;

  RecordConfig record;
  SchedulerConfig scheduler;
  OutputConfig output;
  SystemConfig sys;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> extra;

  bool Validate(Error* err = nullptr) const {
    auto fail = [&](std::string msg) {
      SetErr(err, ErrorKind::Config, std::move(msg));
      return false;
    };

    if (plan_path.empty()) return fail("missing plan path");
    if (sys.threads <= 0) return fail("sys.threads must be > 0");
    if (output.out_dir.empty()) return fail("output.out_dir must not be empty");
    if (!IsSaneSeconds(record.timeout_s)) {
      return fail("record.timeout_s must be a finite number of seconds in [0, 1e9]");
    }
    if (record.poll_backoff_s.empty()) return fail("record.poll_backoff_s must not be empty");
    for (double s : record.poll_backoff_s) {
      if (!IsSaneSeconds(s) || s == 0.0) {
        return fail("record.poll_backoff_s entries must be finite and in (0, 1e9]");
      }
    }
    if (!IsSaneSeconds(record.query_retry_base_s)) {
      return fail("record.query_retry_base_s must be finite and in [0, 1e9]");
    }
    if (scheduler.backend != "slurm" && scheduler.backend != "local") {
      return fail("unknown scheduler backend '" + scheduler.backend + "' (expected slurm|local)");
    }
    return true;
  }

  std::string ToJsonLite() const {
    std::ostringstream oss;
    oss << "{"
        << "\"plan\":\"" << plan_path << "\","
        << "\"mode\":\"" << ToString(mode) << "\","
        << "\"bench\":\"" << only_bench << "\","
        << "\"record\":{\"dry_run\":" << (record.dry_run ? "true" : "false") << ","
        << "\"clobber\":" << (record.clobber ? "true" : "false") << ","
        << "\"wait\":" << (record.wait ? "true" : "false") << ","
        << "\"build_once\":" << (record.build_once ? "true" : "false") << ","
        << "\"timeout_s\":" << record.timeout_s << ","
        << "\"query_retries\":" << record.query_retries << "},"
        << "\"scheduler\":\"" << scheduler.backend << "\","
        << "\"out_dir\":\"" << output.out_dir << "\","
        << "\"threads\":" << sys.threads << ","
        << "\"log_level\":\"" << ToString(logging.level) << "\""
        << "}";
    return oss.str();
  }

  static EngineConfig FromArgs(int argc, char** argv) {
    return FromArgMap(ArgMap::FromArgv(argc, argv));
  }

  static EngineConfig FromArgMap(const ArgMap& args) {
    EngineConfig cfg;

    const std::vector<std::string> known = {
        "plan", "mode", "m", "interactive", "i", "bench",
        "dry_run", "clobber", "no_clobber", "wait", "build_once", "timeout", "poll_interval",
        "query_retries", "scheduler", "out_dir", "threads",
        "log_level", "log_timestamp", "log_thread", "help", "h",
    };

    if (auto v = args.Get("plan")) {
      cfg.plan_path = std::string(*v);
    } else if (!args.Positional().empty()) {
      cfg.plan_path = args.Positional().front();
    }

    // ------------- mode -------------
    if (auto v = args.Get("mode")) {
      Mode m;
      if (ParseMode(*v, &m)) cfg.mode = m;
    } else if (auto v = args.Get("m")) {
      Mode m;
      if (ParseMode(*v, &m)) cfg.mode = m;
    }
    if (args.Has("interactive") || args.Has("i")) cfg.mode = Mode::Interactive;
    if (auto v = args.Get("bench")) cfg.only_bench = std::string(*v);

    // ------------- record -------------
    if (auto v = args.Get("dry_run")) detail::ParseBool(*v, &cfg.record.dry_run);
    if (auto v = args.Get("clobber")) detail::ParseBool(*v, &cfg.record.clobber);
    if (auto v = args.Get("no_clobber")) {
      bool nc = true;
      if (detail::ParseBool(*v, &nc)) cfg.record.clobber = !nc;
    }
    if (auto v = args.Get("wait")) detail::ParseBool(*v, &cfg.record.wait);
    if (auto v = args.Get("build_once")) detail::ParseBool(*v, &cfg.record.build_once);
    if (auto v = args.Get("timeout")) detail::ParseDouble(*v, &cfg.record.timeout_s);
    if (auto v = args.Get("poll_interval")) detail::ParseSecondsList(*v, &cfg.record.poll_backoff_s);
    if (auto v = args.Get("query_retries")) detail::ParseU64(*v, &cfg.record.query_retries);

    // ------------- scheduler / output / system -------------
    if (auto v = args.Get("scheduler")) cfg.scheduler.backend = std::string(*v);
    if (auto v = args.Get("out_dir")) cfg.output.out_dir = std::string(*v);
    if (auto v = args.Get("threads")) detail::ParseI32(*v, &cfg.sys.threads);

    // ------------- logging -------------
    if (auto v = args.Get("log_level")) {
      LogLevel lvl;
      if (ParseLogLevel(*v, &lvl)) cfg.logging.level = lvl;
    }
    if (auto v = args.Get("log_timestamp")) detail::ParseBool(*v, &cfg.logging.with_timestamp);
    if (auto v = args.Get("log_thread")) detail::ParseBool(*v, &cfg.logging.with_thread_id);

    cfg.extra = detail::CollectExtras(args.KV(), known);
    return cfg;
  }
};

}  // namespace hmb
