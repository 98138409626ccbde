// src/analysis/extractor.cpp

#include "hmb/analysis/extractor.h"

#include "hmb/core/logging.h"
#include "hmb/core/worker_pool.h"

#include <boost/regex.hpp>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace hmb {
namespace analysis {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

const std::string* TargetText(const plan::MetricDefinition& def, const store::RunArtifacts& art) {
  switch (def.target) {
    case MetricTarget::Stdout:
      return art.stdout_text ? &*art.stdout_text : nullptr;
    case MetricTarget::Stderr:
      return art.stderr_text ? &*art.stderr_text : nullptr;
    case MetricTarget::File: {
      auto it = art.files.find(def.file_name);
      return it == art.files.end() ? nullptr : &it->second;
    }
  }
  return nullptr;
}

}  // namespace

std::optional<double> CoerceNumeric(std::string_view text) {
  text = Trim(text);
  if (text.empty()) return std::nullopt;
  const std::string tmp(text);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || end == tmp.c_str() || *end != '\0') return std::nullopt;
  if (!std::isfinite(v)) return std::nullopt;
  return v;
}

MetricValue ExtractMetric(const plan::MetricDefinition& def, RunStatus status,
                          const store::RunArtifacts& art) {
  if (status != RunStatus::Completed) return Missing{MissingReason::NotCompleted};

  const std::string* text = TargetText(def, art);
  if (!text) return Missing{MissingReason::NoArtifact};
  if (!def.re) return Missing{MissingReason::NoMatch};

  boost::smatch m;
  try {
    // '^' and '$' anchor to the whole artifact, not to each line.
    if (!boost::regex_search(*text, m, *def.re, boost::match_single_line) || m.size() < 2 ||
        !m[1].matched) {
      return Missing{MissingReason::NoMatch};
    }
  } catch (const std::runtime_error& e) {
    // Boost gives up on matches that exceed its complexity or memory bounds.
    HMB_LOG_WARN("metric", def.name, "match abandoned on", def.TargetLabel(), ":", e.what());
    return Missing{MissingReason::NoMatch};
  }
  const std::string captured = m[1].str();

  if (def.type == MetricType::Text) return captured;

  if (const auto v = CoerceNumeric(captured)) return *v;
  Error cerr;
  SetErr(&cerr, ErrorKind::TypeCoercion,
         "metric '" + def.name + "' captured a non-numeric value: " + captured);
  HMB_LOG_WARN(cerr.ToString());
  return Missing{MissingReason::CoercionFailed};
}

std::vector<ExtractedMetric> ExtractAll(const plan::TestPlan& plan,
                                        const std::vector<plan::RunInstance>& instances,
                                        const store::ResultStore& store, usize threads) {
  std::vector<std::vector<ExtractedMetric>> per_instance(instances.size());

  {
    WorkerPool pool(threads);
    ParallelFor(pool, instances.size(), [&](usize i) {
      const plan::RunInstance& inst = instances[i];
      const plan::TestBench* bench = plan.FindBench(inst.bench);
      if (!bench) return;

      store::RunArtifacts art;
      if (inst.status == RunStatus::Completed) {
        Error err;
        if (!store.Load(inst, &art, &err)) HMB_LOG_DEBUG("extract:", err.message);
      }

      auto& out = per_instance[i];
      out.reserve(bench->metrics.size());
      for (const auto& def : bench->metrics) {
        out.push_back(ExtractedMetric{inst.id, inst.group_key, def.name,
                                      ExtractMetric(def, inst.status, art)});
      }
    });
  }

  std::vector<ExtractedMetric> all;
  for (auto& v : per_instance) {
    for (auto& e : v) all.push_back(std::move(e));
  }
  return all;
}

}  // namespace analysis
}  // namespace hmb
