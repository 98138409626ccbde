// src/analysis/aggregator.cpp

#include "hmb/analysis/aggregator.h"

#include "hmb/core/stats.h"

#include <unordered_map>
#include <utility>

namespace hmb {
namespace analysis {

namespace {

// Mode with ties broken by first occurrence.
std::string MostFrequent(const std::vector<std::string>& values) {
  std::unordered_map<std::string, usize> counts;
  std::string best;
  usize best_count = 0;
  for (const auto& v : values) ++counts[v];
  for (const auto& v : values) {
    const usize c = counts[v];
    if (c > best_count) {
      best = v;
      best_count = c;
    }
  }
  return best;
}

}  // namespace

std::string AggregatedMetric::CentralText() const {
  if (type == MetricType::Text) return mode;
  return FormatValue(MetricValue{mean});
}

const AggregatedMetric* AggregationResult::Find(std::string_view group_key,
                                                std::string_view metric) const {
  for (const auto& m : metrics) {
    if (m.group_key == group_key && m.metric == metric) return &m;
  }
  return nullptr;
}

AggregationResult Aggregate(const plan::TestPlan& plan,
                            const std::vector<plan::RunInstance>& instances,
                            const std::vector<ExtractedMetric>& extracted) {
  AggregationResult res;

  // Groups in first-seen order.
  std::unordered_map<std::string, usize> group_index;
  for (const auto& inst : instances) {
    auto it = group_index.find(inst.group_key);
    if (it == group_index.end()) {
      group_index.emplace(inst.group_key, res.groups.size());
      res.groups.push_back(GroupInfo{inst.bench, inst.group_key, inst.axes, {inst.id}});
    } else {
      res.groups[it->second].run_ids.push_back(inst.id);
    }
  }

  // (group_key, metric) -> present values in instance order.
  std::unordered_map<std::string, std::vector<const MetricValue*>> values;
  auto key_of = [](const std::string& group, const std::string& metric) {
    return group + '\x1f' + metric;
  };
  for (const auto& e : extracted) {
    if (!IsPresent(e.value)) continue;
    values[key_of(e.group_key, e.metric)].push_back(&e.value);
  }

  for (const auto& g : res.groups) {
    const plan::TestBench* bench = plan.FindBench(g.bench);
    if (!bench) continue;
    for (const auto& def : bench->metrics) {
      auto it = values.find(key_of(g.group_key, def.name));
      if (it == values.end() || it->second.empty()) continue;

      AggregatedMetric am;
      am.bench = g.bench;
      am.group_key = g.group_key;
      am.metric = def.name;
      am.type = def.type;

      if (def.type == MetricType::Numeric) {
        RerunStats rs;
        for (const MetricValue* v : it->second) {
          if (const double* d = std::get_if<double>(v)) rs.Add(*d);
        }
        if (rs.Empty()) continue;
        am.count = rs.Count();
        am.mean = rs.Mean();
        am.stdev = rs.SampleStddev();
        am.min = rs.Min();
        am.max = rs.Max();
      } else {
        std::vector<std::string> texts;
        for (const MetricValue* v : it->second) {
          if (const std::string* s = std::get_if<std::string>(v)) texts.push_back(*s);
        }
        if (texts.empty()) continue;
        am.count = texts.size();
        am.mode = MostFrequent(texts);
      }
      res.metrics.push_back(std::move(am));
    }
  }
  return res;
}

}  // namespace analysis
}  // namespace hmb
