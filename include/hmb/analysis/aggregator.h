#pragma once
// hmb/analysis/aggregator.h
//
// Rerun aggregation. Runs are grouped by group key (bench + axis values,
// rerun index ignored) in expansion order.
//
//   numeric  count, mean, sample stdev (n-1; 0 when n < 2), min, max
//   text     most frequent value (ties -> first seen), dispersion 0
//
// A (group, metric) pair with no present value gets no AggregatedMetric;
// reports render it as "no data".

#include "hmb/analysis/metric_value.h"
#include "hmb/plan/matrix.h"
#include "hmb/plan/model.h"

#include <string>
#include <string_view>
#include <vector>

namespace hmb {
namespace analysis {

struct GroupInfo {
  std::string bench;
  std::string group_key;
  plan::AxisValues axes;
  std::vector<std::string> run_ids;  // rerun order
};

struct AggregatedMetric {
  std::string bench;
  std::string group_key;
  std::string metric;
  MetricType type = MetricType::Numeric;

  usize count = 0;  // contributing present values

  // Numeric
  double mean = 0.0;
  double stdev = 0.0;
  double min = 0.0;
  double max = 0.0;

  // Text
  std::string mode;

  // Central value as report text.
  std::string CentralText() const;
};

struct AggregationResult {
  std::vector<GroupInfo> groups;
  std::vector<AggregatedMetric> metrics;

  const AggregatedMetric* Find(std::string_view group_key, std::string_view metric) const;
};

AggregationResult Aggregate(const plan::TestPlan& plan,
                            const std::vector<plan::RunInstance>& instances,
                            const std::vector<ExtractedMetric>& extracted);

}  // namespace analysis
}  // namespace hmb
