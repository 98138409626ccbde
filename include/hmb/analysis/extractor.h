#pragma once
// hmb/analysis/extractor.h
//
// Metric extraction: first regex match on the target artifact, capture
// group 1, coerced to the declared type. Never fails: anything that does not
// produce a value yields Missing with a reason.

#include "hmb/analysis/metric_value.h"
#include "hmb/plan/matrix.h"
#include "hmb/plan/model.h"
#include "hmb/store/result_store.h"

#include <optional>
#include <string_view>
#include <vector>

namespace hmb {
namespace analysis {

// Strict numeric parse of a captured token (surrounding whitespace allowed).
std::optional<double> CoerceNumeric(std::string_view text);

MetricValue ExtractMetric(const plan::MetricDefinition& def, RunStatus status,
                          const store::RunArtifacts& art);

// Extract every metric of each instance's bench. Artifacts are read from the
// store; instances run in parallel on `threads` workers. Results are ordered
// by instance, then by metric declaration order.
std::vector<ExtractedMetric> ExtractAll(const plan::TestPlan& plan,
                                        const std::vector<plan::RunInstance>& instances,
                                        const store::ResultStore& store, usize threads = 4);

}  // namespace analysis
}  // namespace hmb
