#pragma once
// hmb/report/write_report.h
//
// Report outputs derived from recorded results:
//  - runs.csv             one row per (run, metric) with the extracted value
//                         or the reason it is missing
//  - summary.csv          one row per (group, metric); groups without any
//                         present value are written as "no data"
//  - <bench>_export.csv   one row per group: axis columns, then for each
//                         metric "<metric>" and "<metric> error" (stdev)
//  - presentation feed    JSON Lines (bench record, then series records)
//
// All writers keep expansion order so outputs are stable across runs.

#include "hmb/analysis/aggregator.h"
#include "hmb/analysis/metric_value.h"
#include "hmb/core/error.h"
#include "hmb/plan/matrix.h"
#include "hmb/plan/model.h"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace hmb {
namespace report {

inline constexpr const char* kReportDir = plan::kReportDirName;
inline constexpr const char* kNoData = "no data";

std::vector<std::string> RunsHeader();
std::vector<std::string> SummaryHeader();

bool WriteRunsCSV(const std::filesystem::path& path,
                  const std::vector<plan::RunInstance>& instances,
                  const std::vector<analysis::ExtractedMetric>& extracted,
                  Error* err = nullptr);

bool WriteSummaryCSV(const std::filesystem::path& path, const plan::TestPlan& plan,
                     const analysis::AggregationResult& agg, Error* err = nullptr);

// Export table for one bench.
bool WriteExportCSV(const std::filesystem::path& path, const plan::TestBench& bench,
                    const analysis::AggregationResult& agg, Error* err = nullptr);

// Presentation feed for every bench that has at least one group.
void WriteFeed(std::ostream& os, const plan::TestPlan& plan,
               const analysis::AggregationResult& agg);

// Writes runs.csv, summary.csv and every bench export under <out_dir>/report.
// The report directory is returned via out_dir_used when provided.
bool WriteReport(const std::filesystem::path& out_dir, const plan::TestPlan& plan,
                 const std::vector<plan::RunInstance>& instances,
                 const std::vector<analysis::ExtractedMetric>& extracted,
                 const analysis::AggregationResult& agg,
                 std::filesystem::path* out_dir_used = nullptr,
                 Error* err = nullptr);

}  // namespace report
}  // namespace hmb
