#pragma once

#include "benchmark.h"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <vector>

namespace zerobench {

/// Prints the run parameters ahead of the text report.
void print_banner(const Config& cfg, std::ostream& out);

/// Prints "strategy,statistic,value" lines with latency statistics in
/// nanoseconds for every strategy that produced results.
void report_text(const std::vector<StrategyResult>& results, std::ostream& out);

/// Prints all results as a single-line JSON array.
void report_json(const std::vector<StrategyResult>& results, std::ostream& out);

nlohmann::json to_json(const StrategyResult& result);

}  // namespace zerobench
