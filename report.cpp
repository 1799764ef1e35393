#include "report.hh"

#include "memory.hh"

#include <hdr_histogram.h>

#include <array>
#include <iomanip>
#include <memory>
#include <ostream>
#include <stdexcept>

namespace zerobench {

namespace {

/* One hour in nanoseconds bounds any single reclamation.  */
static constexpr int64_t max_trackable_ns = 3600ll * 1000 * 1000 * 1000;

struct HistogramDeleter {
  void operator()(struct hdr_histogram *hist) const { hdr_close(hist); }
};

using Histogram = std::unique_ptr<struct hdr_histogram, HistogramDeleter>;

Histogram make_histogram() {
  struct hdr_histogram *hist = nullptr;
  if (hdr_init(1, max_trackable_ns, 3, &hist)) {
    throw std::runtime_error("hdr_init failed");
  }
  return Histogram{hist};
}

}  // namespace

void print_banner(const Config& cfg, std::ostream& out) {
  auto precision = out.precision();
  out << "--- PAGEMAP_SCAN Benchmark ---" << std::endl;
  out << std::fixed << std::setprecision(2);
  out << "Total Memory Size: " << double(cfg.total_size) / 1024.0 / 1024.0 << " MiB" << std::endl;
  out << "Dirty Fraction: " << cfg.dirty_fraction * 100.0 << "% ("
      << memory::dirty_byte_count(cfg.total_size, cfg.dirty_fraction) << " bytes)" << std::endl;
  out << "Threads: " << cfg.threads << ", Iterations: " << cfg.iterations << std::endl;
  out << "------------------------------" << std::endl;
  out << std::defaultfloat << std::setprecision(precision);
}

void report_text(const std::vector<StrategyResult>& results, std::ostream& out) {
  out << "strategy,statistic,value" << std::endl;
  for (Strategy strategy : all_strategies) {
    auto hist = make_histogram();
    for (const auto& result : results) {
      if (result.strategy != strategy) {
        continue;
      }
      if (!hdr_record_value(hist.get(), int64_t(result.duration_ns))) {
        throw std::range_error("duration out of histogram range");
      }
    }
    if (hist->total_count == 0) {
      continue;
    }
    const char *name = to_string(strategy);
    out << name << ",count," << hist->total_count << std::endl;
    out << name << ",mean," << hdr_mean(hist.get()) << std::endl;
    out << name << ",stddev," << hdr_stddev(hist.get()) << std::endl;
    std::array<double, 4> percentiles = {
        50,
        90,
        99,
        99.9,
    };
    for (auto percentile : percentiles) {
      out << name << "," << percentile << "," << hdr_value_at_percentile(hist.get(), percentile)
          << std::endl;
    }
    out << name << ",max," << hdr_max(hist.get()) << std::endl;
  }
}

nlohmann::json to_json(const StrategyResult& result) {
  return nlohmann::json{
      {"strategy", to_string(result.strategy)},
      {"total_size", result.total_size},
      {"dirty_fraction", result.dirty_fraction},
      {"duration",
       {
           {"secs", result.duration_ns / 1000000000},
           {"nanos", result.duration_ns % 1000000000},
       }},
      {"threads", result.threads},
      {"processes", result.processes},
  };
}

void report_json(const std::vector<StrategyResult>& results, std::ostream& out) {
  auto records = nlohmann::json::array();
  for (const auto& result : results) {
    records.push_back(to_json(result));
  }
  out << records.dump() << std::endl;
}

}  // namespace zerobench
