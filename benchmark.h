#pragma once

#include "strategy.hh"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace zerobench {

using ThreadVector = std::vector<std::thread>;

struct Config {
  /// Size of every mapped region in bytes.
  size_t total_size = 1024 * 1024 * 1024;
  /// Fraction of each region written before reclamation.
  double dirty_fraction = 0.1;
  /// Number of worker threads.
  size_t threads = 1;
  /// Number of concurrently running benchmark processes (label only).
  size_t processes = 1;
  /// Iterations per worker thread.
  uint64_t iterations = 1;
  /// Strategies measured each iteration, in this order.
  std::vector<Strategy> strategies{std::begin(all_strategies), std::end(all_strategies)};
  /// Bytes covered by one scan. Zero means the whole region.
  size_t scan_window = 0;
  /// Fault in every page of a region before dirtying it.
  bool force_resident = false;
  /// Leave transparent huge pages enabled on the regions.
  bool huge_pages = false;
  /// Bind worker threads to processing units.
  bool pin_threads = false;
  /// Discard the rest of a region once a scan window comes back fully dirty.
  bool substitute_discard = true;
  HeuristicThresholds thresholds;

  size_t effective_scan_window() const { return scan_window ? scan_window : total_size; }
};

/// A strategy invocation that was aborted by a failing system call.
struct Failure {
  Strategy strategy;
  std::string message;
};

struct RunResults {
  std::vector<StrategyResult> results;
  std::vector<Failure> failures;
};

/// Append-only result storage shared by the workers.
class ResultCollector {
  std::mutex _mutex;
  RunResults _run;

 public:
  void append(const StrategyResult& result) {
    std::lock_guard<std::mutex> guard{_mutex};
    _run.results.push_back(result);
  }

  void fail(Failure failure) {
    std::lock_guard<std::mutex> guard{_mutex};
    _run.failures.push_back(std::move(failure));
  }

  RunResults take() {
    std::lock_guard<std::mutex> guard{_mutex};
    return std::move(_run);
  }
};

class Topology;

/// Runs every configured strategy on a pool of worker threads.
///
/// Each worker maps a fresh region per strategy and iteration, dirties it and
/// times its reclamation. A failing system call inside a strategy is recorded
/// as a Failure and the worker moves on; a failing mapping stops the worker
/// and is rethrown from run() once all workers have finished.
class BenchmarkHarness {
  Config _cfg;
  std::unique_ptr<SaturationPolicy> _policy;

 public:
  explicit BenchmarkHarness(const Config& cfg);
  ~BenchmarkHarness();

  RunResults run();

 private:
  void worker(size_t tid, ResultCollector& collector, const Topology *topology);
};

}  // namespace zerobench
