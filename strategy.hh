#pragma once

#include "memory.hh"
#include "pagemap.hh"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace zerobench {

enum class Strategy : uint8_t {
  /// memset() the whole region.
  FullZero,
  /// madvise(MADV_DONTNEED) the whole region.
  DiscardAdvise,
  /// Ask PAGEMAP_SCAN for the written pages and zero only those.
  ScanAndZero,
  /// Pick one of the above by region size.
  Heuristic,
};

static constexpr Strategy all_strategies[] = {
    Strategy::FullZero,
    Strategy::DiscardAdvise,
    Strategy::ScanAndZero,
    Strategy::Heuristic,
};

const char *to_string(Strategy strategy);

/// Whether @strategy may end up calling the scanner.
inline bool needs_scanner(Strategy strategy) {
  return strategy == Strategy::ScanAndZero || strategy == Strategy::Heuristic;
}

struct HeuristicThresholds {
  /// Regions up to this size are zeroed with memset().
  size_t small_max = 128 * 1024;
  /// Regions of at least this size are discarded.
  size_t large_min = 1024 * 1024;
};

/// The strategy the heuristic runs for a region of @size bytes.
Strategy select_strategy(size_t size, const HeuristicThresholds& thresholds);

/// One timed reclamation.
struct StrategyResult {
  Strategy strategy;
  size_t total_size;
  double dirty_fraction;
  uint64_t duration_ns;
  /// Informational labels copied from the run configuration.
  size_t threads;
  size_t processes;
};

/// Decides, after a scan window has been zeroed, whether the rest of the
/// region is discarded instead of being scanned.
class SaturationPolicy {
 public:
  virtual ~SaturationPolicy() = default;
  virtual bool discard_remainder(const pagemap::DirtyPageSet& window) const = 0;
};

class NeverDiscard : public SaturationPolicy {
 public:
  bool discard_remainder(const pagemap::DirtyPageSet&) const override { return false; }
};

/// Gives up on scanning once a window comes back completely dirty.
class DiscardWhenSaturated : public SaturationPolicy {
 public:
  bool discard_remainder(const pagemap::DirtyPageSet& window) const override {
    return window.saturated();
  }
};

void full_zero(memory::MappedRegion& region);

/// Drops the physical backing of [base, base + length). Throws SyscallError.
void discard(void *base, size_t length);

/// Zeroes the written pages of @region, @window bytes per scan. @buffer must
/// hold pagemap::required_capacity(@window) ranges.
void scan_and_zero(memory::MappedRegion& region, size_t window,
                   pagemap::PageRangeBuffer& buffer, const SaturationPolicy& policy);

/// Runs strategies against regions, timing only the reclamation itself.
///
/// An executor owns the scan buffer, allocated on the first scan outside the
/// timed section, and is therefore used by one thread at a time. ScanAndZero (and the heuristic's ScanAndZero branch) falls back to
/// DiscardAdvise when the kernel has no PAGEMAP_SCAN.
class StrategyExecutor {
 public:
  struct Labels {
    size_t threads = 1;
    size_t processes = 1;
  };

  StrategyExecutor(size_t scan_window, const HeuristicThresholds& thresholds,
                   const SaturationPolicy& policy, Labels labels);

  StrategyResult run(Strategy strategy, memory::MappedRegion& region);

 private:
  void reclaim(Strategy strategy, memory::MappedRegion& region);
  bool scans(Strategy strategy, size_t size) const;
  pagemap::PageRangeBuffer& scan_buffer();

  size_t _scan_window;
  HeuristicThresholds _thresholds;
  const SaturationPolicy& _policy;
  Labels _labels;
  std::optional<pagemap::PageRangeBuffer> _buffer;
};

}  // namespace zerobench
