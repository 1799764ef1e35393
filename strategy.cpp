#include "strategy.hh"

#include "error.hh"
#include "timing.hh"

#include <sys/mman.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace zerobench {

const char *to_string(Strategy strategy) {
  switch (strategy) {
    case Strategy::FullZero:
      return "FullZero";
    case Strategy::DiscardAdvise:
      return "DiscardAdvise";
    case Strategy::ScanAndZero:
      return "ScanAndZero";
    case Strategy::Heuristic:
      return "Heuristic";
  }
  return "Unknown";
}

Strategy select_strategy(size_t size, const HeuristicThresholds& thresholds) {
  if (size <= thresholds.small_max) {
    /* System call overhead dominates at this scale.  */
    return Strategy::FullZero;
  }
  if (size >= thresholds.large_min) {
    return Strategy::DiscardAdvise;
  }
  return Strategy::ScanAndZero;
}

void full_zero(memory::MappedRegion& region) {
  std::memset(region.data(), 0, region.size());
}

void discard(void *base, size_t length) {
  if (::madvise(base, length, MADV_DONTNEED) < 0) {
    throw SyscallError(errno, "madvise(MADV_DONTNEED)");
  }
}

void scan_and_zero(memory::MappedRegion& region, size_t window,
                   pagemap::PageRangeBuffer& buffer, const SaturationPolicy& policy) {
  size_t offset = 0;
  while (offset < region.size()) {
    size_t length = std::min(window, region.size() - offset);
    auto dirty = pagemap::scan(region.data() + offset, length, buffer);
    for (const auto& range : dirty) {
      std::memset(reinterpret_cast<void *>(range.start), 0, range.length());
    }
    size_t scanned = dirty.scanned_end() - dirty.window_start();
    if (scanned == 0) {
      throw SyscallError(ENOBUFS, "PAGEMAP_SCAN made no progress");
    }
    offset += scanned;
    if (offset < region.size() && policy.discard_remainder(dirty)) {
      discard(region.data() + offset, region.size() - offset);
      return;
    }
  }
}

StrategyExecutor::StrategyExecutor(size_t scan_window, const HeuristicThresholds& thresholds,
                                   const SaturationPolicy& policy, Labels labels)
    : _scan_window{scan_window},
      _thresholds{thresholds},
      _policy{policy},
      _labels{labels} {}

bool StrategyExecutor::scans(Strategy strategy, size_t size) const {
  if (strategy == Strategy::Heuristic) {
    strategy = select_strategy(size, _thresholds);
  }
  return strategy == Strategy::ScanAndZero && pagemap::supported();
}

pagemap::PageRangeBuffer& StrategyExecutor::scan_buffer() {
  if (!_buffer) {
    _buffer.emplace(pagemap::required_capacity(_scan_window));
  }
  return *_buffer;
}

StrategyResult StrategyExecutor::run(Strategy strategy, memory::MappedRegion& region) {
  if (scans(strategy, region.size())) {
    scan_buffer();
  }
  uint64_t start = timing::now_ns();
  reclaim(strategy, region);
  uint64_t end = timing::now_ns();
  return StrategyResult{
      strategy,
      region.size(),
      region.dirty_fraction(),
      timing::time_diff(start, end),
      _labels.threads,
      _labels.processes,
  };
}

void StrategyExecutor::reclaim(Strategy strategy, memory::MappedRegion& region) {
  switch (strategy) {
    case Strategy::FullZero:
      full_zero(region);
      return;
    case Strategy::ScanAndZero:
      if (pagemap::supported()) {
        scan_and_zero(region, _scan_window, scan_buffer(), _policy);
        return;
      }
      /* No PAGEMAP_SCAN on this kernel.  */
      discard(region.data(), region.size());
      return;
    case Strategy::DiscardAdvise:
      discard(region.data(), region.size());
      return;
    case Strategy::Heuristic:
      reclaim(select_strategy(region.size(), _thresholds), region);
      return;
  }
}

}  // namespace zerobench
