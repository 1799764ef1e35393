#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace zerobench {
namespace pagemap {

/// A page-aligned [start, end) address range. Laid out like the kernel's
/// struct page_region so that PAGEMAP_SCAN writes straight into it.
struct PageRange {
  uint64_t start;
  uint64_t end;
  uint64_t categories;

  uint64_t length() const { return end - start; }
};

static_assert(sizeof(PageRange) == 3 * sizeof(uint64_t), "must match struct page_region");

/// Fixed-capacity storage for scan results. The slots are left
/// uninitialized; a DirtyPageSet exposes only the prefix a scan filled.
class PageRangeBuffer {
  std::unique_ptr<PageRange[]> _ranges;
  size_t _capacity;

 public:
  explicit PageRangeBuffer(size_t capacity)
      : _ranges{new PageRange[capacity]}, _capacity{capacity} {}

  PageRange *data() { return _ranges.get(); }
  size_t capacity() const { return _capacity; }
};

/// The dirty pages found in a scanned window: ascending, disjoint and
/// non-adjacent ranges.
class DirtyPageSet {
  const PageRange *_ranges;
  size_t _count;
  uint64_t _window_start;
  uint64_t _window_end;
  uint64_t _scanned_end;

 public:
  DirtyPageSet(const PageRange *ranges, size_t count, uint64_t window_start,
               uint64_t window_end, uint64_t scanned_end)
      : _ranges{ranges},
        _count{count},
        _window_start{window_start},
        _window_end{window_end},
        _scanned_end{scanned_end} {}

  const PageRange *begin() const { return _ranges; }
  const PageRange *end() const { return _ranges + _count; }
  const PageRange& operator[](size_t idx) const { return _ranges[idx]; }
  size_t size() const { return _count; }
  bool empty() const { return _count == 0; }

  uint64_t window_start() const { return _window_start; }
  uint64_t window_end() const { return _window_end; }
  uint64_t window_length() const { return _window_end - _window_start; }

  /// Address up to which the kernel walked. Short of window_end() when the
  /// buffer ran out of slots.
  uint64_t scanned_end() const { return _scanned_end; }
  bool complete() const { return _scanned_end >= _window_end; }

  /// Sum of all range lengths.
  uint64_t total_bytes() const;

  /// The whole window is dirty.
  bool saturated() const { return complete() && total_bytes() == window_length(); }
};

/// Whether the running kernel supports PAGEMAP_SCAN. Checked once per
/// process; thread-safe.
bool supported();

/// Worst-case number of ranges a scan of @length bytes can produce.
size_t required_capacity(size_t length);

/// Returns the pages in [base, base + length) that were written to, without
/// touching their contents.
///
/// Throws UnalignedRegion if @base or @length is not page aligned,
/// UnsupportedCapability if the kernel lacks PAGEMAP_SCAN and SyscallError
/// for any other failure. The result refers to @buffer and is valid as long
/// as @buffer is not reused.
DirtyPageSet scan(const void *base, size_t length, PageRangeBuffer& buffer);

}  // namespace pagemap
}  // namespace zerobench
