#include "pagemap.hh"

#include "error.hh"
#include "memory.hh"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

namespace zerobench {
namespace pagemap {

/* PAGEMAP_SCAN ABI from <linux/fs.h> (Linux 6.7). Declared here because
   installed kernel headers often predate it.  */
namespace abi {

enum : uint64_t {
  page_is_wpallowed = 1 << 0,
  page_is_written = 1 << 1,
  page_is_file = 1 << 2,
  page_is_present = 1 << 3,
  page_is_swapped = 1 << 4,
  page_is_pfnzero = 1 << 5,
  page_is_huge = 1 << 6,
  page_is_soft_dirty = 1 << 7,
};

struct scan_arg {
  uint64_t size;
  uint64_t flags;
  uint64_t start;
  uint64_t end;
  uint64_t walk_end;
  uint64_t vec;
  uint64_t vec_len;
  uint64_t max_pages;
  uint64_t category_inverted;
  uint64_t category_mask;
  uint64_t category_anyof_mask;
  uint64_t return_mask;
};

static constexpr unsigned long pagemap_scan = _IOWR('f', 16, struct scan_arg);

}  // namespace abi

namespace {

/// Fills @arg with a query for dirty pages in [start, end): pages that are
/// present or swapped out and not mapped to the shared zero page.
void prepare_dirty_query(abi::scan_arg& arg, uint64_t start, uint64_t end, PageRange *vec,
                         size_t vec_len) {
  std::memset(&arg, 0, sizeof(arg));
  arg.size = sizeof(arg);
  arg.start = start;
  arg.end = end;
  arg.vec = reinterpret_cast<uintptr_t>(vec);
  arg.vec_len = vec_len;
  arg.category_anyof_mask = abi::page_is_present | abi::page_is_swapped;
  arg.category_mask = abi::page_is_pfnzero;
  arg.category_inverted = abi::page_is_pfnzero;
  arg.return_mask = abi::page_is_present | abi::page_is_swapped;
}

/// Open /proc/self/pagemap, shared by every scan in the process.
class PagemapFile {
  int _fd = -1;
  std::string _reason;

  /// Number of dirty ranges the kernel reports for @region, or -1 with
  /// _reason set.
  int count_dirty(const memory::MappedRegion& region) {
    PageRange ranges[1];
    abi::scan_arg arg;
    uint64_t start = reinterpret_cast<uintptr_t>(region.data());
    prepare_dirty_query(arg, start, start + region.size(), ranges, 1);
    int ret = ::ioctl(_fd, abi::pagemap_scan, &arg);
    if (ret < 0) {
      _reason = std::string("ioctl(PAGEMAP_SCAN): ") + std::strerror(errno);
    }
    return ret;
  }

  /// A page that was never touched must come back clean and one that was
  /// written must come back dirty.
  bool reports_dirty_pages() {
    try {
      auto region = memory::MappedRegion::create(memory::page_size(), 1.0, false);
      int untouched = count_dirty(region);
      if (untouched < 0) {
        return false;
      }
      region.dirty();
      int written = count_dirty(region);
      if (written < 0) {
        return false;
      }
      if (untouched != 0 || written != 1) {
        _reason = "kernel does not report dirty pages reliably";
        return false;
      }
      return true;
    } catch (const MapError& e) {
      _reason = e.what();
      return false;
    }
  }

 public:
  PagemapFile() {
    _fd = ::open("/proc/self/pagemap", O_RDONLY | O_CLOEXEC);
    if (_fd < 0) {
      _reason = std::string("/proc/self/pagemap: ") + std::strerror(errno);
      return;
    }
    if (!reports_dirty_pages()) {
      ::close(_fd);
      _fd = -1;
    }
  }

  ~PagemapFile() {
    if (_fd >= 0) {
      ::close(_fd);
    }
  }

  PagemapFile(const PagemapFile&) = delete;
  PagemapFile& operator=(const PagemapFile&) = delete;

  bool supported() const { return _fd >= 0; }
  int fd() const { return _fd; }
  const std::string& reason() const { return _reason; }
};

const PagemapFile& pagemap_file() {
  static const PagemapFile file;
  return file;
}

/// Appends @added freshly reported ranges that follow @filled coalesced ones,
/// merging any that touch their predecessor. Returns the new prefix length.
size_t coalesce(PageRange *ranges, size_t filled, size_t added) {
  size_t out = filled;
  for (size_t i = filled; i < filled + added; i++) {
    if (out > 0 && ranges[out - 1].end >= ranges[i].start) {
      ranges[out - 1].end = std::max(ranges[out - 1].end, ranges[i].end);
      ranges[out - 1].categories |= ranges[i].categories;
    } else {
      ranges[out++] = ranges[i];
    }
  }
  return out;
}

}  // namespace

uint64_t DirtyPageSet::total_bytes() const {
  uint64_t total = 0;
  for (const auto& range : *this) {
    total += range.length();
  }
  return total;
}

bool supported() { return pagemap_file().supported(); }

size_t required_capacity(size_t length) { return length / memory::page_size(); }

DirtyPageSet scan(const void *base, size_t length, PageRangeBuffer& buffer) {
  const uint64_t start = reinterpret_cast<uintptr_t>(base);
  if (!memory::is_page_aligned(start) || !memory::is_page_aligned(length)) {
    throw UnalignedRegion("scan window [" + std::to_string(start) + ", +" +
                          std::to_string(length) + ") is not page aligned");
  }
  const uint64_t end = start + length;
  PageRange *ranges = buffer.data();
  if (length == 0) {
    return DirtyPageSet{ranges, 0, start, end, end};
  }
  const PagemapFile& file = pagemap_file();
  if (!file.supported()) {
    throw UnsupportedCapability("PAGEMAP_SCAN is not available: " + file.reason());
  }
  size_t filled = 0;
  uint64_t cursor = start;
  while (cursor < end && filled < buffer.capacity()) {
    abi::scan_arg arg;
    prepare_dirty_query(arg, cursor, end, ranges + filled, buffer.capacity() - filled);
    int ret = ::ioctl(file.fd(), abi::pagemap_scan, &arg);
    if (ret < 0) {
      throw SyscallError(errno, "ioctl(PAGEMAP_SCAN)");
    }
    filled = coalesce(ranges, filled, static_cast<size_t>(ret));
    if (arg.walk_end <= cursor) {
      break;
    }
    cursor = arg.walk_end;
  }
  return DirtyPageSet{ranges, filled, start, end, std::min(cursor, end)};
}

}  // namespace pagemap
}  // namespace zerobench
