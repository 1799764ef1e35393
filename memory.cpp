#include "memory.hh"

#include "error.hh"

#include <sys/mman.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <utility>

namespace zerobench {
namespace memory {

size_t page_size() {
  static const size_t size = static_cast<size_t>(::sysconf(_SC_PAGESIZE));
  return size;
}

size_t dirty_byte_count(size_t size, double dirty_fraction) {
  double bytes = std::round(static_cast<double>(size) * dirty_fraction);
  if (!(bytes > 0.0)) {
    return 0;
  }
  if (bytes >= static_cast<double>(size)) {
    return size;
  }
  return static_cast<size_t>(bytes);
}

MappedRegion MappedRegion::create(size_t size, double dirty_fraction,
                                  bool force_resident, bool huge_pages) {
  if (size == 0) {
    throw MapError(EINVAL, "mmap: zero-sized region");
  }
  void *map = ::mmap(nullptr, size, PROT_READ | PROT_WRITE,
                     MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
  if (map == MAP_FAILED) {
    throw MapError(errno, "mmap");
  }
  MappedRegion region{reinterpret_cast<uint8_t *>(map), size, dirty_fraction};
  /* A kernel without transparent huge page support rejects the advice with
     EINVAL; the region is then in base pages anyway.  */
  if (!huge_pages && ::madvise(map, size, MADV_NOHUGEPAGE) < 0 && errno != EINVAL) {
    throw MapError(errno, "madvise(MADV_NOHUGEPAGE)");
  }
  if (force_resident) {
    std::memset(region._base, 0, size);
  }
  return region;
}

MappedRegion::MappedRegion(MappedRegion&& other) noexcept
    : _base{std::exchange(other._base, nullptr)},
      _size{std::exchange(other._size, 0)},
      _dirty_fraction{other._dirty_fraction} {}

MappedRegion& MappedRegion::operator=(MappedRegion&& other) noexcept {
  if (this != &other) {
    release();
    _base = std::exchange(other._base, nullptr);
    _size = std::exchange(other._size, 0);
    _dirty_fraction = other._dirty_fraction;
  }
  return *this;
}

MappedRegion::~MappedRegion() { release(); }

void MappedRegion::dirty() {
  size_t bytes = dirty_bytes();
  if (bytes > 0) {
    std::memset(_base, dirty_pattern, bytes);
  }
}

void MappedRegion::release() noexcept {
  if (!_base) {
    return;
  }
  /* Nothing can be done about a failing munmap at this point; the mapping
     leaks until the process exits.  */
  ::munmap(_base, _size);
  _base = nullptr;
  _size = 0;
}

}  // namespace memory
}  // namespace zerobench
