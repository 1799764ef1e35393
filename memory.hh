#pragma once

#include <cstddef>
#include <cstdint>

namespace zerobench {
namespace memory {

/// Force a read from memory location @addr even if the result is not used.
template <typename T>
inline T force_read(volatile T *addr) {
  return *addr;
}

/// The byte pattern written into the dirty prefix of a region.
static constexpr uint8_t dirty_pattern = 0xAA;

size_t page_size();

inline bool is_page_aligned(uint64_t value) {
  return (value & (page_size() - 1)) == 0;
}

inline uint64_t round_up_to_page(uint64_t value) {
  const uint64_t mask = page_size() - 1;
  return (value + mask) & ~mask;
}

/// Number of bytes dirty() writes: round(size * fraction), clamped to
/// [0, size].
size_t dirty_byte_count(size_t size, double dirty_fraction);

/// An anonymous private read-write mapping, unmapped on destruction.
class MappedRegion {
 public:
  /// Maps @size bytes. Throws MapError if the kernel refuses.
  ///
  /// Unless @huge_pages is set the region is advised MADV_NOHUGEPAGE so that
  /// the kernel tracks it in base pages. With @force_resident every page is
  /// faulted in by writing zeros before returning.
  static MappedRegion create(size_t size, double dirty_fraction,
                             bool force_resident, bool huge_pages = false);

  MappedRegion(MappedRegion&& other) noexcept;
  MappedRegion& operator=(MappedRegion&& other) noexcept;
  MappedRegion(const MappedRegion&) = delete;
  MappedRegion& operator=(const MappedRegion&) = delete;
  ~MappedRegion();

  /// Writes the dirty pattern over the first dirty_bytes() bytes.
  void dirty();

  size_t dirty_bytes() const { return dirty_byte_count(_size, _dirty_fraction); }

  uint8_t *data() { return _base; }
  const uint8_t *data() const { return _base; }
  size_t size() const { return _size; }
  double dirty_fraction() const { return _dirty_fraction; }

 private:
  MappedRegion(uint8_t *base, size_t size, double dirty_fraction)
      : _base{base}, _size{size}, _dirty_fraction{dirty_fraction} {}

  void release() noexcept;

  uint8_t *_base = nullptr;
  size_t _size = 0;
  double _dirty_fraction = 0.0;
};

}  // namespace memory
}  // namespace zerobench
