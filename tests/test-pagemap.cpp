#include "error.hh"
#include "memory.hh"
#include "pagemap.hh"

#include <gtest/gtest.h>

#include <cstring>

using namespace zerobench;

namespace {

#define REQUIRE_PAGEMAP_SCAN()                                   \
  do {                                                           \
    if (!pagemap::supported()) {                                 \
      GTEST_SKIP() << "kernel does not support PAGEMAP_SCAN";    \
    }                                                            \
  } while (0)

void expect_well_formed(const pagemap::DirtyPageSet& set) {
  const size_t page_size = memory::page_size();
  for (size_t i = 0; i < set.size(); i++) {
    const auto& range = set[i];
    EXPECT_LT(range.start, range.end);
    EXPECT_EQ(range.start % page_size, 0u);
    EXPECT_EQ(range.end % page_size, 0u);
    EXPECT_GE(range.start, set.window_start());
    EXPECT_LE(range.end, set.window_end());
    if (i > 0) {
      /* Ascending, disjoint and never touching the previous range.  */
      EXPECT_LT(set[i - 1].end, range.start);
    }
  }
  EXPECT_LE(set.total_bytes(), set.window_length());
}

uint64_t address_of(const uint8_t *p) { return reinterpret_cast<uintptr_t>(p); }

}  // namespace

TEST(Pagemap, RequiredCapacityIsOneRangePerPage) {
  EXPECT_EQ(pagemap::required_capacity(0), 0u);
  EXPECT_EQ(pagemap::required_capacity(memory::page_size()), 1u);
  EXPECT_EQ(pagemap::required_capacity(64 * memory::page_size()), 64u);
}

TEST(Pagemap, SupportIsStable) {
  bool first = pagemap::supported();
  EXPECT_EQ(pagemap::supported(), first);
}

TEST(Pagemap, UnalignedBaseIsRejected) {
  auto region = memory::MappedRegion::create(4 * memory::page_size(), 0.0, false);
  pagemap::PageRangeBuffer buffer{4};
  EXPECT_THROW(pagemap::scan(region.data() + 1, memory::page_size(), buffer), UnalignedRegion);
}

TEST(Pagemap, UnalignedLengthIsRejected) {
  auto region = memory::MappedRegion::create(4 * memory::page_size(), 0.0, false);
  pagemap::PageRangeBuffer buffer{4};
  EXPECT_THROW(pagemap::scan(region.data(), memory::page_size() + 7, buffer), UnalignedRegion);
}

TEST(Pagemap, EmptyWindowIsEmpty) {
  auto region = memory::MappedRegion::create(memory::page_size(), 1.0, false);
  region.dirty();
  pagemap::PageRangeBuffer buffer{1};
  auto set = pagemap::scan(region.data(), 0, buffer);
  EXPECT_TRUE(set.empty());
  EXPECT_TRUE(set.complete());
}

TEST(Pagemap, CleanRegionHasNoDirtyPages) {
  REQUIRE_PAGEMAP_SCAN();
  const size_t size = 64 * memory::page_size();
  auto region = memory::MappedRegion::create(size, 0.0, false);
  region.dirty();
  pagemap::PageRangeBuffer buffer{pagemap::required_capacity(size)};
  auto set = pagemap::scan(region.data(), size, buffer);
  EXPECT_TRUE(set.empty());
  EXPECT_TRUE(set.complete());
  EXPECT_EQ(set.total_bytes(), 0u);
}

TEST(Pagemap, ReadOnlyPagesAreNotDirty) {
  REQUIRE_PAGEMAP_SCAN();
  const size_t size = 8 * memory::page_size();
  auto region = memory::MappedRegion::create(size, 0.0, false);
  for (size_t i = 0; i < size; i += memory::page_size()) {
    memory::force_read(region.data() + i);
  }
  pagemap::PageRangeBuffer buffer{pagemap::required_capacity(size)};
  auto set = pagemap::scan(region.data(), size, buffer);
  EXPECT_TRUE(set.empty());
}

TEST(Pagemap, FullyDirtyRegionIsOneRange) {
  REQUIRE_PAGEMAP_SCAN();
  const size_t size = 64 * memory::page_size();
  auto region = memory::MappedRegion::create(size, 1.0, false);
  region.dirty();
  pagemap::PageRangeBuffer buffer{pagemap::required_capacity(size)};
  auto set = pagemap::scan(region.data(), size, buffer);
  expect_well_formed(set);
  ASSERT_EQ(set.size(), 1u);
  EXPECT_EQ(set[0].start, address_of(region.data()));
  EXPECT_EQ(set.total_bytes(), size);
  EXPECT_TRUE(set.saturated());
}

TEST(Pagemap, DirtyPrefixRoundsUpToPages) {
  REQUIRE_PAGEMAP_SCAN();
  const size_t size = 1024 * 1024;
  auto region = memory::MappedRegion::create(size, 0.1, false);
  region.dirty();
  ASSERT_EQ(region.dirty_bytes(), 104858u);
  pagemap::PageRangeBuffer buffer{pagemap::required_capacity(size)};
  auto set = pagemap::scan(region.data(), size, buffer);
  expect_well_formed(set);
  EXPECT_TRUE(set.complete());
  EXPECT_FALSE(set.saturated());
  uint64_t total = memory::round_up_to_page(set.total_bytes());
  EXPECT_GE(total, 104858u);
  EXPECT_LE(total, 104858u + memory::page_size() - 1);
}

TEST(Pagemap, SparsePagesStaySeparate) {
  REQUIRE_PAGEMAP_SCAN();
  const size_t page_size = memory::page_size();
  const size_t size = 32 * page_size;
  auto region = memory::MappedRegion::create(size, 0.0, false);
  for (size_t page = 0; page < 32; page += 2) {
    region.data()[page * page_size] = 1;
  }
  pagemap::PageRangeBuffer buffer{pagemap::required_capacity(size)};
  auto set = pagemap::scan(region.data(), size, buffer);
  expect_well_formed(set);
  ASSERT_EQ(set.size(), 16u);
  for (size_t i = 0; i < set.size(); i++) {
    EXPECT_EQ(set[i].start, address_of(region.data() + 2 * i * page_size));
    EXPECT_EQ(set[i].length(), page_size);
  }
}

TEST(Pagemap, SmallBufferStopsEarly) {
  REQUIRE_PAGEMAP_SCAN();
  const size_t page_size = memory::page_size();
  const size_t size = 32 * page_size;
  auto region = memory::MappedRegion::create(size, 0.0, false);
  for (size_t page = 0; page < 32; page += 4) {
    std::memset(region.data() + page * page_size, 1, page_size);
  }
  pagemap::PageRangeBuffer buffer{3};
  auto set = pagemap::scan(region.data(), size, buffer);
  expect_well_formed(set);
  EXPECT_EQ(set.size(), 3u);
  EXPECT_FALSE(set.complete());
  EXPECT_LT(set.scanned_end(), set.window_end());
  EXPECT_GE(set.scanned_end(), set[2].end);
}

TEST(Pagemap, SubWindowOnlyReportsItsPages) {
  REQUIRE_PAGEMAP_SCAN();
  const size_t page_size = memory::page_size();
  const size_t size = 16 * page_size;
  auto region = memory::MappedRegion::create(size, 1.0, false);
  region.dirty();
  pagemap::PageRangeBuffer buffer{4};
  auto set = pagemap::scan(region.data() + 8 * page_size, 4 * page_size, buffer);
  expect_well_formed(set);
  ASSERT_EQ(set.size(), 1u);
  EXPECT_EQ(set[0].start, address_of(region.data() + 8 * page_size));
  EXPECT_EQ(set[0].end, address_of(region.data() + 12 * page_size));
}

TEST(DirtyPageSet, SaturationNeedsCompleteCoverage) {
  pagemap::PageRange ranges[] = {
      {0x1000, 0x3000, 0},
  };
  pagemap::DirtyPageSet full{ranges, 1, 0x1000, 0x3000, 0x3000};
  EXPECT_TRUE(full.saturated());
  pagemap::DirtyPageSet partial{ranges, 1, 0x1000, 0x4000, 0x4000};
  EXPECT_FALSE(partial.saturated());
  pagemap::DirtyPageSet truncated{ranges, 1, 0x1000, 0x3000, 0x2000};
  EXPECT_FALSE(truncated.saturated());
}
