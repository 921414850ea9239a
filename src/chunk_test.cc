#include "chunk.hh"

#include <gtest/gtest.h>

using namespace chunkview;

// NOLINTBEGIN
const char* file;
int line;
const char* message;
// NOLINTEND

#define SET_SCOPE(msg)  \
  file = __FILE_NAME__; \
  line = __LINE__;      \
  message = #msg;

void test_views(LineNo first, uint64_t count, size_t size,
                std::vector<ChunkView> vs) {
  static constexpr uint32_t chunk_size = 10;
  ::testing::ScopedTrace trace(file, line, message);
  auto ret = calculate_chunk_views(first, count, chunk_size);
  ASSERT_EQ(ret.size(), size);
  for (size_t i = 0; i < vs.size(); i++) {
    ASSERT_EQ(vs[i], ret[i]);
  }
}

TEST(chunk_of, boundaries) {
  EXPECT_EQ(chunk_of(0, 10), 0u);
  EXPECT_EQ(chunk_of(9, 10), 0u);
  EXPECT_EQ(chunk_of(10, 10), 1u);
  EXPECT_EQ(chunk_of(49'999, 50'000), 0u);
  EXPECT_EQ(chunk_of(50'000, 50'000), 1u);
}

TEST(addressable, chunk_id_limit) {
  constexpr auto kMaxID = std::numeric_limits<ChunkID>::max();
  constexpr auto kMaxLine = std::numeric_limits<LineNo>::max();

  EXPECT_TRUE(addressable(0, 0, 10));
  EXPECT_TRUE(addressable(50'000, 10, 50'000));
  // the last line sits in chunk kMaxID - 2, its neighbor still fits
  EXPECT_TRUE(addressable(0, static_cast<LineNo>(kMaxID - 1) * 10, 10));
  EXPECT_FALSE(addressable(0, static_cast<LineNo>(kMaxID - 1) * 10 + 1, 10));
  EXPECT_FALSE(addressable(static_cast<LineNo>(kMaxID) * 10, 1, 10));
  EXPECT_FALSE(addressable(kMaxLine - 2, 5, 10));
}

TEST(calculate_chunk_views, single_chunk) {
  SET_SCOPE(whole);
  test_views(0, 10, 1, {{0, 0, 10}});

  SET_SCOPE(head);
  test_views(10, 7, 1, {{1, 0, 7}});

  SET_SCOPE(middle);
  test_views(12, 5, 1, {{1, 2, 5}});

  SET_SCOPE(tail);
  test_views(23, 7, 1, {{2, 3, 7}});
}

TEST(calculate_chunk_views, viewport_across_boundary) {
  SET_SCOPE(aligned_end);
  test_views(5, 10, 2, {{0, 5, 5}, {1, 0, 5}});

  SET_SCOPE(one_line_in_next);
  test_views(9, 2, 2, {{0, 9, 1}, {1, 0, 1}});

  SET_SCOPE(last_line_of_chunk);
  test_views(15, 5, 1, {{1, 5, 5}});
}

TEST(calculate_chunk_views, many_chunks) {
  SET_SCOPE(aligned);
  test_views(10, 20, 2, {{1, 0, 10}, {2, 0, 10}});

  SET_SCOPE(unaligned);
  test_views(12, 35, 4, {{1, 2, 8}, {2, 0, 10}, {3, 0, 10}, {4, 0, 7}});
}

TEST(calculate_chunk_views, empty_range) {
  auto ret = calculate_chunk_views(20, 0, 10);
  EXPECT_TRUE(ret.empty());

  // an unaligned empty range may yield one zero length view
  for (auto& v : calculate_chunk_views(25, 0, 10)) {
    EXPECT_EQ(v.length_, 0);
  }
}
