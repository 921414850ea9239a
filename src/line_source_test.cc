#include "line_source.hh"

#include <gtest/gtest.h>

using namespace chunkview;

TEST(NormalLineSource, pads_past_the_end) {
  NormalLineSource source({"a", "b", "c"});
  EXPECT_EQ(source.line_count(), 3u);
  EXPECT_EQ(source.last_index(), 2);
  EXPECT_EQ(source.lines(1, 4), Lines({"b", "c", "", ""}));
  EXPECT_EQ(source.lines(10, 2), Lines({"", ""}));
  EXPECT_TRUE(source.settled());
}

TEST(NormalLineSource, append_and_clear) {
  NormalLineSource source;
  EXPECT_EQ(source.last_index(), -1);
  ASSERT_TRUE(source.append_lines({"x", "y"}));
  ASSERT_TRUE(source.append_lines({"z"}));
  EXPECT_EQ(source.lines(0, 3), Lines({"x", "y", "z"}));

  source.clear();
  EXPECT_EQ(source.line_count(), 0u);
  EXPECT_EQ(source.lines(0, 1), Lines({""}));
}
