#include <gtest/gtest.h>

#include "count_vector.h"

using namespace std;
using namespace ::testing;

namespace ptstats {
namespace {

TEST(CountVectorTest, TestIncrement) {
  CountVector counts;
  EXPECT_EQ(0, counts.Size());
  EXPECT_EQ(0, counts.Get(3));
  EXPECT_FALSE(counts.Contains(0));

  counts.Increment(3);
  counts.Increment(3);
  counts.Increment(1, 5);
  EXPECT_EQ(4, counts.Size());
  EXPECT_EQ(2, counts.Get(3));
  EXPECT_EQ(5, counts.Get(1));
  EXPECT_EQ(0, counts.Get(0));
  EXPECT_EQ(0, counts.Get(2));
  EXPECT_TRUE(counts.Contains(0));
  EXPECT_EQ(7, counts.GetTotal());
}

TEST(CountVectorTest, TestUnseenIds) {
  CountVector counts;
  counts.Increment(-1);
  EXPECT_EQ(0, counts.Size());

  counts.Increment(0);
  EXPECT_EQ(0, counts.Get(-1));
  EXPECT_EQ(0, counts.Get(100));
  EXPECT_FALSE(counts.Contains(-1));
  EXPECT_FALSE(counts.Contains(1));
  EXPECT_EQ(1, counts.Size());
}

TEST(CountVectorTest, TestEquality) {
  CountVector counts1, counts2;
  counts1.Increment(2);
  counts1.Increment(0);
  counts2.Increment(0);
  EXPECT_FALSE(counts1 == counts2);
  counts2.Increment(2);
  EXPECT_TRUE(counts1 == counts2);
}

} // namespace
} // namespace ptstats
