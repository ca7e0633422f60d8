// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"

#include "omegafan/Subsets.hpp"
#include <gtest/gtest.h>

using namespace ofan;

TEST(Subsets, lex) {
  const auto subsets = subsetsLex(IndexSet{1, 2, 3, 4}, 2);
  const std::vector<IndexSet> expected = {
    {1, 2}, {1, 3}, {1, 4}, {2, 3}, {2, 4}, {3, 4}
  };
  EXPECT_EQ(expected, subsets);

  EXPECT_EQ(1u, subsetsLex(IndexSet{1, 2, 3}, 0).size());
  EXPECT_TRUE(subsetsLex(IndexSet{1, 2, 3}, 4).empty());
  EXPECT_EQ((std::vector<IndexSet>{IndexSet{5, 7, 9}}),
    subsetsLex(IndexSet{5, 7, 9}, 3));
}

TEST(Subsets, revLex) {
  const auto subsets = subsetsRevLex(IndexSet{1, 2, 3, 4}, 2);
  const std::vector<IndexSet> expected = {
    {1, 2}, {1, 3}, {2, 3}, {1, 4}, {2, 4}, {3, 4}
  };
  EXPECT_EQ(expected, subsets);

  const auto triples = subsetsRevLex(IndexSet{1, 2, 3, 4}, 3);
  const std::vector<IndexSet> expectedTriples = {
    {1, 2, 3}, {1, 2, 4}, {1, 3, 4}, {2, 3, 4}
  };
  EXPECT_EQ(expectedTriples, triples);
}

TEST(Subsets, rangeAndComplement) {
  EXPECT_EQ((IndexSet{0, 1, 2}), range(3));
  EXPECT_TRUE(range(0).empty());
  EXPECT_EQ((IndexSet{0, 2, 4}), complement(IndexSet{1, 3}, 5));
  EXPECT_TRUE(complement(range(4), 4).empty());
}

TEST(Subsets, forEachSubset) {
  std::vector<IndexSet> seen;
  EXPECT_TRUE(forEachSubset(4, 2, [&](const IndexSet& s) {
    seen.push_back(s);
    return true;
  }));
  EXPECT_EQ(subsetsLex(range(4), 2), seen);

  size_t count = 0;
  EXPECT_FALSE(forEachSubset(5, 3, [&](const IndexSet&) {
    return ++count < 4;
  }));
  EXPECT_EQ(4u, count);

  count = 0;
  forEachSubset(3, 0, [&](const IndexSet& s) {
    EXPECT_TRUE(s.empty());
    ++count;
    return true;
  });
  EXPECT_EQ(1u, count);
}
