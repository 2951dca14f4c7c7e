// tests/rank_report_test.cc
#include "rank_tools/rank_report.hh"

#include <gtest/gtest.h>
#include <sstream>

namespace rank_tools {
namespace {

TEST(RankReportTest, ThreeDecimalsEachFollowedBySpace) {
  RankVector ranks{0.1 / 3, 0.9 + 0.1 / 3, 0.1 / 3};
  EXPECT_EQ(FormatRankLine(ranks), "0.033 0.933 0.033 ");
}

TEST(RankReportTest, WriteRanksEndsLine) {
  std::ostringstream out;
  WriteRanks(out, {1.0, 0.0});
  EXPECT_EQ(out.str(), "1.000 0.000 \n");
}

TEST(RankReportTest, EmptyVectorIsBareNewline) {
  std::ostringstream out;
  WriteRanks(out, {});
  EXPECT_EQ(out.str(), "\n");
}

TEST(RankReportTest, PrecisionIsConfigurable) {
  EXPECT_EQ(FormatRankLine({0.123456}, 5), "0.12346 ");
}

TEST(RankReportTest, TopNodesHighestFirst) {
  auto top = TopNodes({0.1, 0.4, 0.2, 0.3}, 2);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].first, 1u);
  EXPECT_EQ(top[1].first, 3u);
  EXPECT_DOUBLE_EQ(top[0].second, 0.4);
}

TEST(RankReportTest, TopNodesTiesKeepNodeOrder) {
  auto top = TopNodes({0.25, 0.25, 0.25, 0.25}, 3);
  ASSERT_EQ(top.size(), 3u);
  EXPECT_EQ(top[0].first, 0u);
  EXPECT_EQ(top[1].first, 1u);
  EXPECT_EQ(top[2].first, 2u);
}

TEST(RankReportTest, TopNodesClampsToGraphSize) {
  EXPECT_EQ(TopNodes({0.5, 0.5}, 10).size(), 2u);
  EXPECT_TRUE(TopNodes({0.5, 0.5}, 0).empty());
}

TEST(RankReportTest, WriteTopNodesListsOnePerLine) {
  std::ostringstream out;
  WriteTopNodes(out, {0.2, 0.8}, 2, 3);
  EXPECT_EQ(out.str(), "node 1: 0.800\nnode 0: 0.200\n");
}

} // namespace
} // namespace rank_tools
