// tests/transition_model_test.cc
#include "rank_tools/rank_errors.hh"
#include "rank_tools/transition_model.hh"

#include <gtest/gtest.h>
#include <random>

namespace rank_tools {
namespace {

constexpr double kTolerance = 1e-9;

LinkGraph Cycle(size_t n) {
  LinkGraph graph(n);
  for (size_t u = 0; u < n; ++u) {
    graph.AddLink(u, (u + 1) % n);
  }
  return graph;
}

class TransitionModelTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Random multigraph where every node has at least one link
    std::mt19937_64 rng(1234);
    std::uniform_int_distribution<size_t> node(0, kNodes - 1);
    for (size_t u = 0; u < kNodes; ++u) {
      graph_.AddLink(u, node(rng));
      for (int k = 0; k < 3; ++k) {
        graph_.AddLink(u, node(rng));
      }
    }
  }

  static constexpr size_t kNodes = 25;
  LinkGraph graph_{kNodes};
};

TEST_F(TransitionModelTest, RowsSumToOne) {
  TransitionMatrix matrix = ComputeTransition(graph_);
  for (size_t i = 0; i < matrix.Size(); ++i) {
    EXPECT_NEAR(matrix.RowSum(i), 1.0, kTolerance) << "row " << i;
  }
}

TEST_F(TransitionModelTest, EntriesNeverDropBelowTeleportFloor) {
  TransitionMatrix matrix = ComputeTransition(graph_);
  const double floor = 0.1 / static_cast<double>(kNodes);
  for (size_t i = 0; i < matrix.Size(); ++i) {
    for (size_t j = 0; j < matrix.Size(); ++j) {
      EXPECT_GE(matrix.At(i, j), floor);
      EXPECT_LE(matrix.At(i, j), 1.0);
    }
  }
}

TEST_F(TransitionModelTest, CustomDampingKeepsRowsStochastic) {
  TransitionOptions options;
  options.damping = 0.5;
  TransitionMatrix matrix = ComputeTransition(graph_, options);
  for (size_t i = 0; i < matrix.Size(); ++i) {
    EXPECT_NEAR(matrix.RowSum(i), 1.0, kTolerance);
    for (size_t j = 0; j < matrix.Size(); ++j) {
      EXPECT_GE(matrix.At(i, j), 0.5 / kNodes - kTolerance);
    }
  }
}

TEST(TransitionModelCycleTest, ThreeCycleRows) {
  TransitionMatrix matrix = ComputeTransition(Cycle(3));
  ASSERT_EQ(matrix.Size(), 3u);
  EXPECT_EQ(matrix.At(0, 0), 0.1 / 3);
  EXPECT_EQ(matrix.At(0, 1), 0.9 + 0.1 / 3);
  EXPECT_EQ(matrix.At(0, 2), 0.1 / 3);
  EXPECT_EQ(matrix.At(1, 2), 0.9 + 0.1 / 3);
  EXPECT_EQ(matrix.At(2, 0), 0.9 + 0.1 / 3);
}

TEST(TransitionModelCycleTest, TeleportTermOfLargeRing) {
  TransitionMatrix matrix = ComputeTransition(Cycle(200));
  EXPECT_EQ(matrix.At(0, 0), 0.0005);
  EXPECT_EQ(matrix.At(0, 1), 0.9 + 0.0005);
  EXPECT_EQ(matrix.At(199, 5), 0.1 / 200);
}

TEST(TeleportProbabilityTest, ComplementOfDecimalDamping) {
  EXPECT_EQ(TeleportProbability(0.9), 0.1);
  EXPECT_EQ(TeleportProbability(0.85), 0.15);
  EXPECT_EQ(TeleportProbability(0.5), 0.5);
  EXPECT_EQ(TeleportProbability(1.0), 0.0);
  EXPECT_EQ(TeleportProbability(0.0), 1.0);
}

TEST(TransitionModelCycleTest, MultiEdgesWeighTheirTarget) {
  LinkGraph graph(3);
  graph.AddLink(0, 1);
  graph.AddLink(0, 1);
  graph.AddLink(0, 2);
  graph.AddLink(1, 0);
  graph.AddLink(2, 0);
  TransitionMatrix matrix = ComputeTransition(graph);
  EXPECT_NEAR(matrix.At(0, 0), 0.1 / 3, kTolerance);
  EXPECT_NEAR(matrix.At(0, 1), 0.9 * 2 / 3 + 0.1 / 3, kTolerance);
  EXPECT_NEAR(matrix.At(0, 2), 0.9 / 3 + 0.1 / 3, kTolerance);
}

TEST(TransitionModelCycleTest, FullDampingFollowsLinksOnly) {
  TransitionOptions options;
  options.damping = 1.0;
  TransitionMatrix matrix = ComputeTransition(Cycle(3), options);
  EXPECT_DOUBLE_EQ(matrix.At(0, 1), 1.0);
  EXPECT_DOUBLE_EQ(matrix.At(0, 0), 0.0);
  EXPECT_DOUBLE_EQ(matrix.At(0, 2), 0.0);
}

TEST(TransitionModelCycleTest, ZeroDampingIsUniform) {
  TransitionOptions options;
  options.damping = 0.0;
  TransitionMatrix matrix = ComputeTransition(Cycle(4), options);
  for (size_t i = 0; i < 4; ++i) {
    for (size_t j = 0; j < 4; ++j) {
      EXPECT_DOUBLE_EQ(matrix.At(i, j), 0.25);
    }
  }
}

TEST(TransitionModelDanglingTest, RejectNamesTheNode) {
  LinkGraph graph(2);
  graph.AddLink(0, 1);
  try {
    ComputeTransition(graph);
    FAIL() << "Expected InvariantViolation";
  } catch (const InvariantViolation &e) {
    EXPECT_EQ(e.Node(), 1u);
  }
}

TEST(TransitionModelDanglingTest, SelfLoopKeepsSurferInPlace) {
  LinkGraph graph(2);
  graph.AddLink(0, 1);
  TransitionOptions options;
  options.dangling = DanglingPolicy::SelfLoop;
  TransitionMatrix matrix = ComputeTransition(graph, options);
  EXPECT_NEAR(matrix.At(1, 0), 0.05, kTolerance);
  EXPECT_NEAR(matrix.At(1, 1), 0.95, kTolerance);
  EXPECT_NEAR(matrix.At(0, 1), 0.95, kTolerance);
  EXPECT_NEAR(matrix.RowSum(1), 1.0, kTolerance);
}

TEST(TransitionModelArgumentsTest, RejectsEmptyGraph) {
  EXPECT_THROW(ComputeTransition(LinkGraph(0)), std::invalid_argument);
}

TEST(TransitionModelArgumentsTest, RejectsDampingOutsideUnitRange) {
  TransitionOptions options;
  options.damping = 1.5;
  EXPECT_THROW(ComputeTransition(Cycle(3), options), std::invalid_argument);
  options.damping = -0.1;
  EXPECT_THROW(ComputeTransition(Cycle(3), options), std::invalid_argument);
}

TEST(TransitionMatrixTest, RequiresSquareStorage) {
  EXPECT_THROW(TransitionMatrix(2, {0.5, 0.5, 1.0}), std::invalid_argument);
  TransitionMatrix matrix(2, {0.25, 0.75, 1.0, 0.0});
  EXPECT_DOUBLE_EQ(matrix.At(0, 1), 0.75);
  EXPECT_DOUBLE_EQ(matrix.Row(1)[0], 1.0);
}

} // namespace
} // namespace rank_tools
