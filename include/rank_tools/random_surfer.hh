#ifndef __RANDOM_SURFER_HH__
#define __RANDOM_SURFER_HH__

#include "transition_model.hh"
#include <cstdint>
#include <random>
#include <vector>

namespace rank_tools {

struct SurferResult {
  std::vector<uint64_t> visits; // Visit tally per node
  RankVector ranks;             // visits / steps
  uint64_t steps{0};
  int64_t run_time_ms{0};
};

// Pick the node that follows `node` for a uniform draw r in [0, 1).
// Scans the row left to right and returns the first column whose cumulative
// probability reaches r. A row that never reaches r (rounding) yields the
// last column.
size_t SampleNextNode(const TransitionMatrix &matrix, size_t node, double r);

// Estimates the stationary distribution by following a single random walk
// and counting how often each node is visited.
class RandomSurfer {
public:
  explicit RandomSurfer(std::mt19937_64 &rng);

  // Prevent copying and assignment
  RandomSurfer(const RandomSurfer &) = delete;
  RandomSurfer &operator=(const RandomSurfer &) = delete;

  // Walk num_steps steps starting from start_node. The start node itself is
  // not counted; every step counts the node moved to.
  // With num_steps == 0 all visits and ranks are zero.
  // Throws std::out_of_range if start_node is not a node of the matrix.
  SurferResult Run(const TransitionMatrix &matrix, uint64_t num_steps,
                   size_t start_node = 0);

private:
  std::mt19937_64 &rng_; // reference to external RNG
  std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace rank_tools

#endif
