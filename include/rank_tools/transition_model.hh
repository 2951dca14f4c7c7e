#ifndef __TRANSITION_MODEL_HH__
#define __TRANSITION_MODEL_HH__

#include "link_graph.hh"
#include <cstddef>
#include <vector>

namespace rank_tools {

constexpr double kDefaultDamping = 0.9;

// One value per node, produced by either rank algorithm.
using RankVector = std::vector<double>;

// What to do with a node that has no outbound links.
enum class DanglingPolicy {
  Reject,   // Throw InvariantViolation naming the node
  SelfLoop, // Treat the node as linking once to itself
};

struct TransitionOptions {
  // Probability of following a link; the rest is spread uniformly.
  double damping{kDefaultDamping};
  DanglingPolicy dangling{DanglingPolicy::Reject};
};

// Dense row-stochastic matrix. At(i, j) is the probability that a surfer on
// node i visits node j next.
class TransitionMatrix {
public:
  // probabilities: row-major, size * size entries.
  // Throws std::invalid_argument if the entry count does not match.
  TransitionMatrix(size_t size, std::vector<double> probabilities);

  size_t Size() const { return size_; }
  double At(size_t i, size_t j) const { return probabilities_[i * size_ + j]; }

  // Pointer to the size entries of row i.
  const double *Row(size_t i) const { return &probabilities_[i * size_]; }

  double RowSum(size_t i) const;

private:
  size_t size_;
  std::vector<double> probabilities_;
};

// Probability of jumping to a uniformly chosen node: 1 - damping, rounded to
// 12 decimal places so that damping 0.9 yields exactly 0.1.
double TeleportProbability(double damping);

/**
 * @brief Build the transition matrix of a link graph.
 *
 * Entry (i, j) is
 *
 *     damping * count(i, j) / out_degree(i) + teleport * 1 / n
 *
 * with teleport = TeleportProbability(damping), so a surfer follows one of
 * the outbound links of i, weighted by its multiplicity, with probability `damping` and otherwise jumps to any node
 * uniformly. With damping < 1 every entry is strictly positive, which makes
 * the chain irreducible and aperiodic.
 *
 * @throws std::invalid_argument if the graph is empty or damping is not in
 * [0, 1]
 * @throws InvariantViolation if a node has no outbound links and the policy
 * is DanglingPolicy::Reject
 */
TransitionMatrix ComputeTransition(const LinkGraph &graph,
                                   const TransitionOptions &options = {});

} // namespace rank_tools

#endif
