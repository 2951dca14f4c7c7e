#ifndef __MARKOV_MIXING_HH__
#define __MARKOV_MIXING_HH__

#include "transition_model.hh"
#include <cstddef>
#include <cstdint>

namespace rank_tools {

// Power iteration of a probability distribution against a transition matrix.
class MarkovMixer {
public:
  explicit MarkovMixer(size_t num_threads = 1);

  // Start with all mass on start_node and apply num_steps steps.
  // Throws std::out_of_range if start_node is not a node of the matrix.
  RankVector Mix(const TransitionMatrix &matrix, uint64_t num_steps,
                 size_t start_node = 0) const;

  // Start from an explicit distribution.
  // Throws std::invalid_argument if its length differs from the matrix size.
  RankVector Mix(const TransitionMatrix &matrix, uint64_t num_steps,
                 RankVector initial) const;

  size_t NumThreads() const { return num_threads_; }

private:
  // sum_j rank[j] * T(j, i) with j ascending.
  static double NextRank(const TransitionMatrix &matrix,
                         const RankVector &rank, size_t i);

  // One full step; output indices are shared among up to num_threads_
  // OpenMP threads.
  void Step(const TransitionMatrix &matrix, const RankVector &rank,
            RankVector &next) const;

  size_t num_threads_;
};

} // namespace rank_tools

#endif
