#include "markov_mixing.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace rank_tools {

MarkovMixer::MarkovMixer(size_t num_threads) : num_threads_(num_threads) {
  if (num_threads == 0) {
    throw ::std::invalid_argument("Invalid number of threads (0)");
  }
}

RankVector MarkovMixer::Mix(const TransitionMatrix &matrix, uint64_t num_steps,
                            size_t start_node) const {
  if (start_node >= matrix.Size()) {
    throw std::out_of_range(fmt::format(
        "Start node {} outside graph of {} nodes", start_node, matrix.Size()));
  }
  RankVector initial(matrix.Size(), 0.0);
  initial[start_node] = 1.0;
  return Mix(matrix, num_steps, std::move(initial));
}

RankVector MarkovMixer::Mix(const TransitionMatrix &matrix, uint64_t num_steps,
                            RankVector initial) const {
  if (initial.size() != matrix.Size()) {
    throw std::invalid_argument(
        fmt::format("Initial distribution has {} entries, matrix has {} rows",
                    initial.size(), matrix.Size()));
  }

  auto start_time = std::chrono::steady_clock::now();

  RankVector rank = std::move(initial);
  RankVector next(rank.size());
  for (uint64_t t = 0; t < num_steps; ++t) {
    Step(matrix, rank, next);
    std::swap(rank, next);
  }

  auto end_time = std::chrono::steady_clock::now();
  spdlog::info("Markov mixing: {} steps over {} nodes on {} thread(s) in {} ms",
               num_steps, matrix.Size(), num_threads_,
               std::chrono::duration_cast<std::chrono::milliseconds>(
                   end_time - start_time)
                   .count());
  return rank;
}

double MarkovMixer::NextRank(const TransitionMatrix &matrix,
                             const RankVector &rank, size_t i) {
  const size_t n = matrix.Size();
  double sum = 0.0;
  for (size_t j = 0; j < n; ++j) {
    sum += rank[j] * matrix.At(j, i);
  }
  return sum;
}

void MarkovMixer::Step(const TransitionMatrix &matrix, const RankVector &rank,
                       RankVector &next) const {
  const long n = static_cast<long>(matrix.Size());
  const int workers = static_cast<int>(
      std::max<size_t>(1, std::min(num_threads_, matrix.Size())));

  // Each index is owned by one thread and summed in the same j order
  #pragma omp parallel for num_threads(workers) schedule(static) if (workers > 1)
  for (long i = 0; i < n; ++i) {
    next[static_cast<size_t>(i)] =
        NextRank(matrix, rank, static_cast<size_t>(i));
  }
}

} // namespace rank_tools
