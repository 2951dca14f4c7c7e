#include "random_surfer.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"

#include <chrono>
#include <stdexcept>

namespace rank_tools {

size_t SampleNextNode(const TransitionMatrix &matrix, size_t node, double r) {
  const size_t n = matrix.Size();
  const double *row = matrix.Row(node);
  double psum = 0.0;

  for (size_t j = 0; j < n; ++j) {
    psum += row[j];
    if (psum >= r) {
      return j;
    }
  }
  return n - 1;
}

RandomSurfer::RandomSurfer(std::mt19937_64 &rng) : rng_(rng) {}

SurferResult RandomSurfer::Run(const TransitionMatrix &matrix,
                               uint64_t num_steps, size_t start_node) {
  const size_t n = matrix.Size();
  if (start_node >= n) {
    throw std::out_of_range(fmt::format(
        "Start node {} outside graph of {} nodes", start_node, n));
  }

  auto start_time = std::chrono::steady_clock::now();

  SurferResult result;
  result.steps = num_steps;
  result.visits.assign(n, 0);
  result.ranks.assign(n, 0.0);

  size_t page = start_node;
  for (uint64_t t = 0; t < num_steps; ++t) {
    page = SampleNextNode(matrix, page, dist_(rng_));
    ++result.visits[page];
  }

  if (num_steps == 0) {
    spdlog::warn("Random surfer ran for 0 steps, all ranks are zero");
  } else {
    for (size_t i = 0; i < n; ++i) {
      result.ranks[i] = static_cast<double>(result.visits[i]) /
                        static_cast<double>(num_steps);
    }
  }

  auto end_time = std::chrono::steady_clock::now();
  result.run_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           end_time - start_time)
                           .count();
  spdlog::info("Random surfer: {} steps over {} nodes in {} ms", num_steps, n,
               result.run_time_ms);
  return result;
}

} // namespace rank_tools
