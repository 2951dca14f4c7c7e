#include "transition_model.hh"
#include "rank_errors.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace rank_tools {

TransitionMatrix::TransitionMatrix(size_t size,
                                   std::vector<double> probabilities)
    : size_(size), probabilities_(std::move(probabilities)) {
  if (probabilities_.size() != size_ * size_) {
    throw std::invalid_argument(
        fmt::format("Transition matrix of size {} needs {} entries, got {}",
                    size_, size_ * size_, probabilities_.size()));
  }
}

double TransitionMatrix::RowSum(size_t i) const {
  const double *row = Row(i);
  double sum = 0.0;
  for (size_t j = 0; j < size_; ++j) {
    sum += row[j];
  }
  return sum;
}

double TeleportProbability(double damping) {
  constexpr double kScale = 1e12;
  return std::round((1.0 - damping) * kScale) / kScale;
}

TransitionMatrix ComputeTransition(const LinkGraph &graph,
                                   const TransitionOptions &options) {
  const size_t n = graph.NumNodes();
  if (n == 0) {
    throw std::invalid_argument("Cannot rank an empty graph");
  }
  // Negated so that NaN is refused as well
  if (!(options.damping >= 0.0 && options.damping <= 1.0)) {
    throw std::invalid_argument(
        fmt::format("Damping factor {} outside [0, 1]", options.damping));
  }

  const double damping = options.damping;
  // Evaluated left to right as teleport * 1 / n
  const double teleport =
      TeleportProbability(damping) * 1.0 / static_cast<double>(n);

  std::vector<double> probabilities(n * n);
  for (size_t i = 0; i < n; ++i) {
    double *row = &probabilities[i * n];
    const uint64_t degree = graph.OutDegree(i);

    if (degree == 0) {
      if (options.dangling == DanglingPolicy::Reject) {
        throw InvariantViolation(
            i, fmt::format("Node {} has no outbound links, its transition "
                           "row cannot be normalised",
                           i));
      }
      for (size_t j = 0; j < n; ++j) {
        row[j] = teleport;
      }
      row[i] += damping;
      continue;
    }

    for (size_t j = 0; j < n; ++j) {
      row[j] = damping * static_cast<double>(graph.Count(i, j)) /
                   static_cast<double>(degree) +
               teleport;
    }
  }

  spdlog::debug("Built {}x{} transition matrix, damping {}", n, n, damping);
  return TransitionMatrix(n, std::move(probabilities));
}

} // namespace rank_tools
