#include "rank_tools/markov_mixing.hh"
#include "rank_tools/random_surfer.hh"
#include "rank_tools/rank_report.hh"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cctype>
#include <iostream>
#include <optional>
#include <random>
#include <string>

namespace {

void usage(const char *argv0) {
  std::cerr << "usage: " << argv0 << " <graph_seed> [mixing_threads]\n"
            << "  graph_seed      seeds both the generated web graph and the "
               "random surfer\n"
            << "  mixing_threads  OpenMP threads for the timed mixing run "
               "(default 4)\n";
}

// Whole-string unsigned parse; leading signs and trailing text are refused.
std::optional<uint64_t> parse_count(const char *text) {
  std::string token(text);
  if (token.empty() || !std::isdigit(static_cast<unsigned char>(token[0]))) {
    return std::nullopt;
  }
  size_t used = 0;
  try {
    uint64_t value = std::stoull(token, &used);
    if (used == token.size()) {
      return value;
    }
  } catch (const std::out_of_range &) {
    // wider than 64 bits
  }
  return std::nullopt;
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace rank_tools;

  if (argc < 2 || argc > 3) {
    usage(argv[0]);
    return 1;
  }
  auto seed = parse_count(argv[1]);
  auto threads = argc == 3 ? parse_count(argv[2]) : std::optional<uint64_t>(4);
  if (!seed || !threads || *threads == 0) {
    std::cerr << "graph_seed must be an unsigned integer, mixing_threads a "
                 "positive one\n";
    usage(argv[0]);
    return 1;
  }

  constexpr size_t NUM_PAGES = 200;
  constexpr double EDGE_PROBABILITY = 0.05;
  constexpr uint64_t MIXING_STEPS = 100;
  constexpr uint64_t SURFER_STEPS = 200000;

  std::mt19937_64 rng(*seed);
  std::uniform_real_distribution<> dist(0.0, 1.0);

  // Random web graph, pages without links loop on themselves
  LinkGraph graph(NUM_PAGES);
  for (size_t u = 0; u < NUM_PAGES; ++u) {
    for (size_t v = 0; v < NUM_PAGES; ++v) {
      if (u != v && dist(rng) < EDGE_PROBABILITY) {
        graph.AddLink(u, v);
      }
    }
  }
  TransitionOptions options;
  options.dangling = DanglingPolicy::SelfLoop;
  TransitionMatrix matrix = ComputeTransition(graph, options);

  auto start_time = std::chrono::steady_clock::now();
  RankVector exact = MarkovMixer().Mix(matrix, MIXING_STEPS);
  auto end_time = std::chrono::steady_clock::now();
  auto mixing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                       end_time - start_time)
                       .count();

  start_time = std::chrono::steady_clock::now();
  RankVector threaded =
      MarkovMixer(static_cast<size_t>(*threads)).Mix(matrix, MIXING_STEPS);
  end_time = std::chrono::steady_clock::now();
  auto threaded_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         end_time - start_time)
                         .count();

  RandomSurfer surfer(rng);
  SurferResult estimate = surfer.Run(matrix, SURFER_STEPS);

  double max_diff = 0.0;
  for (size_t i = 0; i < exact.size(); ++i) {
    max_diff = std::max(max_diff, std::abs(exact[i] - estimate.ranks[i]));
  }

  std::cout << "Graph: " << NUM_PAGES << " pages, " << graph.NumLinks()
            << " links\n";
  std::cout << "Markov mixing: " << MIXING_STEPS << " steps in " << mixing_ms
            << "ms\n";
  std::cout << "Markov mixing on " << *threads << " threads: " << threaded_ms
            << "ms (" << (threaded == exact ? "identical" : "DIFFERENT")
            << " ranks)\n";
  std::cout << "Random surfer: " << SURFER_STEPS << " steps in "
            << estimate.run_time_ms << "ms\n";
  std::cout << "Largest rank difference: " << max_diff << "\n\n";

  std::cout << "Top 10 pages (Markov mixing):\n";
  WriteTopNodes(std::cout, exact, 10);
  std::cout << "\nTop 10 pages (random surfer):\n";
  WriteTopNodes(std::cout, estimate.ranks, 10);

  return 0;
}
