#include "rank_runner.hh"
#include "graph_loader.hh"
#include "markov_mixing.hh"
#include "random_surfer.hh"
#include "rank_report.hh"
#include "spdlog/spdlog.h"

#include <chrono>
#include <random>

namespace rank_tools {

void RunRanking(const RankOptions &options, std::ostream &out) {
  LinkGraph graph = LoadGraph(options.graph_file);
  TransitionMatrix matrix =
      ComputeTransition(graph, MakeTransitionOptions(options));

  RankVector ranks;
  if (options.mode == RankMode::RandomSurfer) {
    uint64_t seed = options.seed
                        ? options.seed
                        : static_cast<uint64_t>(std::chrono::system_clock::now()
                                                    .time_since_epoch()
                                                    .count());
    spdlog::debug("Random surfer seed {}", seed);
    std::mt19937_64 rng(seed);
    RandomSurfer surfer(rng);
    ranks = surfer.Run(matrix, options.num_steps, options.start_node).ranks;
  } else {
    MarkovMixer mixer(options.num_threads);
    ranks = mixer.Mix(matrix, options.num_steps, options.start_node);
  }

  WriteRanks(out, ranks);
  if (options.top > 0) {
    WriteTopNodes(out, ranks, options.top);
  }
}

} // namespace rank_tools
