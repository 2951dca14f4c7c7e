#ifndef __RANK_TOOLS_CLI_HH__
#define __RANK_TOOLS_CLI_HH__
#include "CLI/App.hpp"
#include "spdlog/common.h"
#include "transition_model.hh"
#include <cstddef>
#include <cstdint>
#include <string>

namespace rank_tools {

enum class RankMode {
  RandomSurfer, // -r
  MarkovMixing, // -m
};

struct RankOptions {
  RankMode mode{RankMode::MarkovMixing};
  std::string graph_file;
  uint64_t num_steps{0};

  double damping{kDefaultDamping};
  DanglingPolicy dangling{DanglingPolicy::Reject};
  size_t start_node{0};
  uint64_t seed{0}; // 0 seeds from the clock
  size_t num_threads{1};
  size_t top{0}; // 0 disables the top-N listing

  bool verbose{false};
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::info};
};

// Register the mode flags, positional arguments and tuning options.
void CreateCli(CLI::App &app, RankOptions &options);

// Install the default logger described by the options.
// Returns false if a sink could not be created.
bool SetupLogging(const RankOptions &options);

TransitionOptions MakeTransitionOptions(const RankOptions &options);

} // namespace rank_tools
#endif
