#include "cli.hh"
#include "CLI/CLI.hpp"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <map>
#include <memory>
#include <vector>

namespace rank_tools {
bool SetupLogging(const RankOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (!options.log_file.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          options.log_file, true);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      sinks.push_back(file_sink);
    }

    // Console output goes to stderr, stdout carries the ranks
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("link_rank", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);

    spdlog::info("Ranking {} with {} for {} steps", options.graph_file,
                 options.mode == RankMode::RandomSurfer ? "random surfer"
                                                        : "Markov mixing",
                 options.num_steps);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    return false;
  }
  return true;
}

void CreateCli(CLI::App &app, RankOptions &options) {
  auto mode = app.add_option_group("mode", "Rank algorithm");
  mode->add_flag_callback(
      "-r", [&options]() { options.mode = RankMode::RandomSurfer; },
      "Random surfer simulation");
  mode->add_flag_callback(
      "-m", [&options]() { options.mode = RankMode::MarkovMixing; },
      "Markov mixing (power iteration)");
  mode->require_option(1);

  app.add_option("file", options.graph_file, "Graph file")->required();
  app.add_option("steps", options.num_steps,
                 "Number of simulation or mixing steps")
      ->required();

  app.add_option("--damping", options.damping,
                 "Probability of following a link (0.0-1.0)")
      ->default_val(kDefaultDamping)
      ->check(CLI::Range(0.0, 1.0));

  app.add_option("--dangling", options.dangling,
                 "Nodes without outbound links (reject, self-loop)")
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, DanglingPolicy>{
              {"reject", DanglingPolicy::Reject},
              {"self-loop", DanglingPolicy::SelfLoop}},
          CLI::ignore_case));

  app.add_option("--start-node", options.start_node,
                 "Node the walk or distribution starts on")
      ->default_val(0);

  app.add_option("--seed", options.seed,
                 "RNG seed for the random surfer (0 for random)")
      ->default_val(0);

  app.add_option("--threads", options.num_threads,
                 "Number of Markov mixing threads")
      ->default_val(1)
      ->check(CLI::Range(1, 256));

  app.add_option("--top", options.top,
                 "Also list the N highest ranked nodes")
      ->default_val(0);

  app.add_flag("-v,--verbose", options.verbose,
               "Enable console logging on stderr");
  app.add_option("-l,--log-file", options.log_file, "Log file path");

  app.add_option("--log-level", options.log_level,
                 "Log level (trace, debug, info, warn, error, critical)")
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));
}

TransitionOptions MakeTransitionOptions(const RankOptions &options) {
  TransitionOptions transition;
  transition.damping = options.damping;
  transition.dangling = options.dangling;
  return transition;
}

} // namespace rank_tools
