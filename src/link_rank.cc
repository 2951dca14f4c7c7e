#include "cli.hh"
#include "rank_errors.hh"
#include "rank_runner.hh"
#include <CLI/CLI.hpp>
#include <iostream>
#include <new>
#include <spdlog/spdlog.h>
#include <stdexcept>

int main(int argc, char *argv[]) {
  using namespace rank_tools;

  CLI::App app{"Link Rank - ranks the nodes of a link graph"};
  RankOptions options;
  CreateCli(app, options);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  if (!SetupLogging(options)) {
    return 1;
  }

  try {
    RunRanking(options, std::cout);
  } catch (const LoadError &e) {
    spdlog::error("{}", e.what());
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const FormatError &e) {
    spdlog::error("Malformed graph: {}", e.what());
    std::cerr << "Malformed graph: " << e.what() << std::endl;
    return 1;
  } catch (const InvariantViolation &e) {
    spdlog::error("Node {}: {}", e.Node(), e.what());
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument &e) {
    spdlog::error("{}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::out_of_range &e) {
    spdlog::error("{}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::bad_alloc &) {
    spdlog::error("Out of memory ranking {}", options.graph_file);
    std::cerr << "Out of memory ranking " << options.graph_file << std::endl;
    return 1;
  }

  spdlog::info("Ranking complete");
  return 0;
}
