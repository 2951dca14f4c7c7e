#include "rank_report.hh"
#include "spdlog/fmt/fmt.h"

#include <algorithm>

namespace rank_tools {

std::string FormatRankLine(const RankVector &ranks, int precision) {
  std::string line;
  for (double rank : ranks) {
    line += fmt::format("{:.{}f} ", rank, precision);
  }
  return line;
}

void WriteRanks(std::ostream &os, const RankVector &ranks, int precision) {
  os << FormatRankLine(ranks, precision) << '\n';
}

std::vector<std::pair<size_t, double>> TopNodes(const RankVector &ranks,
                                                size_t n) {
  std::vector<std::pair<size_t, double>> nodes;
  nodes.reserve(ranks.size());
  for (size_t id = 0; id < ranks.size(); ++id) {
    nodes.emplace_back(id, ranks[id]);
  }

  const size_t count = std::min(n, nodes.size());
  std::partial_sort(nodes.begin(),
                    nodes.begin() + static_cast<long>(count), nodes.end(),
                    [](const auto &a, const auto &b) {
                      if (a.second != b.second) {
                        return a.second > b.second;
                      }
                      return a.first < b.first;
                    });

  nodes.resize(count);
  return nodes;
}

void WriteTopNodes(std::ostream &os, const RankVector &ranks, size_t n,
                   int precision) {
  for (const auto &[id, rank] : TopNodes(ranks, n)) {
    os << fmt::format("node {}: {:.{}f}\n", id, rank, precision);
  }
}

} // namespace rank_tools
