#ifndef __RANK_REPORT_HH__
#define __RANK_REPORT_HH__

#include "transition_model.hh"
#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace rank_tools {

// Every rank printed with `precision` decimals, each followed by one space.
std::string FormatRankLine(const RankVector &ranks, int precision = 3);

// FormatRankLine plus a trailing newline.
void WriteRanks(std::ostream &os, const RankVector &ranks, int precision = 3);

// The n best-ranked nodes, highest rank first. Equal ranks keep node order.
std::vector<std::pair<size_t, double>> TopNodes(const RankVector &ranks,
                                                size_t n);

// One "node <id>: <rank>" line per entry of TopNodes.
void WriteTopNodes(std::ostream &os, const RankVector &ranks, size_t n,
                   int precision = 6);

} // namespace rank_tools

#endif
