#ifndef __GRAPH_LOADER_HH__
#define __GRAPH_LOADER_HH__

#include "link_graph.hh"
#include <cstddef>
#include <istream>
#include <string>

namespace rank_tools {

// Dense storage is n * n counts plus n * n probabilities (256 MiB together at
// this limit); larger graphs are refused at load time.
constexpr size_t kMaxNodes = 1 << 12;

// Read a graph file.
// Format: the first line holds the node count n, the rest of the file is a
// whitespace separated list of "u v" pairs, one link u -> v per pair.
// Throws LoadError if the file cannot be opened or read, FormatError if the
// contents are malformed.
LinkGraph LoadGraph(const std::string &path);

// Same as LoadGraph, reading from an already open stream.
// source: Name used in error messages.
LinkGraph ParseGraph(std::istream &in, const std::string &source = "<stream>");

} // namespace rank_tools

#endif
