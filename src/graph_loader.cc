#include "graph_loader.hh"
#include "rank_errors.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>
#include <vector>

namespace rank_tools {

namespace {

// Parse a non-negative decimal integer occupying the whole token.
bool ParseUnsigned(const std::string &token, uint64_t &value) {
  if (token.empty() || !std::isdigit(static_cast<unsigned char>(token[0]))) {
    return false;
  }
  size_t pos = 0;
  try {
    value = std::stoull(token, &pos);
  } catch (const std::logic_error &) {
    // invalid_argument or out_of_range
    return false;
  }
  return pos == token.size();
}

std::string Trim(const std::string &s) {
  const char *ws = " \t\r\n\v\f";
  size_t first = s.find_first_not_of(ws);
  if (first == std::string::npos) {
    return {};
  }
  size_t last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

// errno as text, for stream failures that may not have set it.
std::string ReadFailureCause() {
  return errno != 0 ? std::strerror(errno) : "stream read failed";
}

size_t ParseNode(const std::string &token, size_t num_nodes,
                 const std::string &source) {
  uint64_t node;
  if (!ParseUnsigned(token, node)) {
    throw FormatError(
        fmt::format("{}: expected a node index, got '{}'", source, token));
  }
  if (node >= num_nodes) {
    throw FormatError(fmt::format("{}: node {} outside [0, {})", source, node,
                                  num_nodes));
  }
  return static_cast<size_t>(node);
}

} // namespace

LinkGraph ParseGraph(std::istream &in, const std::string &source) {
  errno = 0;
  std::string header;
  if (!std::getline(in, header)) {
    if (in.bad()) {
      throw LoadError(
          fmt::format("Error reading {}: {}", source, ReadFailureCause()));
    }
    throw FormatError(fmt::format("{}: missing node count", source));
  }

  uint64_t num_nodes;
  header = Trim(header);
  if (!ParseUnsigned(header, num_nodes)) {
    throw FormatError(fmt::format(
        "{}: first line must be the node count, got '{}'", source, header));
  }
  if (num_nodes > kMaxNodes) {
    throw FormatError(fmt::format("{}: {} nodes exceeds the limit of {}",
                                  source, num_nodes, kMaxNodes));
  }

  std::vector<std::string> tokens;
  std::string token;
  while (in >> token) {
    tokens.push_back(std::move(token));
  }
  if (in.bad()) {
    throw LoadError(
        fmt::format("Error reading {}: {}", source, ReadFailureCause()));
  }
  if (tokens.size() % 2 != 0) {
    throw FormatError(fmt::format(
        "{}: odd number of node tokens ({}), links come in pairs", source,
        tokens.size()));
  }

  LinkGraph graph(static_cast<size_t>(num_nodes));
  for (size_t i = 0; i < tokens.size(); i += 2) {
    size_t u = ParseNode(tokens[i], graph.NumNodes(), source);
    size_t v = ParseNode(tokens[i + 1], graph.NumNodes(), source);
    graph.AddLink(u, v);
  }
  return graph;
}

LinkGraph LoadGraph(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    throw LoadError(
        fmt::format("Error opening file {}: {}", path, std::strerror(errno)));
  }

  LinkGraph graph = ParseGraph(file, path);
  spdlog::info("Loaded {}: {} nodes, {} links", path, graph.NumNodes(),
               graph.NumLinks());

  auto dangling = graph.DanglingNodes();
  if (!dangling.empty()) {
    spdlog::debug("{} has {} node(s) without outbound links, first is {}",
                  path, dangling.size(), dangling.front());
  }
  return graph;
}

} // namespace rank_tools
