#include "link_graph.hh"

#include <stdexcept>
#include <string>

namespace rank_tools {

LinkGraph::LinkGraph(size_t num_nodes)
    : num_nodes_(num_nodes), counts_(num_nodes * num_nodes, 0),
      out_degree_(num_nodes, 0) {}

void LinkGraph::AddLink(size_t u, size_t v) {
  if (u >= num_nodes_ || v >= num_nodes_) {
    throw std::out_of_range("Link " + std::to_string(u) + " -> " +
                            std::to_string(v) + " outside graph of " +
                            std::to_string(num_nodes_) + " nodes");
  }
  ++counts_[u * num_nodes_ + v];
  ++out_degree_[u];
  ++num_links_;
}

std::vector<size_t> LinkGraph::DanglingNodes() const {
  std::vector<size_t> dangling;
  for (size_t u = 0; u < num_nodes_; ++u) {
    if (out_degree_[u] == 0) {
      dangling.push_back(u);
    }
  }
  return dangling;
}

} // namespace rank_tools
