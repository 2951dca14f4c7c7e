#ifndef __LINK_GRAPH_HH__
#define __LINK_GRAPH_HH__

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rank_tools {

// Dense link counts plus per-node out-degree.
// counts(i, j) is the number of links from node i to node j and the
// out-degree of i is always the sum of row i.
class LinkGraph {
public:
  explicit LinkGraph(size_t num_nodes);

  // Add one link u -> v. Repeated links accumulate.
  // Throws std::out_of_range if either endpoint is not a node.
  void AddLink(size_t u, size_t v);

  size_t NumNodes() const { return num_nodes_; }
  uint64_t NumLinks() const { return num_links_; }

  uint64_t Count(size_t u, size_t v) const {
    return counts_[u * num_nodes_ + v];
  }
  uint64_t OutDegree(size_t u) const { return out_degree_[u]; }
  const std::vector<uint64_t> &OutDegrees() const { return out_degree_; }

  // Nodes with no outbound links.
  std::vector<size_t> DanglingNodes() const;

private:
  size_t num_nodes_;
  uint64_t num_links_{0};
  std::vector<uint64_t> counts_; // row-major, num_nodes_ x num_nodes_
  std::vector<uint64_t> out_degree_;
};

} // namespace rank_tools

#endif
