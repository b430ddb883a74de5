#ifndef TBC_SPAN_GRAPH_H
#define TBC_SPAN_GRAPH_H

#include "tbc_cluster_config.h"
#include "../documents/layout/tbc_layout_span.h"

#include <vector>

// Undirected adjacency between the spans of one page. Two spans are
// adjacent when their centers are close, or when they sit on the same line
// with nearly touching edges.
class tbc_span_graph {
  std::vector<std::vector<size_t>> adjacency;
public:
  tbc_span_graph(const std::vector<tbc_span>& spans, const tbc_graph_params& params);

  static bool is_adjacent(const tbc_bounding_box& a, const tbc_bounding_box& b,
                          const tbc_graph_params& params);

  size_t size() const { return adjacency.size(); }
  size_t edge_count() const;
  const std::vector<size_t>& neighbors(size_t index) const;
  bool adjacent(size_t i, size_t j) const;

  // Connected components by breadth-first search from the lowest unvisited
  // index; members are in visiting order.
  std::vector<std::vector<size_t>> connected_components() const;
};

#endif // TBC_SPAN_GRAPH_H
