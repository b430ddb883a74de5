#include "tbc_span_graph.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <stdexcept>

tbc_span_graph::tbc_span_graph(const std::vector<tbc_span>& spans, const tbc_graph_params& params)
  : adjacency(spans.size())
{
  size_t n = spans.size();
  for (size_t i = 0; i < n; ++i) {
    for (size_t j = i + 1; j < n; ++j) {
      if (is_adjacent(spans[i].bbox, spans[j].bbox, params)) {
        adjacency[i].push_back(j);
        adjacency[j].push_back(i);
      }
    }
  }
}

bool tbc_span_graph::is_adjacent(const tbc_bounding_box& a, const tbc_bounding_box& b,
                                 const tbc_graph_params& params) {
  double dx = a.get_center_x() - b.get_center_x();
  double dy = a.get_center_y() - b.get_center_y();
  if (std::sqrt(dx * dx + dy * dy) < params.distance_threshold) {
    return true;
  }

  // Same line: far apart centers but touching or overlapping edges
  if (std::fabs(a.get_center_y() - b.get_center_y()) >= params.vertical_tolerance) {
    return false;
  }
  return std::fabs(a.right - b.left) < params.overlap_threshold ||
         std::fabs(b.right - a.left) < params.overlap_threshold;
}

size_t tbc_span_graph::edge_count() const {
  size_t total = 0;
  for (const auto& list : adjacency) {
    total += list.size();
  }
  return total / 2;
}

const std::vector<size_t>& tbc_span_graph::neighbors(size_t index) const {
  if (index >= adjacency.size()) {
    throw std::out_of_range("Span index out of range");
  }
  return adjacency[index];
}

bool tbc_span_graph::adjacent(size_t i, size_t j) const {
  const auto& list = neighbors(i);
  return std::binary_search(list.begin(), list.end(), j);
}

std::vector<std::vector<size_t>> tbc_span_graph::connected_components() const {
  std::vector<std::vector<size_t>> clusters;
  std::vector<bool> visited(adjacency.size(), false);

  for (size_t idx = 0; idx < adjacency.size(); ++idx) {
    if (visited[idx]) {
      continue;
    }

    std::deque<size_t> queue{ idx };
    visited[idx] = true;
    std::vector<size_t> comp{ idx };

    while (!queue.empty()) {
      size_t cur = queue.front();
      queue.pop_front();
      for (size_t neighbor : adjacency[cur]) {
        if (!visited[neighbor]) {
          visited[neighbor] = true;
          queue.push_back(neighbor);
          comp.push_back(neighbor);
        }
      }
    }

    clusters.push_back(std::move(comp));
  }

  return clusters;
}
