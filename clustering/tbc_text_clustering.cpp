#include "tbc_text_clustering.h"
#include "tbc_span_graph.h"
#include "tbc_block_assembler.h"

#include <algorithm>
#include <iostream>
#include <utility>

tbc_text_clustering::tbc_text_clustering(const tbc_cluster_config& config_val)
  : config(config_val),
    detector(config_val.watermark, config_val.verbose),
    merger(config_val.graph.short_span_limit),
    injector(config_val.underline, config_val.verbose)
{
}

std::vector<tbc_layout_block> tbc_text_clustering::cluster(const tbc_page_feed& feed) const {
  tbc_watermark_filter filter = detector.make_filter(feed.spans, feed.links);

  std::vector<tbc_span> spans;
  spans.reserve(feed.spans.size());
  for (const auto& span : feed.spans) {
    if (!filter.is_watermark(span)) {
      spans.push_back(span);
    }
  }

  if (config.verbose) {
    std::cout << "[CLUSTER] " << feed.spans.size() << " spans, " << filter.size()
              << " watermark regions, " << (feed.spans.size() - spans.size()) << " spans dropped" << std::endl;
  }

  if (spans.empty()) {
    throw tbc_empty_page_error();
  }

  tbc_span_graph graph(spans, config.graph);
  std::vector<std::vector<size_t>> components = graph.connected_components();

  if (config.verbose) {
    std::cout << "[CLUSTER] " << graph.edge_count() << " edges, " << components.size() << " components" << std::endl;
  }

  std::vector<tbc_layout_block> blocks;
  blocks.reserve(components.size());
  for (const auto& component : components) {
    std::vector<tbc_span> members;
    members.reserve(component.size());
    for (size_t index : component) {
      members.push_back(spans[index]);
    }
    blocks.push_back(tbc_block_assembler::assemble(merger.merge(std::move(members))));
  }

  size_t added = injector.inject(blocks, feed.drawings);
  if (config.verbose && added > 0) {
    std::cout << "[CLUSTER] " << added << " underline placeholders added" << std::endl;
  }

  sort_blocks(blocks);
  return blocks;
}

std::vector<tbc_watermark_candidate> tbc_text_clustering::detect_watermarks(const tbc_page_feed& feed) const {
  return detector.find_candidates(feed.spans, feed.links);
}

void tbc_text_clustering::sort_blocks(std::vector<tbc_layout_block>& blocks) {
  std::stable_sort(blocks.begin(), blocks.end(), [](const tbc_layout_block& a, const tbc_layout_block& b) {
    if (a.bbox.top != b.bbox.top) return a.bbox.top < b.bbox.top;
    return a.bbox.left < b.bbox.left;
  });
}
