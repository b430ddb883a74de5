#ifndef TBC_TEXT_CLUSTERING_H
#define TBC_TEXT_CLUSTERING_H

#include "tbc_cluster_config.h"
#include "tbc_cluster_exceptions.h"
#include "tbc_watermark_detector.h"
#include "tbc_span_merger.h"
#include "tbc_underline_injector.h"
#include "../documents/tbc_page_feed.h"
#include "../documents/layout/tbc_layout_block.h"

#include <vector>

/**
 * Groups the text spans of one page into blocks.
 *
 * Stages, in order:
 *  1. drop spans inside watermark regions
 *  2. build the span adjacency graph and take its connected components
 *  3. sort and fuse short fragments per component
 *  4. assemble one block per component
 *  5. add placeholder blocks for drawn signature lines
 *  6. sort blocks by (top, left)
 *
 * The object holds no per-page state; one instance can serve any number of
 * pages, also from several threads.
 */
class tbc_text_clustering {
  tbc_cluster_config config;
  tbc_watermark_detector detector;
  tbc_span_merger merger;
  tbc_underline_injector injector;

public:
  explicit tbc_text_clustering(const tbc_cluster_config& config_val = tbc_cluster_config());

  // Throws tbc_empty_page_error when no span survives the watermark filter
  std::vector<tbc_layout_block> cluster(const tbc_page_feed& feed) const;

  // Standalone candidate listing with the detector's color hint setting
  std::vector<tbc_watermark_candidate> detect_watermarks(const tbc_page_feed& feed) const;

  static void sort_blocks(std::vector<tbc_layout_block>& blocks);
};

#endif // TBC_TEXT_CLUSTERING_H
