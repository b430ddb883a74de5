#ifndef TBC_CLUSTER_CONFIG_H
#define TBC_CLUSTER_CONFIG_H

#include "../utils/tbc_string.h"
#include <cstdint>
#include <vector>

// Span adjacency and short fragment merging
struct tbc_graph_params {
  double distance_threshold = 65.0;   // center distance for same block
  double vertical_tolerance = 5.0;    // same line when midpoints are closer
  double overlap_threshold = 3.0;     // edge gap for same line fragments
  size_t short_span_limit = 4;        // shorter spans get fused into neighbors
};

struct tbc_watermark_params {
  uint32_t near_white_threshold = 0xF0F0F0;
  double pad = 0.5;
  bool external_links_only = true;
  int strong_weight = 3;
  bool detector_use_color_hint = true;
  bool filter_use_color_hint = false;
  tbc_string domain_pattern = "\\b(?:https?://)?(?:[a-z0-9-]+\\.)+[a-z]{2,}\\b";
  tbc_string email_pattern = "[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}";
};

struct tbc_underline_params {
  double drawing_y_tolerance = 4.0;
  double drawing_min_length = 30.0;
  size_t min_segments = 4;            // underscores that already make a line
  double same_line_y_tolerance = 16.0;
  double right_min_gap = 5.0;
  double pixels_per_char = 7.0;
  size_t min_chars = 5;
  double y_pad = 1.0;
  tbc_string placeholder_font = "Times New Roman";
  double placeholder_font_size = 14.0;
  std::vector<tbc_string> label_terms;

  tbc_underline_params();
};

// Role words that precede a signature line
std::vector<tbc_string> tbc_label_terms_ru();
std::vector<tbc_string> tbc_label_terms_en();

struct tbc_cluster_config {
  tbc_graph_params graph;
  tbc_watermark_params watermark;
  tbc_underline_params underline;
  bool verbose = false;

  // Defaults overridden by TBC_* environment variables
  static tbc_cluster_config from_env();
};

#endif // TBC_CLUSTER_CONFIG_H
