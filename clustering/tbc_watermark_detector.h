#ifndef TBC_WATERMARK_DETECTOR_H
#define TBC_WATERMARK_DETECTOR_H

#include "tbc_cluster_config.h"
#include "../documents/layout/tbc_layout_span.h"
#include "../documents/layout/tbc_layout_drawing.h"

#include <regex>
#include <vector>

#define TBC_SIGNAL_URL_TEXT "URL_TEXT"
#define TBC_SIGNAL_EMAIL_TEXT "EMAIL_TEXT"
#define TBC_SIGNAL_LINK_HIT "LINK_HIT"
#define TBC_SIGNAL_NEAR_WHITE "NEAR_WHITE"

struct tbc_watermark_candidate {
  tbc_bounding_box bbox;
  tbc_string text;
  std::vector<tbc_string> signals;
  int score = 0;

  bool has_signal(const tbc_string& tag) const;
};

// Set of page regions occupied by watermark candidates
class tbc_watermark_filter {
  std::vector<tbc_bounding_box> regions;
  double pad;
public:
  tbc_watermark_filter(std::vector<tbc_bounding_box> regions_val, double pad_val);

  bool is_watermark(const tbc_bounding_box& bbox) const;
  bool is_watermark(const tbc_span& span) const { return is_watermark(span.bbox); }

  bool empty() const { return regions.empty(); }
  size_t size() const { return regions.size(); }
};

class tbc_watermark_detector {
  tbc_watermark_params params;
  std::regex domain_re;
  std::regex email_re;
  bool verbose;

public:
  explicit tbc_watermark_detector(const tbc_watermark_params& params_val, bool verbose_val = false);

  // Scores every span, strongest candidates first
  std::vector<tbc_watermark_candidate> find_candidates(const std::vector<tbc_span>& spans,
                                                       const std::vector<tbc_hyperlink>& links,
                                                       bool use_color_hint) const;

  // Candidates with the standalone color hint setting
  std::vector<tbc_watermark_candidate> find_candidates(const std::vector<tbc_span>& spans,
                                                       const std::vector<tbc_hyperlink>& links) const;

  // Exclusion regions for the clustering input (color hint per filter setting)
  tbc_watermark_filter make_filter(const std::vector<tbc_span>& spans,
                                   const std::vector<tbc_hyperlink>& links) const;

  bool has_url(const tbc_string& text) const;
  bool has_email(const tbc_string& text) const;
};

#endif // TBC_WATERMARK_DETECTOR_H
