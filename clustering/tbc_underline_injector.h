#ifndef TBC_UNDERLINE_INJECTOR_H
#define TBC_UNDERLINE_INJECTOR_H

#include "tbc_cluster_config.h"
#include "../documents/layout/tbc_layout_block.h"
#include "../documents/layout/tbc_layout_drawing.h"

#include <regex>
#include <vector>

// Horizontal rule normalized to x0 <= x1
struct tbc_horizontal_line {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;
};

// Signature fields are often a label followed by a drawn rule instead of
// typed underscores. For such labels a placeholder block of underscores is
// added where the rule is.
class tbc_underline_injector {
  tbc_underline_params params;
  std::vector<tbc_string> label_terms;   // lower-cased
  std::regex underline_re;
  bool verbose;

public:
  explicit tbc_underline_injector(const tbc_underline_params& params_val, bool verbose_val = false);

  std::vector<tbc_horizontal_line> collect_horizontal_lines(const std::vector<tbc_drawing>& drawings) const;

  bool is_label(const tbc_string& text) const;
  bool has_captured_underline(const tbc_string& text) const;

  // Appends placeholder blocks; existing blocks are left untouched.
  // Returns the number of blocks added.
  size_t inject(std::vector<tbc_layout_block>& blocks, const std::vector<tbc_drawing>& drawings) const;

  tbc_span make_placeholder(const tbc_horizontal_line& line) const;
};

#endif // TBC_UNDERLINE_INJECTOR_H
