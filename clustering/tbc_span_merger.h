#ifndef TBC_SPAN_MERGER_H
#define TBC_SPAN_MERGER_H

#include "../documents/layout/tbc_layout_span.h"

#include <vector>

// Reading order and short fragment fusion inside one cluster
class tbc_span_merger {
  size_t short_span_limit;
public:
  explicit tbc_span_merger(size_t short_span_limit_val);

  // Sorts by (top, left), keeping input order on ties, then folds spans
  // shorter than the limit into the preceding accumulation.
  std::vector<tbc_span> merge(std::vector<tbc_span> items) const;

  // Joins fragments the way they read: words split across spans are glued,
  // new capitalized words and Cyrillic vowel endings get a space.
  static tbc_string join_text(const tbc_string& prev_text, const tbc_string& next_text);

  static bool only_underscores(const tbc_string& text);
  static bool only_dashes(const tbc_string& text);

  static void sort_reading_order(std::vector<tbc_span>& items);
};

#endif // TBC_SPAN_MERGER_H
