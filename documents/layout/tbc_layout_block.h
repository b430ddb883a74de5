#ifndef TBC_LAYOUT_BLOCK_H
#define TBC_LAYOUT_BLOCK_H

#include "tbc_layout_span.h"

#include <vector>

// Output unit of the clustering pipeline. Owns its spans.
struct tbc_layout_block
{
  tbc_bounding_box bbox;
  tbc_string text;
  tbc_font_style style;
  std::vector<tbc_span> items;

  tbc_layout_block() = default;
  tbc_layout_block(const tbc_bounding_box& bbox_val, const tbc_string& text_val,
                   const tbc_font_style& style_val, std::vector<tbc_span> items_val);

  // Wraps a single span, used for synthesized placeholders
  static tbc_layout_block from_span(const tbc_span& span);
};

#endif // TBC_LAYOUT_BLOCK_H
