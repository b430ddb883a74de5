#include "tbc_layout_block.h"

#include <utility>

tbc_layout_block::tbc_layout_block(const tbc_bounding_box& bbox_val, const tbc_string& text_val,
                                   const tbc_font_style& style_val, std::vector<tbc_span> items_val)
  : bbox(bbox_val), text(text_val), style(style_val), items(std::move(items_val))
{
}

tbc_layout_block tbc_layout_block::from_span(const tbc_span& span) {
  return tbc_layout_block(span.bbox, span.text, span.style, std::vector<tbc_span>{ span });
}
