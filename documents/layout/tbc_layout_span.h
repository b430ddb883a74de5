#ifndef TBC_LAYOUT_SPAN_H
#define TBC_LAYOUT_SPAN_H

#include "tbc_bounding_box.h"
#include "../../utils/tbc_string.h"

#include <cstdint>

struct tbc_font_style
{
  tbc_string font;
  double size = 0.0;
  bool bold = false;
  bool italic = false;

  tbc_font_style() = default;
  tbc_font_style(const tbc_string& font_val, double size_val, bool bold_val, bool italic_val);

  // Bold/italic guessed from the font name, e.g. "Arial-BoldItalicMT"
  static tbc_font_style from_font_name(const tbc_string& font_val, double size_val);

  bool operator==(const tbc_font_style& other) const;
};

// One run of text with uniform style, as extracted from a page
struct tbc_span
{
  tbc_string text;
  tbc_bounding_box bbox;
  tbc_font_style style;
  uint32_t color = 0;  // 0xRRGGBB fill color

  tbc_span() = default;
  tbc_span(const tbc_string& text_val, const tbc_bounding_box& bbox_val,
           const tbc_font_style& style_val, uint32_t color_val = 0);
};

#endif // TBC_LAYOUT_SPAN_H
