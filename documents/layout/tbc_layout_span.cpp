#include "tbc_layout_span.h"

tbc_font_style::tbc_font_style(const tbc_string& font_val, double size_val, bool bold_val, bool italic_val)
  : font(font_val), size(size_val), bold(bold_val), italic(italic_val)
{
}

tbc_font_style tbc_font_style::from_font_name(const tbc_string& font_val, double size_val) {
  return tbc_font_style(font_val, size_val, font_val.contains("Bold"), font_val.contains("Italic"));
}

bool tbc_font_style::operator==(const tbc_font_style& other) const {
  return font == other.font && size == other.size &&
         bold == other.bold && italic == other.italic;
}

tbc_span::tbc_span(const tbc_string& text_val, const tbc_bounding_box& bbox_val,
                   const tbc_font_style& style_val, uint32_t color_val)
  : text(text_val), bbox(bbox_val), style(style_val), color(color_val)
{
}
