#ifndef TBC_LAYOUT_DRAWING_H
#define TBC_LAYOUT_DRAWING_H

#include "tbc_bounding_box.h"
#include "../../utils/tbc_string.h"

#include <optional>

// Vector primitive from the page: either a rectangle or a line segment.
// Coordinates are in the same top-left page space as spans.
struct tbc_drawing
{
  enum kind_t { rect_kind, line_kind };

  kind_t kind = rect_kind;
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;

  static tbc_drawing rect(double x0_val, double y0_val, double x1_val, double y1_val);
  static tbc_drawing line(double x0_val, double y0_val, double x1_val, double y1_val);

  bool is_rect() const { return kind == rect_kind; }
  bool is_line() const { return kind == line_kind; }
};

struct tbc_hyperlink
{
  std::optional<tbc_string> uri;
  tbc_bounding_box bbox;

  bool has_uri() const { return uri.has_value() && !uri->empty(); }
};

#endif // TBC_LAYOUT_DRAWING_H
