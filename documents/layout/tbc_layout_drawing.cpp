#include "tbc_layout_drawing.h"

tbc_drawing tbc_drawing::rect(double x0_val, double y0_val, double x1_val, double y1_val) {
  tbc_drawing drawing;
  drawing.kind = rect_kind;
  drawing.x0 = x0_val;
  drawing.y0 = y0_val;
  drawing.x1 = x1_val;
  drawing.y1 = y1_val;
  return drawing;
}

tbc_drawing tbc_drawing::line(double x0_val, double y0_val, double x1_val, double y1_val) {
  tbc_drawing drawing;
  drawing.kind = line_kind;
  drawing.x0 = x0_val;
  drawing.y0 = y0_val;
  drawing.x1 = x1_val;
  drawing.y1 = y1_val;
  return drawing;
}
