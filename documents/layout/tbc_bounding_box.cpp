#include "tbc_bounding_box.h"

#include <algorithm>

tbc_bounding_box::tbc_bounding_box(double top_val, double left_val, double bottom_val, double right_val)
  : top(top_val), left(left_val), bottom(bottom_val), right(right_val)
{
}

tbc_bounding_box tbc_bounding_box::from_values(const std::vector<double>& values) {
  if (values.size() < 4) {
    return tbc_bounding_box();
  }
  return tbc_bounding_box(values[1], values[0], values[3], values[2]);
}

double tbc_bounding_box::get_width() const {
  return right - left;
}

double tbc_bounding_box::get_height() const {
  return bottom - top;
}

double tbc_bounding_box::get_center_x() const {
  return (left + right) / 2.0;
}

double tbc_bounding_box::get_center_y() const {
  return (top + bottom) / 2.0;
}

tbc_bounding_box tbc_bounding_box::unite(const tbc_bounding_box& other) const {
  return tbc_bounding_box(std::min(top, other.top),
                          std::min(left, other.left),
                          std::max(bottom, other.bottom),
                          std::max(right, other.right));
}

tbc_bounding_box tbc_bounding_box::unite(const std::optional<tbc_bounding_box>& other) const {
  if (!other) {
    return *this;
  }
  return unite(*other);
}

bool tbc_bounding_box::intersects(const tbc_bounding_box& other, double pad) const {
  double ax0 = left - pad;
  double ay0 = top - pad;
  double ax1 = right + pad;
  double ay1 = bottom + pad;

  return (std::min(ax1, other.right) - std::max(ax0, other.left) > 0) &&
         (std::min(ay1, other.bottom) - std::max(ay0, other.top) > 0);
}

bool tbc_bounding_box::operator==(const tbc_bounding_box& other) const {
  return top == other.top && left == other.left &&
         bottom == other.bottom && right == other.right;
}

bool tbc_bounding_box::operator!=(const tbc_bounding_box& other) const {
  return !(*this == other);
}
