#ifndef TBC_BOUNDING_BOX_H
#define TBC_BOUNDING_BOX_H

#include <optional>
#include <vector>

// Axis aligned box in page units, origin top-left, y grows downwards.
// left <= right and top <= bottom are the caller's responsibility.
struct tbc_bounding_box
{
  double top = 0.0;
  double left = 0.0;
  double bottom = 0.0;
  double right = 0.0;

  tbc_bounding_box() = default;
  tbc_bounding_box(double top_val, double left_val, double bottom_val, double right_val);

  // (x0, y0, x1, y1) order as delivered by PDF tooling; fewer than four
  // values give the zero box.
  static tbc_bounding_box from_values(const std::vector<double>& values);

  double get_width() const;
  double get_height() const;
  double get_center_x() const;
  double get_center_y() const;

  // Smallest box containing both
  tbc_bounding_box unite(const tbc_bounding_box& other) const;
  tbc_bounding_box unite(const std::optional<tbc_bounding_box>& other) const;

  // Strictly positive overlap after growing this box by pad on every side
  bool intersects(const tbc_bounding_box& other, double pad = 0.0) const;

  bool operator==(const tbc_bounding_box& other) const;
  bool operator!=(const tbc_bounding_box& other) const;
};

#endif // TBC_BOUNDING_BOX_H
