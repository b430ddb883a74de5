#ifndef TBC_PAGE_COORDS_H
#define TBC_PAGE_COORDS_H
#include <stdexcept>

namespace tbc_coords {
  /**
   * @brief Converts a page coordinate (points, 1/72 inch) to a pixel coordinate.
   * @param page_coord Coordinate in points.
   * @param dpi Resolution of the raster.
   * @return Coordinate in pixels.
   */
  inline double page_to_pixel(double page_coord, double dpi) {
    if (dpi <= 0) {
      throw std::invalid_argument("DPI must be positive.");
    }
    return (page_coord * dpi) / 72.0;
  }
} // namespace tbc_coords

#endif // TBC_PAGE_COORDS_H
