#ifndef TBC_BLOCK_OVERLAY_H
#define TBC_BLOCK_OVERLAY_H

#include "../utils/tbc_string.h"
#include "layout/tbc_layout_block.h"
#include "../clustering/tbc_underline_injector.h"

#include <vector>
#include <opencv2/core.hpp>

// Debug raster of a clustered page: block envelopes in palette colors and
// the horizontal rules the underline injector works with.
class tbc_block_overlay
{
  cv::Mat canvas;
  double dpi;
  size_t drawn_blocks = 0;

public:
  // White canvas of the page size; throws std::invalid_argument on a
  // non-positive page size or dpi
  tbc_block_overlay(double page_width, double page_height, double dpi_val = 72.0);

  void draw_blocks(const std::vector<tbc_layout_block>& blocks);
  void draw_lines(const std::vector<tbc_horizontal_line>& lines);

  bool write(const tbc_string& path) const;

  const cv::Mat& get_canvas() const { return canvas; }

  // BGR colors cycled through by draw_blocks
  static const std::vector<cv::Scalar>& palette();
};

#endif // TBC_BLOCK_OVERLAY_H
