#include "tbc_block_overlay.h"
#include "tbc_page_coords.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

namespace {

  int to_pixel(double page_coord, double dpi) {
    return static_cast<int>(std::round(tbc_coords::page_to_pixel(page_coord, dpi)));
  }

} // namespace

tbc_block_overlay::tbc_block_overlay(double page_width, double page_height, double dpi_val)
  : dpi(dpi_val)
{
  if (page_width <= 0 || page_height <= 0) {
    throw std::invalid_argument("Page size must be positive.");
  }
  int width_px = std::max(1, to_pixel(page_width, dpi));
  int height_px = std::max(1, to_pixel(page_height, dpi));
  canvas = cv::Mat(height_px, width_px, CV_8UC3, cv::Scalar(255, 255, 255));
}

const std::vector<cv::Scalar>& tbc_block_overlay::palette() {
  static const std::vector<cv::Scalar> colors = {
    cv::Scalar(70, 57, 230),
    cv::Scalar(87, 53, 29),
    cv::Scalar(157, 123, 69),
    cv::Scalar(238, 250, 241),
    cv::Scalar(220, 218, 168),
    cv::Scalar(0, 140, 255),
    cv::Scalar(0, 128, 0),
    cv::Scalar(226, 43, 138)
  };
  return colors;
}

void tbc_block_overlay::draw_blocks(const std::vector<tbc_layout_block>& blocks) {
  const auto& colors = palette();
  for (const auto& block : blocks) {
    cv::Point top_left(to_pixel(block.bbox.left, dpi), to_pixel(block.bbox.top, dpi));
    cv::Point bottom_right(to_pixel(block.bbox.right, dpi), to_pixel(block.bbox.bottom, dpi));
    cv::rectangle(canvas, top_left, bottom_right, colors[drawn_blocks % colors.size()], 1);
    drawn_blocks++;
  }
}

void tbc_block_overlay::draw_lines(const std::vector<tbc_horizontal_line>& lines) {
  for (const auto& line : lines) {
    cv::line(canvas, cv::Point(to_pixel(line.x0, dpi), to_pixel(line.y0, dpi)),
             cv::Point(to_pixel(line.x1, dpi), to_pixel(line.y1, dpi)),
             cv::Scalar(0, 255, 0), 2); // green
  }
}

bool tbc_block_overlay::write(const tbc_string& path) const {
  try {
    if (!cv::imwrite(path.to_std_const(), canvas)) {
      std::cerr << "[OVERLAY] Could not write " << path.c_str() << std::endl;
      return false;
    }
  } catch (const cv::Exception& e) {
    std::cerr << "[OVERLAY] Could not write " << path.c_str() << ": " << e.what() << std::endl;
    return false;
  }
  return true;
}
