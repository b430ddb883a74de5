#ifndef TBC_JSON_H
#define TBC_JSON_H

#include "../../documents/tbc_page_feed.h"
#include "../../documents/layout/tbc_layout_block.h"
#include "../../clustering/tbc_watermark_detector.h"
#include "../../utils/tbc_string.h"

#include <vector>

// nlohmann::json stays out of the header
class tbc_json {
public:
  /**
   * @brief Reads a page feed.
   *
   * Expected layout:
   *   { "spans":    [ { "text", "bbox": [x0, y0, x1, y1], "font", "size",
   *                     "bold"?, "italic"?, "color"? } ],
   *     "drawings": [ { "type": "line", "p0": [x, y], "p1": [x, y] }
   *                   | { "type": "rect", "rect": [x0, y0, x1, y1] } ],
   *     "links":    [ { "uri"?, "bbox": [x0, y0, x1, y1] } ],
   *     "page_width"?, "page_height"? }
   *
   * @throws tbc_feed_error if the text is not JSON or the root is not an object.
   */
  static tbc_page_feed read_page_feed(const tbc_string& json_string);

  // bbox written as [left, top, right, bottom]
  static tbc_string write_blocks(const std::vector<tbc_layout_block>& blocks, int indent = 2);
  static tbc_string write_watermarks(const std::vector<tbc_watermark_candidate>& candidates, int indent = 2);
};

#endif // TBC_JSON_H
