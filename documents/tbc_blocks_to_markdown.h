#ifndef TBC_BLOCKS_TO_MARKDOWN_H
#define TBC_BLOCKS_TO_MARKDOWN_H

#include "../utils/tbc_string.h"
#include "layout/tbc_layout_block.h"
#include <vector>

class tbc_blocks_to_markdown
{
public:
  // "[n]\ntext" sections separated by horizontal rules. Blank blocks are
  // left out but still count for the numbering.
  static tbc_string convert(const std::vector<tbc_layout_block>& blocks);

  // Titled report around convert(), page number is zero based
  static tbc_string report(const tbc_string& source_name, size_t page_index,
                           const std::vector<tbc_layout_block>& blocks);
};

#endif // TBC_BLOCKS_TO_MARKDOWN_H
