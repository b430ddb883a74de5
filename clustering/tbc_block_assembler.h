#ifndef TBC_BLOCK_ASSEMBLER_H
#define TBC_BLOCK_ASSEMBLER_H

#include "../documents/layout/tbc_layout_block.h"

#include <vector>

class tbc_block_assembler {
public:
  // Envelope, joined text and representative style of merged spans.
  // Font name and italic come from the first span, size is the smallest
  // one, bold if any span is bold. Throws std::invalid_argument when empty.
  static tbc_layout_block assemble(std::vector<tbc_span> merged);
};

#endif // TBC_BLOCK_ASSEMBLER_H
