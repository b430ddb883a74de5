#include "tbc_block_assembler.h"
#include "tbc_span_merger.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

tbc_layout_block tbc_block_assembler::assemble(std::vector<tbc_span> merged) {
  if (merged.empty()) {
    throw std::invalid_argument("Cannot assemble a block without spans");
  }

  const tbc_span& first_span = merged.front();
  tbc_bounding_box envelope = first_span.bbox;
  double min_size = first_span.style.size;
  bool is_bold = false;
  tbc_string text_merged;

  for (const auto& span : merged) {
    envelope = envelope.unite(span.bbox);
    min_size = std::min(min_size, span.style.size);
    is_bold = is_bold || span.style.bold;
    text_merged = tbc_span_merger::join_text(text_merged, span.text);
  }

  tbc_font_style block_style(first_span.style.font, min_size, is_bold, first_span.style.italic);
  return tbc_layout_block(envelope, text_merged, block_style, std::move(merged));
}
