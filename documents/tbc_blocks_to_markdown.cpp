#include "tbc_blocks_to_markdown.h"
#include <sstream>

tbc_string tbc_blocks_to_markdown::convert(const std::vector<tbc_layout_block>& blocks) {
  std::vector<tbc_string> parts;
  for (size_t i = 0; i < blocks.size(); ++i) {
    tbc_string text = blocks[i].text.trim();
    if (text.empty()) continue;

    std::ostringstream part;
    part << "[" << (i + 1) << "]\n" << text.c_str();
    parts.push_back(part.str());
  }
  return tbc_string("\n\n---\n\n").join(parts);
}

tbc_string tbc_blocks_to_markdown::report(const tbc_string& source_name, size_t page_index,
                                          const std::vector<tbc_layout_block>& blocks) {
  std::ostringstream md;
  md << "# Text Blocks\n";
  md << "Source: " << source_name.c_str() << "\n";
  md << "Page: " << (page_index + 1) << " (0-based " << page_index << ")\n";
  md << "Blocks: " << blocks.size() << "\n\n";
  md << "```\n" << convert(blocks).c_str() << "\n```\n";
  return tbc_string(md.str());
}
