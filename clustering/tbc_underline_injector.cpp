#include "tbc_underline_injector.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

tbc_underline_injector::tbc_underline_injector(const tbc_underline_params& params_val, bool verbose_val)
  : params(params_val), verbose(verbose_val)
{
  for (const tbc_string& term : params.label_terms) {
    tbc_string lowered = term.trim().lower_utf8();
    if (!lowered.empty()) {
      label_terms.push_back(lowered);
    }
  }

  // A run of N underscores, or N underscore groups split by whitespace
  size_t segments = std::max<size_t>(params.min_segments, 1);
  std::string pattern = "_{" + std::to_string(segments) + ",}";
  if (segments > 1) {
    pattern += "|(?:_+\\s+){" + std::to_string(segments - 1) + ",}_+";
  }
  underline_re = std::regex(pattern, std::regex::ECMAScript);
}

std::vector<tbc_horizontal_line> tbc_underline_injector::collect_horizontal_lines(
    const std::vector<tbc_drawing>& drawings) const {
  std::vector<tbc_horizontal_line> lines;

  for (const auto& d : drawings) {
    if (std::fabs(d.y0 - d.y1) > params.drawing_y_tolerance) {
      continue;
    }

    if (d.is_rect()) {
      if (d.x1 - d.x0 >= params.drawing_min_length) {
        lines.push_back({ d.x0, d.y0, d.x1, d.y1 });
      }
    } else if (std::fabs(d.x1 - d.x0) >= params.drawing_min_length) {
      lines.push_back({ std::min(d.x0, d.x1), d.y0, std::max(d.x0, d.x1), d.y1 });
    }
  }

  return lines;
}

bool tbc_underline_injector::is_label(const tbc_string& text) const {
  tbc_string lowered = text.lower_utf8();
  return std::any_of(label_terms.begin(), label_terms.end(),
                     [&lowered](const tbc_string& term) { return lowered.contains(term); });
}

bool tbc_underline_injector::has_captured_underline(const tbc_string& text) const {
  return std::regex_search(text.to_std_const(), underline_re);
}

tbc_span tbc_underline_injector::make_placeholder(const tbc_horizontal_line& line) const {
  size_t by_length = 0;
  if (params.pixels_per_char > 0) {
    double chars = std::floor((line.x1 - line.x0) / params.pixels_per_char);
    by_length = chars > 0 ? static_cast<size_t>(chars) : 0;
  }
  size_t underline_len = std::max(params.min_chars, by_length);

  tbc_bounding_box bbox(line.y0 - params.y_pad, line.x0, line.y1 + params.y_pad, line.x1);
  tbc_font_style style(params.placeholder_font, params.placeholder_font_size, false, false);
  return tbc_span(tbc_string('_').repeat(underline_len), bbox, style);
}

size_t tbc_underline_injector::inject(std::vector<tbc_layout_block>& blocks,
                                      const std::vector<tbc_drawing>& drawings) const {
  std::vector<tbc_horizontal_line> lines = collect_horizontal_lines(drawings);
  if (lines.empty()) {
    return 0;
  }

  // Placeholders never act as labels or as typed underlines
  const size_t input_count = blocks.size();
  std::vector<tbc_layout_block> added;

  for (size_t i = 0; i < input_count; ++i) {
    const tbc_layout_block& label = blocks[i];
    if (!is_label(label.text)) {
      continue;
    }

    double y_label = label.bbox.get_center_y();
    bool already = false;
    for (size_t k = 0; k < input_count && !already; ++k) {
      already = std::fabs(blocks[k].bbox.get_center_y() - y_label) <= params.same_line_y_tolerance &&
                has_captured_underline(blocks[k].text);
    }
    if (already) {
      continue;
    }

    double y_tol = params.same_line_y_tolerance;
    for (const auto& line : lines) {
      bool overlaps_vertically = !((line.y1 < label.bbox.top - y_tol) || (line.y0 > label.bbox.bottom + y_tol));
      if (overlaps_vertically && line.x1 > label.bbox.right + params.right_min_gap) {
        added.push_back(tbc_layout_block::from_span(make_placeholder(line)));
        if (verbose) {
          std::cout << "[UNDERLINE] Synthesized line after \"" << label.text.c_str() << "\" at y="
                    << line.y0 << " x=" << line.x0 << ".." << line.x1 << std::endl;
        }
        break;
      }
    }
  }

  for (auto& block : added) {
    blocks.push_back(std::move(block));
  }
  return added.size();
}
