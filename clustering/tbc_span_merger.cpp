#include "tbc_span_merger.h"

#include <algorithm>

namespace {
  const std::u32string underscore_chars = U"_";
  const std::u32string dash_chars = U"-\u2013\u2014";
}

tbc_span_merger::tbc_span_merger(size_t short_span_limit_val)
  : short_span_limit(short_span_limit_val)
{
}

bool tbc_span_merger::only_underscores(const tbc_string& text) {
  return text.consists_of(underscore_chars);
}

bool tbc_span_merger::only_dashes(const tbc_string& text) {
  return text.consists_of(dash_chars);
}

void tbc_span_merger::sort_reading_order(std::vector<tbc_span>& items) {
  std::stable_sort(items.begin(), items.end(), [](const tbc_span& a, const tbc_span& b) {
    if (a.bbox.top != b.bbox.top) return a.bbox.top < b.bbox.top;
    return a.bbox.left < b.bbox.left;
  });
}

std::vector<tbc_span> tbc_span_merger::merge(std::vector<tbc_span> items) const {
  std::vector<tbc_span> merged;
  if (items.empty()) {
    return merged;
  }

  sort_reading_order(items);

  merged.push_back(items[0]);
  for (size_t i = 1; i < items.size(); ++i) {
    const tbc_span& current = items[i];

    if (current.text.length_utf8() >= short_span_limit) {
      merged.push_back(current);
      continue;
    }

    tbc_span& prev = merged.back();
    bool continuous = (only_underscores(prev.text) && only_underscores(current.text)) ||
                      (only_dashes(prev.text) && only_dashes(current.text));
    prev.text = prev.text + (continuous ? "" : " ") + current.text;
    prev.bbox = prev.bbox.unite(current.bbox);
  }

  return merged;
}

tbc_string tbc_span_merger::join_text(const tbc_string& prev_text, const tbc_string& next_text) {
  if (prev_text.empty()) {
    return next_text;
  }

  tbc_string next = next_text.trim_left_utf8();
  if (next.empty()) {
    return prev_text;
  }

  std::u32string prev_cps = prev_text.code_points();
  std::u32string next_cps = next.code_points();
  char32_t last_char = prev_cps.back();
  char32_t first_char = next_cps.front();

  if (tbc_unicode::is_alpha(last_char) && tbc_unicode::is_alpha(first_char)) {
    if (tbc_unicode::is_upper(first_char) || tbc_unicode::is_cyrillic_vowel(last_char)) {
      return prev_text + " " + next;
    }
    return prev_text + next;
  }

  if (last_char == U' ' || last_char == U'-' || last_char == 0x2014 || last_char == 0x2013) {
    return prev_text + next;
  }

  return prev_text + " " + next;
}
