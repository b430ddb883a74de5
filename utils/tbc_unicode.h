#ifndef TBC_UNICODE_H
#define TBC_UNICODE_H

#include <string>

// Code point level helpers on top of utf8cpp. Classification covers the
// scripts that show up in extracted page text; anything outside the tables
// is treated as a non-letter.
namespace tbc_unicode {

  // Decodes UTF-8, replacing malformed sequences with U+FFFD.
  std::u32string decode(const std::string& utf8_text);
  std::string encode(const std::u32string& code_points);

  bool is_alpha(char32_t cp);
  bool is_upper(char32_t cp);
  char32_t to_lower(char32_t cp);

  // а е ё и о у ы э ю я in both cases
  bool is_cyrillic_vowel(char32_t cp);

  bool is_space(char32_t cp);

} // namespace tbc_unicode

#endif // TBC_UNICODE_H
