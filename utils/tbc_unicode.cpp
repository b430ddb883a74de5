#include "tbc_unicode.h"

#include <iterator>

#include <utf8cpp/utf8.h>

namespace {

  struct code_range {
    char32_t first;
    char32_t last;
  };

  struct case_pair {
    char32_t upper;
    char32_t lower;
  };

  // Letters without case (or where case does not matter for joining)
  const code_range caseless_letters[] = {
    { 0x00AA, 0x00AA }, { 0x00BA, 0x00BA },
    { 0x05D0, 0x05EA },   // Hebrew
    { 0x0620, 0x064A },   // Arabic
    { 0x0671, 0x06D3 },
    { 0x0904, 0x0939 },   // Devanagari
    { 0x093D, 0x093D },
    { 0x0950, 0x0950 },
    { 0x0958, 0x0961 },
    { 0x0971, 0x097F },
    { 0x0E01, 0x0E30 },   // Thai
    { 0x10D0, 0x10FA },   // Georgian Mkhedruli
    { 0x10FC, 0x10FF },
    { 0x2D00, 0x2D25 },   // Georgian Nuskhuri
    { 0x2D27, 0x2D27 }, { 0x2D2D, 0x2D2D },
    { 0x3041, 0x3096 },   // Hiragana
    { 0x30A1, 0x30FA },   // Katakana
    { 0x4E00, 0x9FFF },   // CJK unified ideographs
    { 0xAC00, 0xD7A3 },   // Hangul syllables
  };

  // Blocks where upper and lower case alternate, upper on even code points
  const code_range even_paired_blocks[] = {
    { 0x0100, 0x012F }, { 0x0132, 0x0137 }, { 0x014A, 0x0177 },
    { 0x01A0, 0x01A5 }, { 0x01DE, 0x01EF }, { 0x01F4, 0x01F5 },
    { 0x01F8, 0x021F }, { 0x0222, 0x0233 }, { 0x0246, 0x024F },
    { 0x03D8, 0x03EF },
    { 0x0460, 0x0481 }, { 0x048A, 0x04BF }, { 0x04D0, 0x04FF },
    { 0x0500, 0x052F },
    { 0x1E00, 0x1E95 }, { 0x1EA0, 0x1EFF },
  };

  // Same, upper on odd code points
  const code_range odd_paired_blocks[] = {
    { 0x0139, 0x0148 }, { 0x0179, 0x017E }, { 0x01CD, 0x01DC },
    { 0x04C1, 0x04CE },
  };

  // Capitals whose lower case form is not a neighbour in a paired block
  const case_pair irregular_capitals[] = {
    { 0x0130, 0x0069 }, { 0x0178, 0x00FF },
    { 0x0181, 0x0253 }, { 0x0182, 0x0183 }, { 0x0184, 0x0185 }, { 0x0186, 0x0254 },
    { 0x0187, 0x0188 }, { 0x0189, 0x0256 }, { 0x018A, 0x0257 }, { 0x018B, 0x018C },
    { 0x018E, 0x01DD }, { 0x018F, 0x0259 }, { 0x0190, 0x025B }, { 0x0191, 0x0192 },
    { 0x0193, 0x0260 }, { 0x0194, 0x0263 }, { 0x0196, 0x0269 }, { 0x0197, 0x0268 },
    { 0x0198, 0x0199 }, { 0x019C, 0x026F }, { 0x019D, 0x0272 }, { 0x019F, 0x0275 },
    { 0x01A7, 0x01A8 }, { 0x01A9, 0x0283 }, { 0x01AC, 0x01AD }, { 0x01AE, 0x0288 },
    { 0x01AF, 0x01B0 }, { 0x01B1, 0x028A }, { 0x01B2, 0x028B }, { 0x01B3, 0x01B4 },
    { 0x01B5, 0x01B6 }, { 0x01B7, 0x0292 }, { 0x01B8, 0x01B9 }, { 0x01BC, 0x01BD },
    { 0x01C4, 0x01C6 }, { 0x01C7, 0x01C9 }, { 0x01CA, 0x01CC }, { 0x01F1, 0x01F3 },
    { 0x01F6, 0x0195 }, { 0x01F7, 0x01BF }, { 0x0220, 0x019E }, { 0x023A, 0x2C65 },
    { 0x023B, 0x023C }, { 0x023D, 0x019A }, { 0x023E, 0x2C66 }, { 0x0241, 0x0242 },
    { 0x0243, 0x0180 }, { 0x0244, 0x0289 }, { 0x0245, 0x028C },
    { 0x0386, 0x03AC }, { 0x038C, 0x03CC }, { 0x03CF, 0x03D7 }, { 0x03F4, 0x03B8 },
    { 0x03F7, 0x03F8 }, { 0x03F9, 0x03F2 }, { 0x03FA, 0x03FB },
    { 0x04C0, 0x04CF },
    { 0x10C7, 0x2D27 }, { 0x10CD, 0x2D2D },
    { 0x1E9E, 0x00DF },
  };

  template <size_t N>
  bool in_ranges(char32_t cp, const code_range (&ranges)[N])
  {
    for (const code_range& range : ranges) {
      if (cp >= range.first && cp <= range.last) {
        return true;
      }
    }
    return false;
  }

  const case_pair* find_irregular(char32_t cp)
  {
    for (const case_pair& pair : irregular_capitals) {
      if (pair.upper == cp) {
        return &pair;
      }
    }
    return nullptr;
  }

} // namespace

namespace tbc_unicode {

std::u32string decode(const std::string& utf8_text)
{
  std::string valid;
  valid.reserve(utf8_text.size());
  utf8::replace_invalid(utf8_text.begin(), utf8_text.end(), std::back_inserter(valid));

  std::u32string result;
  result.reserve(valid.size());
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(result));
  return result;
}

std::string encode(const std::u32string& code_points)
{
  std::string result;
  result.reserve(code_points.size());
  for (char32_t cp : code_points) {
    // Surrogates and values past U+10FFFF have no UTF-8 form
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      continue;
    }
    utf8::append(cp, std::back_inserter(result));
  }
  return result;
}

bool is_upper(char32_t cp)
{
  if (cp >= U'A' && cp <= U'Z') return true;
  if (cp < 0x80) return false;

  // Latin-1
  if ((cp >= 0x00C0 && cp <= 0x00D6) || (cp >= 0x00D8 && cp <= 0x00DE)) return true;
  if (in_ranges(cp, even_paired_blocks)) return cp % 2 == 0;
  if (in_ranges(cp, odd_paired_blocks)) return cp % 2 == 1;
  if (find_irregular(cp) != nullptr) return true;

  // Greek
  if (cp >= 0x0388 && cp <= 0x038F && cp != 0x038B && cp != 0x038D) return true;
  if (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) return true;
  if (cp >= 0x03FD && cp <= 0x03FF) return true;

  // Cyrillic
  if (cp >= 0x0400 && cp <= 0x042F) return true;

  // Armenian
  if (cp >= 0x0531 && cp <= 0x0556) return true;

  // Georgian Asomtavruli and Mtavruli
  if (cp >= 0x10A0 && cp <= 0x10C5) return true;
  if ((cp >= 0x1C90 && cp <= 0x1CBA) || (cp >= 0x1CBD && cp <= 0x1CBF)) return true;

  // Fullwidth Latin
  if (cp >= 0xFF21 && cp <= 0xFF3A) return true;

  return false;
}

bool is_alpha(char32_t cp)
{
  if ((cp >= U'A' && cp <= U'Z') || (cp >= U'a' && cp <= U'z')) return true;
  if (cp < 0x80) return false;
  if (is_upper(cp)) return true;

  if (cp == 0x00B5) return true;
  if (cp >= 0x00C0 && cp <= 0x024F && cp != 0x00D7 && cp != 0x00F7) return true;
  if (cp >= 0x0250 && cp <= 0x02AF) return true;   // IPA extensions

  if (cp == 0x0386 || (cp >= 0x0388 && cp <= 0x03FF && cp != 0x03A2 && cp != 0x03F6)) return true;
  if ((cp >= 0x0400 && cp <= 0x0481) || (cp >= 0x048A && cp <= 0x052F)) return true;
  if ((cp >= 0x0531 && cp <= 0x0556) || (cp >= 0x0561 && cp <= 0x0587)) return true;
  if (cp >= 0x1E00 && cp <= 0x1EFF) return true;
  if (cp == 0x2C65 || cp == 0x2C66) return true;
  if ((cp >= 0xFF21 && cp <= 0xFF3A) || (cp >= 0xFF41 && cp <= 0xFF5A)) return true;

  return in_ranges(cp, caseless_letters);
}

char32_t to_lower(char32_t cp)
{
  if (!is_upper(cp)) return cp;

  if (cp < 0x80) return cp + 0x20;
  if (cp <= 0x00DE) return cp + 0x20;
  if (const case_pair* pair = find_irregular(cp)) return pair->lower;
  if (in_ranges(cp, even_paired_blocks) || in_ranges(cp, odd_paired_blocks)) return cp + 1;
  if (cp >= 0x0388 && cp <= 0x038A) return cp + 0x25;
  if (cp == 0x038E || cp == 0x038F) return cp + 0x3F;
  if (cp >= 0x0391 && cp <= 0x03AB) return cp + 0x20;
  if (cp >= 0x03FD && cp <= 0x03FF) return cp - 0x82;
  if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
  if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
  if (cp >= 0x0531 && cp <= 0x0556) return cp + 0x30;
  if (cp >= 0x10A0 && cp <= 0x10C5) return cp + 0x1C60;
  if (cp >= 0x1C90 && cp <= 0x1CBF) return cp - 0x0BC0;
  if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;
  return cp;
}

bool is_cyrillic_vowel(char32_t cp)
{
  switch (cp) {
    case 0x0430: case 0x0435: case 0x0451: case 0x0438: case 0x043E:
    case 0x0443: case 0x044B: case 0x044D: case 0x044E: case 0x044F:
    case 0x0410: case 0x0415: case 0x0401: case 0x0418: case 0x041E:
    case 0x0423: case 0x042B: case 0x042D: case 0x042E: case 0x042F:
      return true;
    default:
      return false;
  }
}

bool is_space(char32_t cp)
{
  return cp == U' ' || (cp >= 0x09 && cp <= 0x0D) || cp == 0x00A0 ||
         cp == 0x2007 || cp == 0x202F || cp == 0x3000 ||
         (cp >= 0x2000 && cp <= 0x200A);
}

} // namespace tbc_unicode
