#ifndef TBC_STRING_H
#define TBC_STRING_H

#include "tbc_unicode.h"

#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

// Wrapper around a UTF-8 encoded std::string with the text helpers the
// clustering code needs. Byte oriented helpers (find, substr, trim) work on
// the raw bytes; the *_utf8 helpers work on code points.
class tbc_string
{
  std::string str;
public:
  static const size_t npos = std::string::npos;
  tbc_string() : str() {}
  tbc_string(const char* s) : str(s) {}
  tbc_string(const char* s, size_t len) : str(s, len) {}
  tbc_string(const std::string& s) : str(s) {}
  tbc_string(char c) : str(1, c) {}

  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  tbc_string operator+(const tbc_string& s) const { return str + s.str; }
  tbc_string operator+(const char* s) const { return str + s; }
  tbc_string& operator+=(const tbc_string& s) { str += s.str; return *this; }
  bool operator==(const tbc_string& s) const { return str == s.str; }
  bool operator!=(const tbc_string& s) const { return str != s.str; }
  bool operator<(const tbc_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }

  tbc_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }

  void clear() { str.clear(); }

  // base 0 accepts 0x prefixed hex; trailing garbage yields def
  long to_int(long def = 0, int base = 10) const
  {
    try
    {
      size_t consumed = 0;
      long value = std::stol(str, &consumed, base);
      if (str.find_first_not_of(" \t\n\r\f\v", consumed) != std::string::npos) return def;
      return value;
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  double to_double(double def = 0) const
  {
    try
    {
      size_t consumed = 0;
      double value = std::stod(str, &consumed);
      if (str.find_first_not_of(" \t\n\r\f\v", consumed) != std::string::npos) return def;
      return value;
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  size_t find(const tbc_string& s) const { return str.find(s.str); }

  bool contains(const tbc_string& s) const { return str.find(s.str) != std::string::npos; }

  tbc_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return tbc_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  bool starts_with(const tbc_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool ends_with(const tbc_string& suffix) const
  {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix.str) == 0;
  }

  size_t split(const tbc_string& delim, std::vector<tbc_string>& out) const
  {
    size_t pos = 0;
    size_t lastPos = 0;
    while ((pos = str.find(delim.str, lastPos)) != std::string::npos)
    {
      out.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = pos + delim.size();
    }
    out.push_back(str.substr(lastPos));
    return out.size();
  }

  std::vector<tbc_string> split(const tbc_string& delim) const
  {
    std::vector<tbc_string> out;
    split(delim, out);
    return out;
  }

  tbc_string repeat(size_t times) const
  {
    tbc_string result;
    result.str.reserve(str.size() * times);
    for (size_t i = 0; i < times; ++i) {
      result += *this;
    }
    return result;
  }

  tbc_string join(const std::vector<tbc_string>& parts) const
  {
    if (parts.empty()) return tbc_string();
    if (parts.size() == 1) return parts[0];

    tbc_string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
      result += *this + parts[i];
    }
    return result;
  }

  // Code point view of the text
  std::u32string code_points() const
  {
    return tbc_unicode::decode(str);
  }

  size_t length_utf8() const
  {
    return code_points().size();
  }

  // Lower-cases every code point the Unicode tables know about
  tbc_string lower_utf8() const
  {
    std::u32string cps = code_points();
    for (char32_t& cp : cps) {
      cp = tbc_unicode::to_lower(cp);
    }
    return tbc_unicode::encode(cps);
  }

  // True when the text is non-empty and every code point is in `allowed`
  bool consists_of(const std::u32string& allowed) const
  {
    if (str.empty()) return false;
    std::u32string cps = code_points();
    return std::all_of(cps.begin(), cps.end(), [&allowed](char32_t cp) {
      return allowed.find(cp) != std::u32string::npos;
    });
  }

  // Whitespace per the Unicode tables, not just ASCII
  tbc_string trim_left_utf8() const
  {
    std::u32string cps = code_points();
    size_t start = 0;
    while (start < cps.size() && tbc_unicode::is_space(cps[start])) {
      ++start;
    }
    return tbc_unicode::encode(cps.substr(start));
  }
};

inline tbc_string operator+(const char* lhs, const tbc_string& rhs) {
    return tbc_string(lhs) + rhs;
}

#endif // TBC_STRING_H
