#ifndef PLX_STRING_H
#define PLX_STRING_H

#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <ostream>
#include <utf8cpp/utf8.h>

// Thin wrapper around std::string with the text helpers the extraction code needs.
// Text is UTF-8. Letter and case tests work on code points (Latin, Greek, Cyrillic cased;
// other scripts count as uncased letters). Invalid UTF-8 is never alphabetic.
class plx_string
{
  std::string str;

  static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
  static bool is_high(char c) { return static_cast<unsigned char>(c) >= 0x80; }

  // 1 for uppercase, -1 for lowercase, within U+0100..U+017F.
  static int latin_extended_case(uint32_t cp)
  {
    if (cp == 0x130 || cp == 0x178) return 1;
    if (cp == 0x131 || cp == 0x138 || cp == 0x149 || cp == 0x17F) return -1;
    bool odd_upper = (cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E);
    bool upper = odd_upper ? (cp % 2 == 1) : (cp % 2 == 0);
    return upper ? 1 : -1;
  }

public:
  static bool is_upper_code_point(uint32_t cp)
  {
    if (cp >= 'A' && cp <= 'Z') return true;
    if (cp >= 0xC0 && cp <= 0xDE) return cp != 0xD7;
    if (cp >= 0x100 && cp <= 0x17F) return latin_extended_case(cp) > 0;
    if (cp >= 0x391 && cp <= 0x3A9) return cp != 0x3A2;
    return cp >= 0x400 && cp <= 0x42F;
  }

  static bool is_lower_code_point(uint32_t cp)
  {
    if (cp >= 'a' && cp <= 'z') return true;
    if (cp == 0xB5) return true;
    if (cp >= 0xDF && cp <= 0xFF) return cp != 0xF7;
    if (cp >= 0x100 && cp <= 0x17F) return latin_extended_case(cp) < 0;
    if (cp >= 0x3AC && cp <= 0x3CE) return true;
    return cp >= 0x430 && cp <= 0x45F;
  }

  static bool is_alpha_code_point(uint32_t cp)
  {
    if (cp < 0x80) return std::isalpha(static_cast<int>(cp)) != 0;
    if (cp == 0xAA || cp == 0xB5 || cp == 0xBA) return true;
    if (cp < 0xC0) return false;
    if (cp <= 0xFF) return cp != 0xD7 && cp != 0xF7;
    if (cp <= 0x2AF) return true;
    if (cp < 0x386) return false;
    if (cp <= 0x52F) return cp != 0x387;
    // Punctuation, symbol and CJK punctuation blocks.
    if (cp >= 0x2000 && cp <= 0x2BFF) return false;
    if (cp >= 0x3000 && cp <= 0x303F) return false;
    return true;
  }

public:
  static const size_t npos = std::string::npos;
  plx_string() : str() {}
  plx_string(const char* s) : str(s) {}
  plx_string(const char* s, size_t len) : str(s, len) {}
  plx_string(const std::string& s) : str(s) {}
  plx_string(std::string&& s) : str(std::move(s)) {}

  plx_string(long i) : str(std::to_string(i)) {}
  plx_string(long long i) : str(std::to_string(i)) {}
  plx_string(int i) : str(std::to_string(i)) {}
  plx_string(double d) : str(std::to_string(d)) {}
  plx_string(char c) : str(1, c) {}

  std::string& to_std() { return str; }
  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  plx_string operator+(const plx_string& s) const { return str + s.str; }
  plx_string operator+(const char* s) const { return str + s; }
  plx_string& operator+=(const plx_string& s) { str += s.str; return *this; }
  plx_string& operator+=(char c) { str += c; return *this; }
  bool operator==(const plx_string& s) const { return str == s.str; }
  bool operator!=(const plx_string& s) const { return str != s.str; }
  bool operator<(const plx_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }
  size_t length() const { return str.length(); }

  // Characters, not bytes. Falls back to the byte count for invalid UTF-8.
  size_t char_count() const
  {
    if (!utf8::is_valid(str.begin(), str.end())) return str.size();
    return static_cast<size_t>(utf8::distance(str.begin(), str.end()));
  }

  // Decoded text; empty when the bytes are not valid UTF-8.
  std::vector<uint32_t> code_points() const
  {
    std::vector<uint32_t> out;
    if (!utf8::is_valid(str.begin(), str.end())) return out;
    utf8::utf8to32(str.begin(), str.end(), std::back_inserter(out));
    return out;
  }
  void clear() { str.clear(); }

  char& operator[](size_t i) { return str[i]; }
  char operator[](size_t i) const { return str[i]; }

  std::string::const_iterator begin() const { return str.begin(); }
  std::string::const_iterator end() const { return str.end(); }

  plx_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }
  size_t find(const plx_string& s, size_t pos = 0) const { return str.find(s.str, pos); }
  bool contains(const plx_string& s) const { return str.find(s.str) != std::string::npos; }

  plx_string& append(const char* s, size_t len)
  {
    str.append(s, len);
    return *this;
  }

  plx_string& erase(size_t pos = 0, size_t len = npos)
  {
    str.erase(pos, len);
    return *this;
  }

  long to_int(long def = 0) const
  {
    try
    {
      size_t used = 0;
      long v = std::stol(str, &used);
      return used == str.size() ? v : def;
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
      return std::stod(str);
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

  bool is_integer() const
  {
    plx_string t = trim();
    if (t.empty()) return false;
    size_t start = (t.str[0] == '-' || t.str[0] == '+') ? 1 : 0;
    if (start >= t.size()) return false;
    return std::all_of(t.str.begin() + start, t.str.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
  }

  bool is_number() const
  {
    plx_string t = trim();
    if (t.empty()) return false;
    try
    {
      size_t used = 0;
      std::stod(t.str, &used);
      return used == t.size();
    }
    catch (const std::invalid_argument&)
    {
      return false;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
  }

  plx_string lower() const
  {
    plx_string res = *this;
    for (char& c : res.str)
    {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return res;
  }

  plx_string upper() const
  {
    plx_string res = *this;
    for (char& c : res.str)
    {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return res;
  }

  plx_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return plx_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  bool starts_with(const plx_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool ends_with(const plx_string& suffix) const
  {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix.str) == 0;
  }

  std::vector<plx_string> split(const plx_string& delim) const
  {
    std::vector<plx_string> out;
    size_t pos = 0;
    size_t last = 0;
    while ((pos = str.find(delim.str, last)) != std::string::npos)
    {
      out.push_back(str.substr(last, pos - last));
      last = pos + delim.size();
    }
    out.push_back(str.substr(last));
    return out;
  }

  plx_string join(const std::vector<plx_string>& parts) const
  {
    plx_string result;
    for (size_t i = 0; i < parts.size(); ++i)
    {
      if (i > 0) result += *this;
      result += parts[i];
    }
    return result;
  }

  // Whitespace runs become one space, ends are trimmed.
  plx_string normalize_whitespace() const
  {
    plx_string result;
    bool in_whitespace = false;
    for (char c : str)
    {
      if (is_space(c))
      {
        if (!in_whitespace)
        {
          result += ' ';
          in_whitespace = true;
        }
      }
      else
      {
        result += c;
        in_whitespace = false;
      }
    }
    return result.trim();
  }

  // Drops punctuation, keeps letters, digits, whitespace and non-ASCII bytes.
  plx_string strip_punctuation() const
  {
    plx_string result;
    for (char c : str)
    {
      if (std::isalnum(static_cast<unsigned char>(c)) || is_space(c) || is_high(c))
      {
        result += c;
      }
    }
    return result;
  }

  bool is_alpha() const
  {
    std::vector<uint32_t> cps = code_points();
    if (cps.empty()) return false;
    return std::all_of(cps.begin(), cps.end(), is_alpha_code_point);
  }

  // True when at least one cased letter exists and none is lowercase.
  bool is_upper() const
  {
    bool has_cased = false;
    for (uint32_t cp : code_points())
    {
      if (is_lower_code_point(cp)) return false;
      if (is_upper_code_point(cp)) has_cased = true;
    }
    return has_cased;
  }
};

inline plx_string operator+(const char* lhs, const plx_string& rhs)
{
  return plx_string(lhs) + rhs;
}

inline std::ostream& operator<<(std::ostream& os, const plx_string& s)
{
  return os << s.to_std_const();
}

#endif // PLX_STRING_H
