#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace utf8 {

// Byte length of a UTF-8 character from its first byte.
inline size_t char_len(unsigned char first_byte) {
  if ((first_byte & 0x80) == 0) return 1;
  if ((first_byte & 0xE0) == 0xC0) return 2;
  if ((first_byte & 0xF0) == 0xE0) return 3;
  if ((first_byte & 0xF8) == 0xF0) return 4;
  return 1;  // Invalid, treat as 1
}

// Count the number of Unicode codepoints in a UTF-8 string.
inline size_t codepoint_count(const std::string& s) {
  size_t count = 0;
  for (size_t i = 0; i < s.size();) {
    size_t n = char_len(static_cast<unsigned char>(s[i]));
    if (i + n > s.size()) n = 1;
    i += n;
    ++count;
  }
  return count;
}

inline bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline std::string trim(const std::string& s) {
  size_t l = 0;
  while (l < s.size() && is_space(s[l])) l++;
  size_t r = s.size();
  while (r > l && is_space(s[r - 1])) r--;
  return s.substr(l, r - l);
}

// Split on ASCII whitespace runs; never yields empty pieces.
inline std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_space(s[i])) i++;
    size_t j = i;
    while (j < s.size() && !is_space(s[j])) j++;
    if (j > i) out.push_back(s.substr(i, j - i));
    i = j;
  }
  return out;
}

// Trim and collapse every whitespace run (newlines included) to one space.
inline std::string collapse_whitespace(const std::string& s) {
  std::string out;
  for (const auto& w : split_words(s)) {
    if (!out.empty()) out.push_back(' ');
    out += w;
  }
  return out;
}

inline std::string strip_bom(std::string content) {
  if (content.size() >= 3 && (unsigned char)content[0] == 0xEF && (unsigned char)content[1] == 0xBB &&
      (unsigned char)content[2] == 0xBF) {
    content.erase(0, 3);
  }
  return content;
}

}  // namespace utf8
