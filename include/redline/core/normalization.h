#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace redline::core {

// Locale-independent text helpers shared by parsers, tokenizers and rules.
// All functions operate on UTF-8 bytes and treat only ASCII specially; any
// multi-byte sequence passes through untouched.

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

inline bool is_ascii_punct(const char ch) {
  return (ch >= '!' && ch <= '/') || (ch >= ':' && ch <= '@') || (ch >= '[' && ch <= '`') ||
         (ch >= '{' && ch <= '~');
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII bytes are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// utf8_length counts code points: every byte that is not a continuation byte
// (10xxxxxx) starts a new code point.
inline std::size_t utf8_length(const std::string_view input) {
  std::size_t count = 0;
  for (const char ch : input) {
    if ((static_cast<unsigned char>(ch) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

// count_occurrences counts non-overlapping occurrences of needle in haystack.
inline std::size_t count_occurrences(const std::string_view haystack,
                                     const std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  std::size_t count = 0;
  std::size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    ++count;
    pos = haystack.find(needle, pos + needle.size());
  }
  return count;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// parse_non_negative_int accepts a plain decimal string ("0".."2147483647").
// Signs, whitespace and trailing characters are rejected.
inline std::optional<int> parse_non_negative_int(const std::string_view input) {
  if (input.empty() || input.size() > 10) {
    return std::nullopt;
  }
  long long value = 0;
  for (const char ch : input) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value = value * 10 + (ch - '0');
  }
  if (value > 2147483647LL) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

}  // namespace redline::core
