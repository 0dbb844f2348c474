#pragma once

#include <cctype>
#include <string_view>

namespace p1ck::utils {

// where a pattern has to occur inside a target string. word requires the
// neighbouring characters to be non-alphanumeric or the string edge.
enum class match_pos { anywhere, begin, end, word };

inline bool is_word_boundary(std::string_view target, size_t offset, size_t length) noexcept {
  auto is_alnum = [](char ch) { return std::isalnum(static_cast<unsigned char>(ch)) != 0; };
  bool left = offset == 0 || !is_alnum(target[offset - 1]);
  bool right = offset + length >= target.size() || !is_alnum(target[offset + length]);
  return left && right;
}

inline bool matches_at(std::string_view target, std::string_view pattern, match_pos position) noexcept {
  switch (position) {
  case match_pos::begin:
    return target.substr(0, pattern.size()) == pattern;
  case match_pos::end:
    return target.size() >= pattern.size() && target.substr(target.size() - pattern.size()) == pattern;
  case match_pos::word:
    for (size_t pos = target.find(pattern); pos != std::string_view::npos; pos = target.find(pattern, pos + 1)) {
      if (is_word_boundary(target, pos, pattern.size())) {
        return true;
      }
    }
    return false;
  case match_pos::anywhere:
  default:
    return target.find(pattern) != std::string_view::npos;
  }
}

} // namespace p1ck::utils
