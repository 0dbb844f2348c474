#pragma once

#include "engine/platform/platform.hpp"
#include "engine/vocabulary.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace p1ck::engine {

// canonical tokens recognized in one string; each kind appears at most once, in order of first occurrence
struct token_set {
  std::vector<platform::os_kind> os;
  std::vector<platform::arch_kind> arch;
  bool auxiliary = false;

  bool has_os(platform::os_kind kind) const noexcept;
  bool has_arch(platform::arch_kind kind) const noexcept;
  bool empty() const noexcept { return os.empty() && arch.empty() && !auxiliary; }

  // e.g. "os=linux arch=x64,armhf aux=yes"
  std::string to_string() const;
};

// case-insensitive tokenization of a candidate name. longer aliases are matched first and
// claim their characters, so "x86_64" never also counts as "x86".
token_set normalize(std::string_view text, const vocabulary& vocab);
token_set normalize(std::string_view text);

// tokens of a platform identity, through the same canonical vocabulary as candidates
token_set normalize(const platform::platform_identity& identity);

} // namespace p1ck::engine
