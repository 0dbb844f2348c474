#pragma once

#include "engine/platform/platform.hpp"
#include "engine/result.hpp"
#include "utils/match_pos.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace p1ck::engine {

using utils::match_pos;

enum class token_kind { os, arch };

// one recognized spelling of a canonical os or architecture token
struct token_alias {
  token_kind kind = token_kind::os;
  platform::os_kind os = platform::os_kind::unknown;
  platform::arch_kind arch = platform::arch_kind::unknown;
  std::string text;
  match_pos position = match_pos::anywhere;
};

// suffix (or other pattern) marking debug symbols, checksums, signatures and similar
struct auxiliary_marker {
  std::string text;
  match_pos position = match_pos::end;
};

// alias tables mapping free-form spellings onto canonical tokens.
// aliases are kept longest first so overlapping spellings resolve to the longer one.
class vocabulary {
public:
  vocabulary() = default;

  // the built-in table of real-world asset naming conventions
  static vocabulary defaults();

  status add_os_alias(platform::os_kind os, std::string_view text, match_pos position = match_pos::anywhere);
  status add_arch_alias(platform::arch_kind arch, std::string_view text, match_pos position = match_pos::anywhere);
  status add_auxiliary_marker(std::string_view text, match_pos position = match_pos::end);

  const std::vector<token_alias>& aliases() const noexcept { return aliases_; }
  const std::vector<auxiliary_marker>& auxiliary_markers() const noexcept { return auxiliary_; }

  // exact lookup of a canonical name or unanchored alias, used for explicit identities
  platform::os_kind resolve_os(std::string_view name) const;
  platform::arch_kind resolve_arch(std::string_view name) const;

private:
  status insert_alias(token_alias alias);

  std::vector<token_alias> aliases_;
  std::vector<auxiliary_marker> auxiliary_;
};

// shared immutable instance of vocabulary::defaults()
const vocabulary& default_vocabulary();

} // namespace p1ck::engine
