#include "vocabulary.hpp"
#include "utils/string_utils.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace p1ck::engine {

namespace {

using platform::arch_kind;
using platform::os_kind;

struct os_row {
  os_kind os;
  const char* text;
  match_pos position;
};

struct arch_row {
  arch_kind arch;
  const char* text;
  match_pos position;
};

constexpr os_row k_os_table[] = {
    {os_kind::windows, "windows", match_pos::anywhere},
    {os_kind::windows, "win32", match_pos::anywhere},
    {os_kind::windows, "win64", match_pos::anywhere},
    {os_kind::windows, ".exe", match_pos::end},
    {os_kind::windows, ".msi", match_pos::end},
    {os_kind::macos, "darwin", match_pos::anywhere},
    {os_kind::macos, "macos", match_pos::anywhere},
    {os_kind::macos, "osx", match_pos::anywhere},
    {os_kind::gnu_linux, "linux", match_pos::anywhere},
    {os_kind::freebsd, "freebsd", match_pos::anywhere},
    {os_kind::netbsd, "netbsd", match_pos::anywhere},
    {os_kind::openbsd, "openbsd", match_pos::anywhere},
};

constexpr arch_row k_arch_table[] = {
    {arch_kind::x64, "x64", match_pos::anywhere},
    {arch_kind::x64, "x86_64", match_pos::anywhere},
    {arch_kind::x64, "x86-64", match_pos::anywhere},
    {arch_kind::x64, "amd64", match_pos::anywhere},
    {arch_kind::arm64, "arm64", match_pos::anywhere},
    {arch_kind::arm64, "aarch64", match_pos::anywhere},
    {arch_kind::arm64, "armv8", match_pos::anywhere},
    {arch_kind::arm32_hard_float, "armhf", match_pos::anywhere},
    {arch_kind::arm32_hard_float, "armv7", match_pos::anywhere},
    {arch_kind::arm32_hard_float, "arm", match_pos::word},
    {arch_kind::x86, "x86", match_pos::word},
    {arch_kind::x86, "i386", match_pos::anywhere},
    {arch_kind::x86, "i686", match_pos::anywhere},
    {arch_kind::riscv64, "riscv64", match_pos::anywhere},
};

// debug symbols, checksums and signatures
constexpr const char* k_auxiliary_suffixes[] = {
    ".debug", ".dwarf",    ".pdb", ".dbg", ".sha256", ".sha512",  ".sha256sum",
    ".sha",   ".checksum", ".md5", ".asc", ".sig",    ".minisig", ".txt",
};

bool same_token(const token_alias& a, const token_alias& b) {
  if (a.kind != b.kind) {
    return false;
  }
  return a.kind == token_kind::os ? a.os == b.os : a.arch == b.arch;
}

bool is_unanchored(match_pos position) { return position == match_pos::anywhere || position == match_pos::word; }

std::string describe_token(const token_alias& alias) {
  return alias.kind == token_kind::os ? platform::to_string(alias.os) : platform::to_string(alias.arch);
}

} // namespace

vocabulary vocabulary::defaults() {
  auto log = redlog::get_logger("p1ck.vocabulary");
  auto check = [&](const status& added, const char* text) {
    if (!added.ok()) {
      log.err(
          "built-in alias rejected", redlog::field("alias", std::string(text)), redlog::field("error", added.message)
      );
    }
  };

  vocabulary vocab;
  for (const auto& row : k_os_table) {
    check(vocab.add_os_alias(row.os, row.text, row.position), row.text);
  }
  for (const auto& row : k_arch_table) {
    check(vocab.add_arch_alias(row.arch, row.text, row.position), row.text);
  }
  for (const char* suffix : k_auxiliary_suffixes) {
    check(vocab.add_auxiliary_marker(suffix, match_pos::end), suffix);
  }
  return vocab;
}

status vocabulary::add_os_alias(platform::os_kind os, std::string_view text, match_pos position) {
  if (os == os_kind::unknown) {
    return make_status(error_code::invalid_argument, "cannot alias the unknown operating system");
  }
  token_alias alias;
  alias.kind = token_kind::os;
  alias.os = os;
  alias.text = utils::to_lower(utils::trim_view(text));
  alias.position = position;
  return insert_alias(std::move(alias));
}

status vocabulary::add_arch_alias(platform::arch_kind arch, std::string_view text, match_pos position) {
  if (arch == arch_kind::unknown) {
    return make_status(error_code::invalid_argument, "cannot alias the unknown architecture");
  }
  token_alias alias;
  alias.kind = token_kind::arch;
  alias.arch = arch;
  alias.text = utils::to_lower(utils::trim_view(text));
  alias.position = position;
  return insert_alias(std::move(alias));
}

status vocabulary::add_auxiliary_marker(std::string_view text, match_pos position) {
  std::string lowered = utils::to_lower(utils::trim_view(text));
  if (lowered.empty()) {
    return make_status(error_code::invalid_argument, "empty auxiliary marker");
  }
  auto existing = std::find_if(auxiliary_.begin(), auxiliary_.end(), [&](const auxiliary_marker& marker) {
    return marker.text == lowered && marker.position == position;
  });
  if (existing == auxiliary_.end()) {
    auxiliary_.push_back(auxiliary_marker{std::move(lowered), position});
  }
  return ok_status();
}

status vocabulary::insert_alias(token_alias alias) {
  auto log = redlog::get_logger("p1ck.vocabulary");
  if (alias.text.empty()) {
    return make_status(error_code::invalid_argument, "empty alias");
  }

  for (const auto& existing : aliases_) {
    if (existing.text != alias.text || existing.position != alias.position) {
      continue;
    }
    if (same_token(existing, alias)) {
      return ok_status();
    }
    log.wrn(
        "alias already mapped to another token", redlog::field("alias", alias.text),
        redlog::field("existing", describe_token(existing)), redlog::field("requested", describe_token(alias))
    );
    return make_status(
        error_code::invalid_argument, "alias '" + alias.text + "' already maps to " + describe_token(existing)
    );
  }

  // keep longest first, equal lengths in insertion order
  auto pos = std::find_if(aliases_.begin(), aliases_.end(), [&](const token_alias& existing) {
    return existing.text.size() < alias.text.size();
  });
  log.trc("adding alias", redlog::field("alias", alias.text), redlog::field("token", describe_token(alias)));
  aliases_.insert(pos, std::move(alias));
  return ok_status();
}

platform::os_kind vocabulary::resolve_os(std::string_view name) const {
  std::string lowered = utils::to_lower(utils::trim_view(name));
  for (const auto& alias : aliases_) {
    if (alias.kind != token_kind::os) {
      continue;
    }
    if (lowered == platform::to_string(alias.os)) {
      return alias.os;
    }
    if (is_unanchored(alias.position) && lowered == alias.text) {
      return alias.os;
    }
  }
  return os_kind::unknown;
}

platform::arch_kind vocabulary::resolve_arch(std::string_view name) const {
  std::string lowered = utils::to_lower(utils::trim_view(name));
  for (const auto& alias : aliases_) {
    if (alias.kind != token_kind::arch) {
      continue;
    }
    if (lowered == platform::to_string(alias.arch)) {
      return alias.arch;
    }
    if (is_unanchored(alias.position) && lowered == alias.text) {
      return alias.arch;
    }
  }
  return arch_kind::unknown;
}

const vocabulary& default_vocabulary() {
  static const vocabulary vocab = vocabulary::defaults();
  return vocab;
}

} // namespace p1ck::engine
