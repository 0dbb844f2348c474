#include "normalizer.hpp"
#include "utils/string_utils.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <sstream>

namespace p1ck::engine {

namespace {

// candidate offsets for an alias according to its anchoring
std::vector<size_t> find_occurrences(std::string_view text, const token_alias& alias) {
  std::vector<size_t> offsets;
  const std::string_view needle = alias.text;
  if (needle.empty() || needle.size() > text.size()) {
    return offsets;
  }

  switch (alias.position) {
  case match_pos::begin:
    if (utils::matches_at(text, needle, match_pos::begin)) {
      offsets.push_back(0);
    }
    break;
  case match_pos::end:
    if (utils::matches_at(text, needle, match_pos::end)) {
      offsets.push_back(text.size() - needle.size());
    }
    break;
  case match_pos::anywhere:
  case match_pos::word:
    for (size_t pos = text.find(needle); pos != std::string_view::npos; pos = text.find(needle, pos + 1)) {
      if (alias.position == match_pos::word && !utils::is_word_boundary(text, pos, needle.size())) {
        continue;
      }
      offsets.push_back(pos);
    }
    break;
  }
  return offsets;
}

bool span_is_free(const std::vector<bool>& claimed, size_t offset, size_t length) {
  for (size_t i = offset; i < offset + length; ++i) {
    if (claimed[i]) {
      return false;
    }
  }
  return true;
}

template <typename T> void add_unique(std::vector<T>& values, T value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

} // namespace

bool token_set::has_os(platform::os_kind kind) const noexcept {
  return kind != platform::os_kind::unknown && std::find(os.begin(), os.end(), kind) != os.end();
}

bool token_set::has_arch(platform::arch_kind kind) const noexcept {
  return kind != platform::arch_kind::unknown && std::find(arch.begin(), arch.end(), kind) != arch.end();
}

std::string token_set::to_string() const {
  std::ostringstream oss;
  oss << "os=";
  if (os.empty()) {
    oss << "-";
  }
  for (size_t i = 0; i < os.size(); ++i) {
    oss << (i ? "," : "") << platform::to_string(os[i]);
  }
  oss << " arch=";
  if (arch.empty()) {
    oss << "-";
  }
  for (size_t i = 0; i < arch.size(); ++i) {
    oss << (i ? "," : "") << platform::to_string(arch[i]);
  }
  oss << " aux=" << (auxiliary ? "yes" : "no");
  return oss.str();
}

token_set normalize(std::string_view text, const vocabulary& vocab) {
  token_set tokens;
  const std::string lowered = utils::to_lower(text);
  if (lowered.empty()) {
    return tokens;
  }

  // vocabulary keeps aliases longest first. overlaps only matter within one kind,
  // an os alias must not hide an architecture alias as in "osx64"
  std::vector<bool> os_claimed(lowered.size(), false);
  std::vector<bool> arch_claimed(lowered.size(), false);
  for (const auto& alias : vocab.aliases()) {
    std::vector<bool>& claimed = alias.kind == token_kind::os ? os_claimed : arch_claimed;
    for (size_t offset : find_occurrences(lowered, alias)) {
      if (!span_is_free(claimed, offset, alias.text.size())) {
        continue;
      }
      std::fill(claimed.begin() + offset, claimed.begin() + offset + alias.text.size(), true);
      if (alias.kind == token_kind::os) {
        add_unique(tokens.os, alias.os);
      } else {
        add_unique(tokens.arch, alias.arch);
      }
    }
  }

  tokens.auxiliary = std::any_of(
      vocab.auxiliary_markers().begin(), vocab.auxiliary_markers().end(),
      [&](const auxiliary_marker& marker) { return utils::matches_at(lowered, marker.text, marker.position); }
  );

  auto log = redlog::get_logger("p1ck.normalizer");
  if (static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::pedantic)) {
    log.ped("normalized", redlog::field("text", std::string(text)), redlog::field("tokens", tokens.to_string()));
  }
  return tokens;
}

token_set normalize(std::string_view text) { return normalize(text, default_vocabulary()); }

token_set normalize(const platform::platform_identity& identity) {
  token_set tokens;
  if (identity.os != platform::os_kind::unknown) {
    tokens.os.push_back(identity.os);
  }
  if (identity.arch != platform::arch_kind::unknown) {
    tokens.arch.push_back(identity.arch);
  }
  return tokens;
}

} // namespace p1ck::engine
