#pragma once

#include "engine/platform/platform.hpp"
#include "engine/vocabulary.hpp"
#include <string>
#include <vector>

namespace p1ck::engine {

enum class platform_mode { auto_detect, explicit_identity };

struct selection_options {
  platform_mode mode = platform_mode::auto_detect;
  platform::platform_identity identity{}; // used in explicit_identity mode
  vocabulary vocab = vocabulary::defaults();
};

// the identity a selection runs against: the caller's in explicit mode, else the detected one
platform::platform_identity resolve_identity(const selection_options& options);

// candidates compatible with the running platform, best first. never throws for
// malformed names; an empty result means no compatible asset.
std::vector<std::string> select(const std::vector<std::string>& candidates);
std::vector<std::string> select(const std::vector<std::string>& candidates, const selection_options& options);
std::vector<std::string> select(
    const std::vector<std::string>& candidates, const platform::platform_identity& identity
);

} // namespace p1ck::engine
