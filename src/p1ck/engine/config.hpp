#pragma once

#include "engine/selector.hpp"
#include "utils/env_config.hpp"

namespace p1ck::engine {

// environment prefix for all settings, e.g. P1CK_PLATFORM
inline constexpr const char* k_env_prefix = "P1CK";

// selection options from P1CK_PLATFORM (explicit os:arch) and P1CK_AUX_SUFFIXES (extra comma-separated
// auxiliary suffixes). invalid values are logged and ignored.
selection_options load_options(const utils::env_config& env);
selection_options load_options();

} // namespace p1ck::engine
