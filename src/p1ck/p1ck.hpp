#pragma once

// platform identity and detection
#include "engine/platform/platform.hpp"

// alias tables and tokenization
#include "engine/vocabulary.hpp"
#include "engine/normalizer.hpp"

// ranking and the selection entry point
#include "engine/ranker.hpp"
#include "engine/selector.hpp"
#include "engine/config.hpp"

// utilities
#include "utils/filter.hpp"
#include "utils/env_config.hpp"
#include "utils/string_utils.hpp"
