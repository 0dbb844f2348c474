#include <doctest/doctest.h>

#include "p1ck/engine/config.hpp"
#include "p1ck/engine/normalizer.hpp"
#include "test_helpers.hpp"

namespace {

using p1ck::engine::load_options;
using p1ck::engine::normalize;
using p1ck::engine::platform_mode;
using p1ck::engine::platform::arch_kind;
using p1ck::engine::platform::os_kind;
using p1ck::test_helpers::identity;
using p1ck::test_helpers::scoped_env;
using p1ck::utils::env_config;

} // namespace

TEST_CASE("options default to auto-detection") {
  auto options = load_options(env_config("P1CK_TEST_UNSET"));
  CHECK(options.mode == platform_mode::auto_detect);
  CHECK(options.vocab.auxiliary_markers().size() == p1ck::engine::default_vocabulary().auxiliary_markers().size());
}

TEST_CASE("platform override comes from the environment") {
  scoped_env platform("P1CK_TEST_PLATFORM", "darwin:aarch64");
  auto options = load_options(env_config("P1CK_TEST"));
  CHECK(options.mode == platform_mode::explicit_identity);
  CHECK(options.identity == identity(os_kind::macos, arch_kind::arm64));
}

TEST_CASE("invalid platform override falls back to detection") {
  scoped_env platform("P1CK_TEST_PLATFORM", "amiga");
  auto options = load_options(env_config("P1CK_TEST"));
  CHECK(options.mode == platform_mode::auto_detect);
}

TEST_CASE("extra auxiliary suffixes come from the environment") {
  scoped_env suffixes("P1CK_TEST_AUX_SUFFIXES", " .blockmap, .ZSYNC ,,");
  auto options = load_options(env_config("P1CK_TEST"));
  CHECK(normalize("app-linux-x64.AppImage.blockmap", options.vocab).auxiliary);
  CHECK(normalize("app-linux-x64.AppImage.zsync", options.vocab).auxiliary);
  CHECK_FALSE(normalize("app-linux-x64.AppImage", options.vocab).auxiliary);
}
