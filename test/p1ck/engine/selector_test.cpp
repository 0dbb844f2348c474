#include <doctest/doctest.h>

#include "p1ck/engine/selector.hpp"
#include "test_helpers.hpp"

#include <thread>

namespace {

namespace engine = p1ck::engine;

using p1ck::engine::platform_mode;
using p1ck::engine::resolve_identity;
using p1ck::engine::selection_options;
using p1ck::engine::platform::arch_kind;
using p1ck::engine::platform::detect_platform;
using p1ck::engine::platform::os_kind;
using p1ck::test_helpers::identity;
using p1ck::test_helpers::typstyle_assets;

using names = std::vector<std::string>;

selection_options explicit_options(os_kind os, arch_kind arch) {
  selection_options options;
  options.mode = platform_mode::explicit_identity;
  options.identity = identity(os, arch);
  return options;
}

} // namespace

TEST_CASE("select on empty input returns nothing") {
  CHECK(engine::select({}).empty());
  CHECK(engine::select({}, explicit_options(os_kind::gnu_linux, arch_kind::x64)).empty());
}

TEST_CASE("select auto-detects the running platform") {
  auto assets = typstyle_assets();
  CHECK(engine::select(assets) == engine::select(assets, detect_platform()));
  CHECK(resolve_identity(selection_options{}) == detect_platform());
#if defined(__linux__) && (defined(__x86_64__) || defined(_M_X64))
  auto selected = engine::select(assets);
  REQUIRE_FALSE(selected.empty());
  CHECK(selected.front() == "typstyle-linux-x64");
#endif
}

TEST_CASE("explicit identities override detection") {
  auto options = explicit_options(os_kind::windows, arch_kind::arm64);
  CHECK(resolve_identity(options) == identity(os_kind::windows, arch_kind::arm64));
  CHECK(engine::select(typstyle_assets(), options) == names{"typstyle-win32-arm64.exe", "typstyle-win32-arm64.pdb"});
}

TEST_CASE("select is idempotent") {
  auto options = explicit_options(os_kind::macos, arch_kind::x64);
  auto assets = typstyle_assets();
  auto first = engine::select(assets, options);
  auto second = engine::select(assets, options);
  CHECK(first == second);
  CHECK(first == names{"typstyle-darwin-x64", "typstyle-darwin-x64.dwarf"});
}

TEST_CASE("select tolerates names without tokens") {
  names assets{"", "checksums.txt", "source.tar.gz", "app-linux-x64"};
  CHECK(engine::select(assets, explicit_options(os_kind::gnu_linux, arch_kind::x64)) == names{"app-linux-x64"});
}

TEST_CASE("select with an unknown identity returns nothing") {
  CHECK(engine::select(typstyle_assets(), explicit_options(os_kind::unknown, arch_kind::unknown)).empty());
  CHECK(engine::select(typstyle_assets(), identity(os_kind::gnu_linux, arch_kind::unknown)).empty());
}

TEST_CASE("select uses the options vocabulary") {
  auto options = explicit_options(os_kind::gnu_linux, arch_kind::x64);
  names assets{"app-ubuntu-x64", "app-linux-x64.AppImage.zsync", "app-linux-x64.AppImage"};
  CHECK(engine::select(assets, options) == names{"app-linux-x64.AppImage", "app-linux-x64.AppImage.zsync"});

  REQUIRE(options.vocab.add_os_alias(os_kind::gnu_linux, "ubuntu").ok());
  REQUIRE(options.vocab.add_auxiliary_marker(".zsync").ok());
  CHECK(engine::select(assets, options) == names{"app-ubuntu-x64", "app-linux-x64.AppImage", "app-linux-x64.AppImage.zsync"});
}

TEST_CASE("concurrent selections agree") {
  auto options = explicit_options(os_kind::gnu_linux, arch_kind::arm64);
  auto assets = typstyle_assets();
  auto expected = engine::select(assets, options);

  std::vector<names> results(4);
  std::vector<std::thread> workers;
  for (size_t i = 0; i < results.size(); ++i) {
    workers.emplace_back([&, i] { results[i] = engine::select(assets, options); });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  for (const auto& result : results) {
    CHECK(result == expected);
  }
  CHECK(expected == names{"typstyle-linux-arm64", "typstyle-linux-arm64.debug"});
}
