#pragma once

#include "engine/result.hpp"
#include <string>
#include <string_view>

namespace p1ck::engine {
class vocabulary;
} // namespace p1ck::engine

namespace p1ck::engine::platform {

enum class os_kind { windows, macos, gnu_linux, freebsd, netbsd, openbsd, unknown };

enum class arch_kind { x64, arm64, arm32_hard_float, x86, riscv64, unknown };

// canonical token for a kind; unknown kinds render as "unknown" and have no token in any vocabulary
const char* to_string(os_kind os) noexcept;
const char* to_string(arch_kind arch) noexcept;

struct platform_identity {
  os_kind os = os_kind::unknown;
  arch_kind arch = arch_kind::unknown;

  bool is_known() const noexcept { return os != os_kind::unknown && arch != arch_kind::unknown; }

  std::string to_string() const { return std::string(platform::to_string(os)) + ":" + platform::to_string(arch); }

  bool operator==(const platform_identity&) const = default;
};

// identity of the running build target; never fails, unrecognized halves are unknown
platform_identity detect_platform();

// parse an "os:arch" selector such as "linux:x64" or "darwin:aarch64".
// both halves are resolved through the vocabulary's aliases.
result<platform_identity> parse_platform(std::string_view text);
result<platform_identity> parse_platform(std::string_view text, const vocabulary& vocab);

} // namespace p1ck::engine::platform
