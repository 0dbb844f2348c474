#include "platform.hpp"
#include "engine/vocabulary.hpp"
#include "utils/string_utils.hpp"
#include <redlog.hpp>

namespace p1ck::engine::platform {

namespace {

os_kind detect_operating_system() {
#if defined(_WIN32) || defined(__CYGWIN__)
  return os_kind::windows;
#elif defined(__APPLE__)
  return os_kind::macos;
#elif defined(__linux__)
  return os_kind::gnu_linux;
#elif defined(__FreeBSD__)
  return os_kind::freebsd;
#elif defined(__NetBSD__)
  return os_kind::netbsd;
#elif defined(__OpenBSD__)
  return os_kind::openbsd;
#else
  return os_kind::unknown;
#endif
}

arch_kind detect_architecture() {
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
  return arch_kind::x64;
#elif defined(__aarch64__) || defined(_M_ARM64)
  return arch_kind::arm64;
#elif defined(__i386__) || defined(_M_IX86)
  return arch_kind::x86;
#elif (defined(__arm__) && defined(__ARM_PCS_VFP)) || defined(_M_ARM)
  return arch_kind::arm32_hard_float;
#elif defined(__riscv) && (__riscv_xlen == 64)
  return arch_kind::riscv64;
#else
  // soft-float arm lands here too, armhf assets will not run on it
  return arch_kind::unknown;
#endif
}

} // namespace

const char* to_string(os_kind os) noexcept {
  switch (os) {
  case os_kind::windows:
    return "windows";
  case os_kind::macos:
    return "macos";
  case os_kind::gnu_linux:
    return "linux";
  case os_kind::freebsd:
    return "freebsd";
  case os_kind::netbsd:
    return "netbsd";
  case os_kind::openbsd:
    return "openbsd";
  case os_kind::unknown:
    break;
  }
  return "unknown";
}

const char* to_string(arch_kind arch) noexcept {
  switch (arch) {
  case arch_kind::x64:
    return "x64";
  case arch_kind::arm64:
    return "arm64";
  case arch_kind::arm32_hard_float:
    return "armhf";
  case arch_kind::x86:
    return "x86";
  case arch_kind::riscv64:
    return "riscv64";
  case arch_kind::unknown:
    break;
  }
  return "unknown";
}

platform_identity detect_platform() {
  platform_identity identity;
  identity.os = detect_operating_system();
  identity.arch = detect_architecture();
  auto log = redlog::get_logger("p1ck.platform");
  if (identity.os == os_kind::unknown) {
    log.wrn("unknown operating system detected - no asset will match");
  }
  if (identity.arch == arch_kind::unknown) {
    log.wrn("unknown architecture detected - no asset will match");
  }
  log.dbg("detected platform", redlog::field("platform", identity.to_string()));
  return identity;
}

result<platform_identity> parse_platform(std::string_view text) { return parse_platform(text, default_vocabulary()); }

result<platform_identity> parse_platform(std::string_view text, const vocabulary& vocab) {
  auto log = redlog::get_logger("p1ck.platform");
  std::string trimmed = utils::trim_copy(text);
  if (trimmed.empty()) {
    log.err("empty platform identity");
    return error_result<platform_identity>(error_code::invalid_argument, "empty platform identity");
  }

  auto colon_pos = trimmed.find(':');
  if (colon_pos == std::string::npos) {
    log.err("platform identity needs os:arch", redlog::field("input", trimmed));
    return error_result<platform_identity>(
        error_code::invalid_argument, "platform identity must look like os:arch: " + trimmed
    );
  }

  std::string os_name = utils::trim_copy(std::string_view(trimmed).substr(0, colon_pos));
  std::string arch_name = utils::trim_copy(std::string_view(trimmed).substr(colon_pos + 1));
  if (os_name.empty() || arch_name.empty()) {
    log.err("platform identity has an empty half", redlog::field("input", trimmed));
    return error_result<platform_identity>(
        error_code::invalid_argument, "platform identity must look like os:arch: " + trimmed
    );
  }

  platform_identity parsed;
  parsed.os = vocab.resolve_os(os_name);
  parsed.arch = vocab.resolve_arch(arch_name);
  if (parsed.os == os_kind::unknown) {
    log.err("unrecognized operating system", redlog::field("os", os_name));
    return error_result<platform_identity>(error_code::unknown_platform, "unrecognized operating system: " + os_name);
  }
  if (parsed.arch == arch_kind::unknown) {
    log.err("unrecognized architecture", redlog::field("arch", arch_name));
    return error_result<platform_identity>(error_code::unknown_platform, "unrecognized architecture: " + arch_name);
  }

  log.dbg("parsed platform identity", redlog::field("input", trimmed), redlog::field("platform", parsed.to_string()));
  return ok_result(parsed);
}

} // namespace p1ck::engine::platform
