#pragma once

namespace p1ckx::commands {

int detect_command();

} // namespace p1ckx::commands
