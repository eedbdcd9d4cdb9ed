#pragma once

#include "gitmark/options.hpp"

namespace gitmark::platform {

[[nodiscard]] bool stdout_is_tty();
[[nodiscard]] bool supports_color(ColorPolicy policy);
void enable_virtual_terminal_processing();

} // namespace gitmark::platform
