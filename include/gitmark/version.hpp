#pragma once

#include <string_view>

#ifndef GITMARK_VERSION_STRING
#define GITMARK_VERSION_STRING "0.0"
#endif

namespace gitmark {

inline constexpr std::string_view kVersion{GITMARK_VERSION_STRING};

} // namespace gitmark
