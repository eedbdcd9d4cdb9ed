#pragma once

#include "gitmark/logger.hpp"

#include <string>
#include <vector>

namespace gitmark {

enum class ColorPolicy {
    Auto,
    Always,
    Never
};

struct Options {
    std::vector<std::string> paths{};

    bool all{false};
    bool git_ignore{false};
    bool perf{false};

    ColorPolicy color_policy{ColorPolicy::Auto};
    LogLevel log_level{LogLevel::Error};
};

} // namespace gitmark
