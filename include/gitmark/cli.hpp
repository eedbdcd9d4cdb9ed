#pragma once

#include "gitmark/options.hpp"

#include <memory>
#include <optional>

namespace CLI {
class App;
}

namespace gitmark {

class Cli {
public:
    Cli();
    ~Cli();

    Cli(const Cli&) = delete;
    Cli& operator=(const Cli&) = delete;

    /// Fills `options` from the command line. Returns an exit code when the
    /// program should stop here (help, version or a usage error).
    [[nodiscard]] std::optional<int> parse(int argc, char** argv, Options& options);

private:
    std::unique_ptr<CLI::App> app_;
};

} // namespace gitmark
