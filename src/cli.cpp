#include "gitmark/cli.hpp"

#include "gitmark/version.hpp"

#include <CLI/CLI.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <string>

namespace gitmark {

namespace {

LogLevel parse_log_level(const std::string& value) {
    static const std::map<std::string, LogLevel, std::less<>> table{
        {"error", LogLevel::Error},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"info", LogLevel::Info},
        {"debug", LogLevel::Debug},
        {"trace", LogLevel::Trace},
    };
    auto it = table.find(value);
    if (it == table.end()) {
        throw CLI::ValidationError("--log-level", "invalid log level: " + value);
    }
    return it->second;
}

ColorPolicy parse_color_policy(const std::string& value) {
    static const std::map<std::string, ColorPolicy, std::less<>> table{
        {"auto", ColorPolicy::Auto},
        {"always", ColorPolicy::Always},
        {"never", ColorPolicy::Never},
    };
    auto it = table.find(value);
    if (it == table.end()) {
        throw CLI::ValidationError("--color", "invalid mode: " + value);
    }
    return it->second;
}

} // namespace

Cli::Cli() = default;

Cli::~Cli() = default;

std::optional<int> Cli::parse(int argc, char** argv, Options& options) {
    app_ = std::make_unique<CLI::App>("List directory entries with their git status");

    std::string color{"auto"};
    std::string log_level{"error"};

    auto* version_flag = app_->add_flag("-V,--version", "Print version information and exit");
    app_->add_option("paths", options.paths, "Paths to list")->type_name("PATH");
    app_->add_flag("-a,--all", options.all, "Include entries whose names begin with a dot (.)");
    app_->add_flag("--git-ignore", options.git_ignore, "Hide entries the repository ignores");
    app_->add_option("--color", color, "When to use colors (auto, always, never)")
        ->type_name("WHEN")
        ->default_str("auto");
    app_->add_flag_callback("--no-color", [&color]() { color = "never"; }, "Disable ANSI colors");
    app_->add_option("-v,--log-level", log_level, "Set log verbosity (error, warn, info, debug, trace)")
        ->type_name("LEVEL")
        ->default_str("error");
    app_->add_flag("--perf", options.perf, "Report timings and counters on stderr");

    try {
        app_->parse(argc, argv);
        options.color_policy = parse_color_policy(color);
        options.log_level = parse_log_level(log_level);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    if (*version_flag) {
        std::cout << "gitmark " << kVersion << '\n';
        return 0;
    }

    if (options.paths.empty()) {
        options.paths.emplace_back(".");
    }
    return std::nullopt;
}

} // namespace gitmark
