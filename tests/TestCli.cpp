#include <catch2/catch.hpp>

#include "gitmark/cli.hpp"

#include <initializer_list>
#include <string>
#include <vector>

using gitmark::Cli;
using gitmark::ColorPolicy;
using gitmark::LogLevel;
using gitmark::Options;

namespace {

// Owns the argument strings for the lifetime of a parse.
class Args {
public:
    Args(std::initializer_list<std::string> args)
        : storage_{args} {
        storage_.insert(storage_.begin(), "gitmark");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

TEST_CASE("Defaults list the current directory") {
    Args args{};
    Options options;
    Cli cli;

    REQUIRE_FALSE(cli.parse(args.argc(), args.argv(), options).has_value());
    REQUIRE(options.paths == std::vector<std::string>{"."});
    REQUIRE_FALSE(options.all);
    REQUIRE_FALSE(options.git_ignore);
    REQUIRE_FALSE(options.perf);
    REQUIRE(options.color_policy == ColorPolicy::Auto);
    REQUIRE(options.log_level == LogLevel::Error);
}

TEST_CASE("Flags and paths are collected") {
    Args args{"-a", "--git-ignore", "--perf", "--color", "always", "-v", "debug", "src", "include"};
    Options options;
    Cli cli;

    REQUIRE_FALSE(cli.parse(args.argc(), args.argv(), options).has_value());
    REQUIRE(options.paths == std::vector<std::string>{"src", "include"});
    REQUIRE(options.all);
    REQUIRE(options.git_ignore);
    REQUIRE(options.perf);
    REQUIRE(options.color_policy == ColorPolicy::Always);
    REQUIRE(options.log_level == LogLevel::Debug);
}

TEST_CASE("--no-color turns colors off") {
    Args args{"--no-color"};
    Options options;
    Cli cli;

    REQUIRE_FALSE(cli.parse(args.argc(), args.argv(), options).has_value());
    REQUIRE(options.color_policy == ColorPolicy::Never);
}

TEST_CASE("Help and version stop with success") {
    Options options;
    Cli cli;

    Args help{"--help"};
    auto rc = cli.parse(help.argc(), help.argv(), options);
    REQUIRE(rc.has_value());
    REQUIRE(*rc == 0);

    Args version{"--version"};
    rc = cli.parse(version.argc(), version.argv(), options);
    REQUIRE(rc.has_value());
    REQUIRE(*rc == 0);
}

TEST_CASE("Unknown values are usage errors") {
    Options options;
    Cli cli;

    Args level{"--log-level", "loud"};
    auto rc = cli.parse(level.argc(), level.argv(), options);
    REQUIRE(rc.has_value());
    REQUIRE(*rc != 0);

    Args color{"--color", "sometimes"};
    rc = cli.parse(color.argc(), color.argv(), options);
    REQUIRE(rc.has_value());
    REQUIRE(*rc != 0);

    Args flag{"--frobnicate"};
    rc = cli.parse(flag.argc(), flag.argv(), options);
    REQUIRE(rc.has_value());
    REQUIRE(*rc != 0);
}
