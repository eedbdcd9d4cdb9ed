#include <catch2/catch.hpp>

#include "FakeRepository.hpp"
#include "TempDirectory.hpp"
#include "gitmark/app.hpp"
#include "gitmark/git_status_resolver.hpp"
#include "gitmark/logger.hpp"
#include "gitmark/perf.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using gitmark::GitStatusResolver;
using gitmark::Logger;
using gitmark::LogLevel;

namespace {

// Routes the logger into a string for one test and restores it afterwards.
class CapturedLog {
public:
    explicit CapturedLog(LogLevel level)
        : previous_{Logger::instance().level()} {
        Logger::instance().set_output(&out_);
        Logger::instance().set_level(level);
    }

    ~CapturedLog() {
        Logger::instance().set_level(previous_);
        Logger::instance().set_output(nullptr);
    }

    std::string text() const { return out_.str(); }

private:
    std::ostringstream out_;
    LogLevel previous_;
};

} // namespace

TEST_CASE("Messages below the level are dropped") {
    CapturedLog log{LogLevel::Warn};

    Logger::instance().debug("git", "hidden");
    Logger::instance().warn("git", "shown");

    REQUIRE(log.text().find("hidden") == std::string::npos);
    REQUIRE(log.text().find("warn | git: shown\n") != std::string::npos);
}

TEST_CASE("Failed scans are reported as warnings") {
    CapturedLog log{LogLevel::Warn};

    FakeProvider provider;
    provider.state().enumerate_error = std::make_error_code(std::errc::io_error);

    REQUIRE_FALSE(GitStatusResolver::scan("/repo", provider).has_value());
    REQUIRE(log.text().find("cannot read statuses in /repo") != std::string::npos);
}

TEST_CASE("Scans report the snapshot size at debug level") {
    CapturedLog log{LogLevel::Debug};

    FakeProvider provider;
    provider.state().add("a.txt", GIT_STATUS_WT_NEW);

    REQUIRE(GitStatusResolver::scan("/repo", provider).has_value());
    REQUIRE(log.text().find("got working directory /repo") != std::string::npos);
    REQUIRE(log.text().find("snapshot holds 1 entries") != std::string::npos);
}

TEST_CASE("Perf counters track snapshot entries and ignore queries") {
    auto& perf = gitmark::perf::Manager::instance();
    perf.set_enabled(true);

    FakeProvider provider;
    provider.state().add("a.txt", GIT_STATUS_WT_NEW);
    provider.state().add("b.txt", GIT_STATUS_WT_MODIFIED);

    auto git = GitStatusResolver::scan("/repo", provider);
    REQUIRE(git.has_value());
    REQUIRE_FALSE(git->should_ignore("/repo/a.txt"));
    REQUIRE_FALSE(git->should_ignore("/repo/b.txt"));

    REQUIRE(perf.counter("git::snapshot_entries") == 2);
    REQUIRE(perf.counter("git::ignore_queries") == 2);

    std::ostringstream report;
    perf.report(report);
    REQUIRE(report.str().find("git::scan") != std::string::npos);

    perf.set_enabled(false);
    REQUIRE(perf.counter("git::snapshot_entries") == 0);
}

TEST_CASE("The listing driver logs libgit2's reason for a broken repository") {
    const auto dir = TempDirectory::TempDir("driver_malformed_gitfile");
    std::ofstream(dir / ".git") << "this is not a gitdir line\n";
    std::ofstream(dir / "plain.txt") << "x";

    CapturedLog log{LogLevel::Warn};

    std::vector<std::string> args{"gitmark", "--log-level", "warn", "--no-color", dir.string()};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    gitmark::App app;
    REQUIRE(app.run(static_cast<int>(argv.size()), argv.data()) == 0);

    std::string text = log.text();
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    REQUIRE(text.find("repository discovery failed") != std::string::npos);
    REQUIRE(text.find("malformed") != std::string::npos);
    REQUIRE(text.find("not initialized") == std::string::npos);
}
