#include "gitmark/git_status_resolver.hpp"

#include "gitmark/logger.hpp"
#include "gitmark/perf.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace gitmark {

namespace {

constexpr std::string_view kComponent = "git";

std::string describe(const std::error_code& ec) {
    std::string text = ec.message();
    if (ec.category() == git_category()) {
        const std::string detail = last_git_error_message();
        if (!detail.empty()) {
            text += " (" + detail + ")";
        }
    }
    return text;
}

} // namespace

std::optional<GitStatusResolver> GitStatusResolver::scan(const fs::path& path) {
    const LibGit2Provider provider{};
    return scan(path, provider);
}

std::optional<GitStatusResolver> GitStatusResolver::scan(const fs::path& path, const RepositoryProvider& provider) {
    perf::ScopedTimer timer{"git::scan"};
    auto& logger = Logger::instance();

    std::error_code ec;
    std::unique_ptr<RepositorySession> session = provider.discover(path, ec);
    if (!session) {
        if (ec) {
            logger.warn(kComponent, "repository discovery failed for " + path.string() + ": " + describe(ec));
        } else {
            logger.debug(kComponent, "no repository at or above " + path.string());
        }
        return std::nullopt;
    }

    std::optional<fs::path> workdir = session->working_directory();
    if (!workdir || workdir->empty()) {
        logger.debug(kComponent, "repository above " + path.string() + " has no working directory");
        return std::nullopt;
    }
    logger.debug(kComponent, "got working directory " + workdir->string());

    auto handle = std::make_unique<RepositoryHandle>(std::move(session), normalize_path(*workdir));
    std::vector<StatusRecord> records = handle->enumerate_statuses(ec);
    if (ec) {
        logger.warn(kComponent, "cannot read statuses in " + handle->working_directory().string() + ": " +
                                    describe(ec));
        return std::nullopt;
    }

    StatusSnapshot snapshot{handle->working_directory(), records};
    logger.debug(kComponent, "snapshot holds " + std::to_string(snapshot.size()) + " entries");
    perf::Manager::instance().increment("git::snapshot_entries", snapshot.size());

    return GitStatusResolver{std::move(handle), std::move(snapshot)};
}

GitStatusResolver::GitStatusResolver(std::unique_ptr<RepositoryHandle> handle, StatusSnapshot snapshot)
    : handle_{std::move(handle)}, snapshot_{std::move(snapshot)} {}

PathStatus GitStatusResolver::status(const fs::path& path) const {
    const auto flags = snapshot_.find(normalize_path(path));
    if (!flags) {
        return{};
    }
    return to_path_status(*flags);
}

PathStatus GitStatusResolver::dir_status(const fs::path& dir) const {
    const fs::path normal = normalize_path(dir);
    if (normal.empty()) {
        return{};
    }
    return to_path_status(snapshot_.fold_under(normal));
}

bool GitStatusResolver::should_ignore(const fs::path& path) const {
    if (!handle_) {
        return false;
    }
    perf::Manager::instance().increment("git::ignore_queries");

    std::error_code ec;
    const bool ignored = handle_->is_ignored(path, ec);
    if (ec) {
        Logger::instance().warn(kComponent, "ignore check failed for " + path.string() + ": " + describe(ec));
        return false;
    }

    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::Debug)) {
        logger.debug(kComponent, path.string() + (ignored ? " is ignored" : " is not ignored"));
    }
    return ignored;
}

const fs::path& GitStatusResolver::working_directory() const noexcept {
    static const fs::path empty;
    return handle_ ? handle_->working_directory() : empty;
}

} // namespace gitmark
