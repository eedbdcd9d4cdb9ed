#include "gitmark/repository.hpp"

#include "gitmark/logger.hpp"
#include "gitmark/status_snapshot.hpp"

#include <git2.h>

#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace gitmark {

namespace {

class GitErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "git"; }

    std::string message(int condition) const override {
        switch (condition) {
        case GIT_OK:
            return "success";
        case GIT_ERROR:
            return "generic libgit2 error";
        case GIT_ENOTFOUND:
            return "requested object could not be found";
        case GIT_EEXISTS:
            return "object exists preventing operation";
        case GIT_EAMBIGUOUS:
            return "more than one object matches";
        case GIT_EBAREREPO:
            return "operation not allowed on bare repository";
        case GIT_EUNBORNBRANCH:
            return "HEAD refers to branch with no commits";
        case GIT_EUNMERGED:
            return "merge in progress prevented operation";
        case GIT_ELOCKED:
            return "lock file prevented operation";
        case GIT_EINVALIDSPEC:
            return "name or path is not valid";
        case GIT_EUSER:
            return "operation stopped by callback";
        default:
            return "libgit2 error " + std::to_string(condition);
        }
    }
};

struct RepositoryDeleter {
    void operator()(git_repository* repo) const noexcept { git_repository_free(repo); }
};

struct StatusListDeleter {
    void operator()(git_status_list* list) const noexcept { git_status_list_free(list); }
};

using RepositoryPtr = std::unique_ptr<git_repository, RepositoryDeleter>;
using StatusListPtr = std::unique_ptr<git_status_list, StatusListDeleter>;

fs::path nearest_existing_directory(const fs::path& start) {
    std::error_code ec;
    fs::path current = fs::absolute(start, ec);
    if (ec) {
        return{};
    }
    current = normalize_path(current);

    while (!current.empty()) {
        if (fs::is_directory(current, ec)) {
            return current;
        }
        ec.clear();
        fs::path parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = std::move(parent);
    }
    return{};
}

// Renames are reported under their new name, which is the one on disk.
std::string extract_path(const git_status_entry& entry) {
    auto from_delta = [](const git_diff_delta* delta) -> std::string {
        if (!delta) return{};
        if (delta->new_file.path && delta->new_file.path[0]) {
            return delta->new_file.path;
        }
        if (delta->old_file.path && delta->old_file.path[0]) {
            return delta->old_file.path;
        }
        return{};
    };

    std::string path = from_delta(entry.head_to_index);
    if (path.empty()) {
        path = from_delta(entry.index_to_workdir);
    }
    return path;
}

class LibGit2Session final : public RepositorySession {
public:
    LibGit2Session(std::unique_ptr<LibGit2Library> library, RepositoryPtr repo)
        : library_{std::move(library)}, repo_{std::move(repo)} {
        if (const char* workdir = git_repository_workdir(repo_.get())) {
            workdir_ = normalize_path(fs::path(workdir));
        }
    }

    std::optional<fs::path> working_directory() const override { return workdir_; }

    std::vector<StatusRecord> enumerate_statuses(std::error_code& ec) override {
        git_status_options options = GIT_STATUS_OPTIONS_INIT;
        options.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
        options.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED |
                        GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS |
                        GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;

        git_status_list* raw_list = nullptr;
        const int rc = git_status_list_new(&raw_list, repo_.get(), &options);
        if (rc < 0) {
            ec = make_git_error(rc);
            return{};
        }

        StatusListPtr list(raw_list);
        const std::size_t count = git_status_list_entrycount(list.get());

        std::vector<StatusRecord> records;
        records.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            const git_status_entry* entry = git_status_byindex(list.get(), i);
            if (!entry || entry->status == GIT_STATUS_CURRENT) continue;

            std::string path = extract_path(*entry);
            if (path.empty()) continue;

            records.push_back({std::move(path), StatusFlags{static_cast<unsigned int>(entry->status)}});
        }

        ec.clear();
        return records;
    }

    bool is_ignored(const fs::path& path, std::error_code& ec) override {
        if (!workdir_) {
            ec = make_git_error(GIT_EBAREREPO);
            return false;
        }

        fs::path relative = normalize_path(path);
        if (relative.is_absolute()) {
            relative = relative.lexically_relative(*workdir_);
        }
        if (relative.empty() || *relative.begin() == "..") {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }

        const std::string relative_string = relative.generic_string();
        int ignored = 0;
        const int rc = git_ignore_path_is_ignored(&ignored, repo_.get(), relative_string.c_str());
        if (rc < 0) {
            ec = make_git_error(rc);
            return false;
        }

        ec.clear();
        return ignored != 0;
    }

private:
    std::unique_ptr<LibGit2Library> library_;
    RepositoryPtr repo_;
    std::optional<fs::path> workdir_;
};

} // namespace

const std::error_category& git_category() noexcept {
    static const GitErrorCategory category;
    return category;
}

std::error_code make_git_error(int rc) noexcept {
    return {rc, git_category()};
}

LibGit2Library::LibGit2Library()
    : rc_{git_libgit2_init()} {}

LibGit2Library::~LibGit2Library() {
    if (rc_ >= 0) {
        git_libgit2_shutdown();
    }
}

std::string last_git_error_message() {
    const git_error* error = git_error_last();
    if (!error || !error->message) {
        return{};
    }
    return error->message;
}

std::unique_ptr<RepositorySession> LibGit2Provider::discover(const fs::path& start, std::error_code& ec) const {
    ec.clear();

    const fs::path search = nearest_existing_directory(start);
    if (search.empty()) {
        Logger::instance().debug("git", "no existing directory at or above " + start.string());
        return nullptr;
    }

    if (library_.status() < 0) {
        ec = make_git_error(library_.status());
        return nullptr;
    }

    git_repository* raw_repo = nullptr;
    const int rc = git_repository_open_ext(&raw_repo, search.string().c_str(), GIT_REPOSITORY_OPEN_CROSS_FS, nullptr);
    if (rc == GIT_ENOTFOUND) {
        return nullptr;
    }
    if (rc < 0) {
        ec = make_git_error(rc);
        Logger::instance().debug("git", "opening repository above " + search.string() + " failed: " +
                                            last_git_error_message());
        return nullptr;
    }

    return std::make_unique<LibGit2Session>(std::make_unique<LibGit2Library>(), RepositoryPtr(raw_repo));
}

RepositoryHandle::RepositoryHandle(std::unique_ptr<RepositorySession> session, fs::path workdir)
    : session_{std::move(session)}, workdir_{std::move(workdir)} {}

bool RepositoryHandle::is_ignored(const fs::path& path, std::error_code& ec) const {
    std::scoped_lock lock{mutex_};
    return session_->is_ignored(path, ec);
}

std::vector<StatusRecord> RepositoryHandle::enumerate_statuses(std::error_code& ec) {
    std::scoped_lock lock{mutex_};
    return session_->enumerate_statuses(ec);
}

} // namespace gitmark
