#pragma once

#include "gitmark/git_status.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace gitmark {

/// Error category for failures reported by libgit2. Values are libgit2's
/// negative `git_error_code`s.
[[nodiscard]] const std::error_category& git_category() noexcept;

[[nodiscard]] std::error_code make_git_error(int rc) noexcept;

/// Holds one libgit2 init reference. libgit2 state, including the last error
/// text, stays valid while any instance is alive.
class LibGit2Library {
public:
    LibGit2Library();
    ~LibGit2Library();

    LibGit2Library(const LibGit2Library&) = delete;
    LibGit2Library& operator=(const LibGit2Library&) = delete;

    [[nodiscard]] int status() const noexcept { return rc_; }

private:
    int rc_;
};

/// Text of libgit2's thread-local last error, or an empty string. Only
/// meaningful while a LibGit2Library is alive.
[[nodiscard]] std::string last_git_error_message();

/// One path reported by the provider, relative to the working directory.
struct StatusRecord {
    std::string path;
    StatusFlags flags;
};

/// An open repository. Implementations are not required to be thread-safe;
/// RepositoryHandle serializes access.
class RepositorySession {
public:
    virtual ~RepositorySession() = default;

    /// Root of the working tree, or nullopt for a bare repository.
    [[nodiscard]] virtual std::optional<std::filesystem::path> working_directory() const = 0;

    /// Every path with a non-clean status, in provider order.
    virtual std::vector<StatusRecord> enumerate_statuses(std::error_code& ec) = 0;

    /// Whether the ignore rules match `path` (absolute, or relative to the
    /// working directory).
    virtual bool is_ignored(const std::filesystem::path& path, std::error_code& ec) = 0;
};

class RepositoryProvider {
public:
    virtual ~RepositoryProvider() = default;

    /// Opens the repository containing `start`. Returns nullptr with a clear
    /// `ec` when there is none, and nullptr with `ec` set on failure.
    virtual std::unique_ptr<RepositorySession> discover(const std::filesystem::path& start,
                                                        std::error_code& ec) const = 0;
};

/// Sessions keep their own init reference, so they may outlive the provider.
class LibGit2Provider final : public RepositoryProvider {
public:
    std::unique_ptr<RepositorySession> discover(const std::filesystem::path& start,
                                                std::error_code& ec) const override;

private:
    LibGit2Library library_;
};

/// Owns a session and its working directory. Only the working directory and
/// ignore checks are reachable; each call into the session holds the lock.
class RepositoryHandle {
public:
    RepositoryHandle(std::unique_ptr<RepositorySession> session, std::filesystem::path workdir);

    RepositoryHandle(const RepositoryHandle&) = delete;
    RepositoryHandle& operator=(const RepositoryHandle&) = delete;

    [[nodiscard]] const std::filesystem::path& working_directory() const noexcept { return workdir_; }

    bool is_ignored(const std::filesystem::path& path, std::error_code& ec) const;

private:
    friend class GitStatusResolver;

    std::vector<StatusRecord> enumerate_statuses(std::error_code& ec);

    std::unique_ptr<RepositorySession> session_;
    std::filesystem::path workdir_;
    mutable std::mutex mutex_;
};

} // namespace gitmark
