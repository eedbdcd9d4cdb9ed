#pragma once

#include "gitmark/git_status.hpp"
#include "gitmark/repository.hpp"
#include "gitmark/status_snapshot.hpp"

#include <filesystem>
#include <memory>
#include <optional>

namespace gitmark {

/// Git statuses for every file in the repository enclosing a listed path.
///
/// Built once per listing by scan(); the snapshot is fixed from then on and a
/// fresh scan() is needed to observe later changes. status() and dir_status()
/// read the snapshot only. should_ignore() asks the repository live, since
/// ignored paths generally have no snapshot entry.
///
/// A moved-from resolver has no repository: should_ignore() returns false and
/// working_directory() is empty.
class GitStatusResolver {
public:
    /// Discovers a repository on or above `path` with libgit2 and snapshots
    /// its statuses. Lenient: any failure at all yields nullopt.
    [[nodiscard]] static std::optional<GitStatusResolver> scan(const std::filesystem::path& path);
    [[nodiscard]] static std::optional<GitStatusResolver> scan(const std::filesystem::path& path,
                                                               const RepositoryProvider& provider);

    GitStatusResolver(GitStatusResolver&&) noexcept = default;
    GitStatusResolver& operator=(GitStatusResolver&&) noexcept = default;

    /// Status of the file at the absolute `path`; clean when it has no entry.
    [[nodiscard]] PathStatus status(const std::filesystem::path& path) const;

    /// Combined status of everything at or below the absolute `dir`.
    [[nodiscard]] PathStatus dir_status(const std::filesystem::path& dir) const;

    /// Whether `path` is on the ignore list. Errors count as not ignored.
    [[nodiscard]] bool should_ignore(const std::filesystem::path& path) const;

    [[nodiscard]] const std::filesystem::path& working_directory() const noexcept;
    [[nodiscard]] const StatusSnapshot& snapshot() const noexcept { return snapshot_; }

private:
    GitStatusResolver(std::unique_ptr<RepositoryHandle> handle, StatusSnapshot snapshot);

    std::unique_ptr<RepositoryHandle> handle_;
    StatusSnapshot snapshot_;
};

} // namespace gitmark
