#pragma once

#include "gitmark/git_status.hpp"
#include "gitmark/repository.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace gitmark {

/// Lexically normal form with no trailing separator. Snapshot paths and query
/// paths both go through this before being compared.
[[nodiscard]] std::filesystem::path normalize_path(const std::filesystem::path& path);

/// True when every component of `prefix` matches the leading components of
/// `path`. `/a/b` is a prefix of `/a/b` and `/a/b/c`, not of `/a/bb`.
[[nodiscard]] bool has_path_prefix(const std::filesystem::path& path, const std::filesystem::path& prefix);

/// Point-in-time list of every non-clean path in a working tree, keyed by
/// absolute path. Never modified after construction, so concurrent readers
/// need no locking.
class StatusSnapshot {
public:
    struct Entry {
        std::filesystem::path path;
        StatusFlags flags;
    };

    StatusSnapshot() = default;
    StatusSnapshot(const std::filesystem::path& workdir, const std::vector<StatusRecord>& records);

    [[nodiscard]] std::optional<StatusFlags> find(const std::filesystem::path& path) const;

    /// Union of the flags of every entry at or below `dir`.
    [[nodiscard]] StatusFlags fold_under(const std::filesystem::path& dir) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

private:
    std::vector<Entry> entries_;
};

} // namespace gitmark
