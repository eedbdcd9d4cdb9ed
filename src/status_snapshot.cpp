#include "gitmark/status_snapshot.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace gitmark {

fs::path normalize_path(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool has_path_prefix(const fs::path& path, const fs::path& prefix) {
    return std::mismatch(prefix.begin(), prefix.end(), path.begin(), path.end()).first == prefix.end();
}

StatusSnapshot::StatusSnapshot(const fs::path& workdir, const std::vector<StatusRecord>& records) {
    const fs::path root = normalize_path(workdir);
    entries_.reserve(records.size());
    for (const auto& record : records) {
        if (record.path.empty()) {
            continue;
        }
        entries_.push_back({normalize_path(root / fs::path(record.path)), record.flags});
    }
}

std::optional<StatusFlags> StatusSnapshot::find(const fs::path& path) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&path](const Entry& entry) { return entry.path == path; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->flags;
}

StatusFlags StatusSnapshot::fold_under(const fs::path& dir) const {
    StatusFlags combined;
    for (const auto& entry : entries_) {
        if (has_path_prefix(entry.path, dir)) {
            combined |= entry.flags;
        }
    }
    return combined;
}

} // namespace gitmark
