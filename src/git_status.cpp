#include "gitmark/git_status.hpp"

namespace gitmark {

namespace {

template <std::size_t N>
ChangeKind reduce(StatusFlags flags, const std::array<FlagPriority, N>& order) noexcept {
    for (const auto& entry : order) {
        if (flags.contains(entry.flag)) {
            return entry.kind;
        }
    }
    return ChangeKind::Unmodified;
}

} // namespace

ChangeKind reduce_staged(StatusFlags flags) noexcept {
    return reduce(flags, kStagedPriority);
}

ChangeKind reduce_unstaged(StatusFlags flags) noexcept {
    return reduce(flags, kUnstagedPriority);
}

PathStatus to_path_status(StatusFlags flags) noexcept {
    return PathStatus{reduce_staged(flags), reduce_unstaged(flags)};
}

char to_indicator(ChangeKind kind) noexcept {
    switch (kind) {
    case ChangeKind::New:
        return 'N';
    case ChangeKind::Modified:
        return 'M';
    case ChangeKind::Deleted:
        return 'D';
    case ChangeKind::Renamed:
        return 'R';
    case ChangeKind::TypeChanged:
        return 'T';
    case ChangeKind::Unmodified:
    default:
        return '-';
    }
}

std::string_view to_string(ChangeKind kind) noexcept {
    switch (kind) {
    case ChangeKind::Unmodified:
        return "unmodified";
    case ChangeKind::New:
        return "new";
    case ChangeKind::Modified:
        return "modified";
    case ChangeKind::Deleted:
        return "deleted";
    case ChangeKind::Renamed:
        return "renamed";
    case ChangeKind::TypeChanged:
        return "typechange";
    }
    return "unknown";
}

} // namespace gitmark
