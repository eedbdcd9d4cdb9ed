#pragma once

#include <git2/status.h>

#include <array>
#include <string_view>

namespace gitmark {

enum class ChangeKind {
    Unmodified,
    New,
    Modified,
    Deleted,
    Renamed,
    TypeChanged,
};

// Raw per-path provider flags (git_status_t bits). Several conditions may be
// set at once; reduce_staged()/reduce_unstaged() pick the one to display.
class StatusFlags {
public:
    constexpr StatusFlags() noexcept = default;
    constexpr explicit StatusFlags(unsigned int bits) noexcept
        : bits_{bits} {}

    [[nodiscard]] constexpr unsigned int bits() const noexcept { return bits_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] constexpr bool contains(git_status_t flag) const noexcept {
        return (bits_ & static_cast<unsigned int>(flag)) != 0;
    }

    constexpr StatusFlags& operator|=(StatusFlags other) noexcept {
        bits_ |= other.bits_;
        return *this;
    }

    friend constexpr StatusFlags operator|(StatusFlags lhs, StatusFlags rhs) noexcept {
        return lhs |= rhs;
    }

    friend constexpr bool operator==(StatusFlags lhs, StatusFlags rhs) noexcept {
        return lhs.bits_ == rhs.bits_;
    }

private:
    unsigned int bits_{0};
};

struct PathStatus {
    ChangeKind staged{ChangeKind::Unmodified};
    ChangeKind unstaged{ChangeKind::Unmodified};

    friend constexpr bool operator==(const PathStatus&, const PathStatus&) = default;
};

struct FlagPriority {
    git_status_t flag;
    ChangeKind kind;
};

/// Reduction order for the staged (index) side. Evaluated top to bottom, the
/// first flag present wins; a flag set with none of them is Unmodified.
/// New outranks a later modification of the same new file. Renamed before
/// TypeChanged carries no meaning beyond compatibility with older listings.
inline constexpr std::array<FlagPriority, 5> kStagedPriority{{
    {GIT_STATUS_INDEX_NEW, ChangeKind::New},
    {GIT_STATUS_INDEX_MODIFIED, ChangeKind::Modified},
    {GIT_STATUS_INDEX_DELETED, ChangeKind::Deleted},
    {GIT_STATUS_INDEX_RENAMED, ChangeKind::Renamed},
    {GIT_STATUS_INDEX_TYPECHANGE, ChangeKind::TypeChanged},
}};

/// Same order for the unstaged (working tree) side.
inline constexpr std::array<FlagPriority, 5> kUnstagedPriority{{
    {GIT_STATUS_WT_NEW, ChangeKind::New},
    {GIT_STATUS_WT_MODIFIED, ChangeKind::Modified},
    {GIT_STATUS_WT_DELETED, ChangeKind::Deleted},
    {GIT_STATUS_WT_RENAMED, ChangeKind::Renamed},
    {GIT_STATUS_WT_TYPECHANGE, ChangeKind::TypeChanged},
}};

[[nodiscard]] ChangeKind reduce_staged(StatusFlags flags) noexcept;
[[nodiscard]] ChangeKind reduce_unstaged(StatusFlags flags) noexcept;
[[nodiscard]] PathStatus to_path_status(StatusFlags flags) noexcept;

[[nodiscard]] char to_indicator(ChangeKind kind) noexcept;
[[nodiscard]] std::string_view to_string(ChangeKind kind) noexcept;

} // namespace gitmark
