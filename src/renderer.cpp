#include "gitmark/renderer.hpp"

#include <string_view>

namespace gitmark {

namespace {

constexpr std::string_view kReset = "\x1b[0m";

std::string_view color_for(ChangeKind kind) noexcept {
    switch (kind) {
    case ChangeKind::New:
        return "\x1b[32m";
    case ChangeKind::Modified:
        return "\x1b[34m";
    case ChangeKind::Deleted:
        return "\x1b[31m";
    case ChangeKind::Renamed:
        return "\x1b[33m";
    case ChangeKind::TypeChanged:
        return "\x1b[35m";
    case ChangeKind::Unmodified:
    default:
        return "\x1b[90m";
    }
}

} // namespace

Renderer::Renderer(bool use_color, std::ostream& out)
    : use_color_{use_color}, out_{out} {}

void Renderer::render_header(const std::filesystem::path& path, bool first) {
    if (!first) {
        out_ << '\n';
    }
    out_ << path.string() << ":\n";
}

void Renderer::render(const std::vector<ListingEntry>& entries, const GitStatusResolver* git) {
    for (const auto& entry : entries) {
        if (git) {
            const PathStatus status = entry.is_directory ? git->dir_status(entry.path) : git->status(entry.path);
            out_ << markers(status);
        }
        out_ << entry.name;
        if (entry.is_directory) {
            out_ << '/';
        }
        out_ << '\n';
    }
}

std::string Renderer::markers(const PathStatus& status) const {
    return marker(status.staged) + marker(status.unstaged) + ' ';
}

std::string Renderer::marker(ChangeKind kind) const {
    const char indicator = to_indicator(kind);
    if (!use_color_) {
        return std::string(1, indicator);
    }
    std::string out{color_for(kind)};
    out.push_back(indicator);
    out += kReset;
    return out;
}

} // namespace gitmark
