#pragma once

#include "gitmark/git_status.hpp"
#include "gitmark/git_status_resolver.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace gitmark {

struct ListingEntry {
    std::filesystem::path path;
    std::string name;
    bool is_directory{false};
};

class Renderer {
public:
    Renderer(bool use_color, std::ostream& out);

    void render_header(const std::filesystem::path& path, bool first);

    /// One line per entry; a resolver adds staged and unstaged markers.
    void render(const std::vector<ListingEntry>& entries, const GitStatusResolver* git);

    /// Two marker characters, staged then unstaged, followed by a space.
    [[nodiscard]] std::string markers(const PathStatus& status) const;

private:
    [[nodiscard]] std::string marker(ChangeKind kind) const;

    bool use_color_;
    std::ostream& out_;
};

} // namespace gitmark
