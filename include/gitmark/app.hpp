#pragma once

#include "gitmark/options.hpp"
#include "gitmark/renderer.hpp"
#include "gitmark/repository.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

namespace gitmark {

class App {
public:
    int run(int argc, char** argv);

private:
    bool list_path(const std::filesystem::path& path, Renderer& renderer, bool with_header);

    // Outlives every scan, so failures can still be described after a
    // provider has let go of its own reference.
    LibGit2Library git_library_;
    Options options_{};
    bool first_block_{true};
};

/// Entries shown for `path`: the directory's children sorted by name, or the
/// file itself. Paths in the result are absolute; the parent chain is resolved
/// but a file argument that is a symlink keeps its own name.
[[nodiscard]] std::vector<ListingEntry> collect_entries(const std::filesystem::path& path,
                                                        bool include_hidden,
                                                        std::error_code& ec);

} // namespace gitmark
