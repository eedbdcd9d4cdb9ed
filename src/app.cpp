#include "gitmark/app.hpp"

#include "gitmark/cli.hpp"
#include "gitmark/git_status_resolver.hpp"
#include "gitmark/logger.hpp"
#include "gitmark/perf.hpp"
#include "gitmark/platform.hpp"
#include "gitmark/status_snapshot.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace gitmark {

namespace {

// Resolves symlinks in the parent chain so entry paths line up with the
// repository's working directory, which libgit2 reports fully resolved.
fs::path resolve_parents(const fs::path& absolute) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return normalize_path(absolute);
    }
    return normalize_path(canonical);
}

// A directory is resolved completely. A file keeps its last component, since
// the repository tracks a symlink under its own name, not its target's.
fs::path listing_base(const fs::path& path, bool is_directory, std::error_code& ec) {
    const fs::path absolute = normalize_path(fs::absolute(path, ec));
    if (ec) return {};
    if (is_directory || !absolute.has_filename()) {
        return resolve_parents(absolute);
    }
    return resolve_parents(absolute.parent_path()) / absolute.filename();
}

} // namespace

std::vector<ListingEntry> collect_entries(const fs::path& path, bool include_hidden, std::error_code& ec) {
    std::vector<ListingEntry> entries;

    const fs::file_status status = fs::status(path, ec);
    if (ec) return entries;

    const bool is_directory = fs::is_directory(status);
    const fs::path base = listing_base(path, is_directory, ec);
    if (ec) return entries;

    if (!is_directory) {
        entries.push_back({base, path.string(), false});
        return entries;
    }

    for (fs::directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!include_hidden && !name.empty() && name.front() == '.') {
            continue;
        }
        std::error_code type_ec;
        const bool child_is_directory = it->is_directory(type_ec);
        if (type_ec) {
            Logger::instance().warn("scan", "failed to inspect " + it->path().string() + ": " + type_ec.message());
        }
        entries.push_back({base / name, std::move(name), child_is_directory && !type_ec});
    }
    if (ec) return entries;

    std::sort(entries.begin(), entries.end(),
        [](const ListingEntry& a, const ListingEntry& b) { return a.name < b.name; });
    return entries;
}

int App::run(int argc, char** argv) {
    Cli cli;
    if (std::optional<int> exit_code = cli.parse(argc, argv, options_)) {
        return *exit_code;
    }

    Logger::instance().set_level(options_.log_level);
    auto& perf_manager = perf::Manager::instance();
    perf_manager.set_enabled(options_.perf);

    platform::enable_virtual_terminal_processing();
    Renderer renderer{platform::supports_color(options_.color_policy), std::cout};

    const bool multiple = options_.paths.size() > 1;
    int rc = 0;
    for (const auto& raw : options_.paths) {
        bool ok = false;
        try {
            ok = list_path(fs::path(raw), renderer, multiple);
        } catch (const std::exception& e) {
            std::cerr << "gitmark: error: " << e.what() << '\n';
        }
        if (!ok) {
            rc = 2;
        }
    }

    perf_manager.report(std::cerr);
    return rc;
}

bool App::list_path(const fs::path& path, Renderer& renderer, bool with_header) {
    std::error_code ec;
    std::vector<ListingEntry> entries = collect_entries(path, options_.all, ec);
    if (ec) {
        std::cerr << "gitmark: cannot access '" << path.string() << "': " << ec.message() << '\n';
        return false;
    }

    std::optional<GitStatusResolver> git = GitStatusResolver::scan(path);

    if (git && options_.git_ignore) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                          [&git](const ListingEntry& entry) { return git->should_ignore(entry.path); }),
            entries.end());
    }

    std::error_code dir_ec;
    if (with_header && fs::is_directory(path, dir_ec)) {
        renderer.render_header(path, first_block_);
    }
    first_block_ = false;

    renderer.render(entries, git ? &*git : nullptr);
    return true;
}

} // namespace gitmark
