#include <catch2/catch.hpp>

#include "TempDirectory.hpp"
#include "TempRepo.hpp"
#include "gitmark/git_status_resolver.hpp"

#include <git2.h>

#include <fstream>

namespace fs = std::filesystem;

using gitmark::GitStatusResolver;

TEST_CASE_METHOD(TempRepo, "Discovery from the working directory root") {
    auto git = GitStatusResolver::scan(m_dir);
    REQUIRE(git.has_value());
    REQUIRE(git->working_directory() == m_dir);
}

TEST_CASE_METHOD(TempRepo, "Discovery from a sub directory finds the enclosing repository") {
    auto git = GitStatusResolver::scan(m_dir / "sub_dir_1");
    REQUIRE(git.has_value());
    REQUIRE(git->working_directory() == m_dir);
}

TEST_CASE_METHOD(TempRepo, "Discovery from a file finds its repository") {
    auto git = GitStatusResolver::scan(m_dir / "sub_dir_2" / "sub_2_file_1.txt");
    REQUIRE(git.has_value());
    REQUIRE(git->working_directory() == m_dir);
}

TEST_CASE_METHOD(TempRepo, "Discovery from a path that does not exist yet") {
    auto git = GitStatusResolver::scan(m_dir / "not" / "created" / "yet.txt");
    REQUIRE(git.has_value());
    REQUIRE(git->working_directory() == m_dir);
}

TEST_CASE_METHOD(TempRepo, "Discovery accepts unnormalized paths") {
    auto git = GitStatusResolver::scan(m_dir / "sub_dir_1" / ".." / "sub_dir_2" / ".");
    REQUIRE(git.has_value());
    REQUIRE(git->working_directory() == m_dir);
}

TEST_CASE("Discovery outside any repository finds nothing") {
    const auto dir = TempDirectory::TempDir("no_repository_here");

    REQUIRE_FALSE(GitStatusResolver::scan(dir).has_value());

    std::error_code ec;
    const gitmark::LibGit2Provider provider{};
    REQUIRE(provider.discover(dir, ec) == nullptr);
    REQUIRE_FALSE(ec);
}

TEST_CASE("Bare repositories have no statuses to show") {
    const auto dir = TempDirectory::TempDir("bare_repository.git");
    git_repository* repo = nullptr;
    REQUIRE(git_repository_init(&repo, dir.string().c_str(), 1) == 0);
    git_repository_free(repo);

    REQUIRE_FALSE(GitStatusResolver::scan(dir).has_value());

    std::error_code ec;
    const gitmark::LibGit2Provider provider{};
    auto session = provider.discover(dir, ec);
    REQUIRE(session != nullptr);
    REQUIRE_FALSE(session->working_directory().has_value());
}

TEST_CASE("Git errors carry a readable category") {
    const auto ec = gitmark::make_git_error(GIT_ENOTFOUND);
    REQUIRE(ec.category() == gitmark::git_category());
    REQUIRE(std::string(ec.category().name()) == "git");
    REQUIRE_FALSE(ec.message().empty());
}

TEST_CASE("A malformed .git file is a discovery error with libgit2's reason") {
    const auto dir = TempDirectory::TempDir("malformed_gitfile");
    std::ofstream(dir / ".git") << "this is not a gitdir line\n";

    std::error_code ec;
    const gitmark::LibGit2Provider provider{};
    REQUIRE(provider.discover(dir, ec) == nullptr);
    REQUIRE(ec);
    REQUIRE(ec.category() == gitmark::git_category());
    REQUIRE_THAT(gitmark::last_git_error_message(), Catch::Matchers::Contains("malformed", Catch::CaseSensitive::No));

    REQUIRE_FALSE(GitStatusResolver::scan(dir).has_value());
}
