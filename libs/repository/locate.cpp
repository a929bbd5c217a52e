/**
 * @file locate.cpp
 * @brief Discovery of the enclosing git repository
 */

#include "verso/repository.hpp"

#include <fstream>
#include <system_error>

namespace verso::repository {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] verso::Error not_found(const fs::path& searched)
{
    return Error::make(std::string(error_code::kRepositoryNotFound),
                       "Can't find the .git directory in " + searched.string());
}

[[nodiscard]] std::optional<std::string> read_first_line(const fs::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::string line;
    std::getline(in, line);
    return common::trim(line);
}

/// Resolve a ".git" file of the form "gitdir: <path>" (worktrees, submodules).
[[nodiscard]] verso::Result<fs::path> follow_gitdir_file(const fs::path& dot_git)
{
    constexpr std::string_view kPrefix = "gitdir:";
    auto line = read_first_line(dot_git);
    if (!line || !line->starts_with(kPrefix)) {
        return std::unexpected(Error::make(std::string(error_code::kRepositoryNotFound),
                                           "Malformed .git file: " + dot_git.string()));
    }
    fs::path git_dir = common::trim(std::string_view(*line).substr(kPrefix.size()));
    if (git_dir.is_relative()) {
        git_dir = dot_git.parent_path() / git_dir;
    }

    // Linked worktrees keep refs and objects in the main repository.
    if (auto common_dir = read_first_line(git_dir / "commondir")) {
        fs::path resolved = *common_dir;
        if (resolved.is_relative()) {
            resolved = git_dir / resolved;
        }
        git_dir = resolved;
    }

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(git_dir, ec);
    if (ec || !fs::is_directory(canonical, ec)) {
        return std::unexpected(Error::make(std::string(error_code::kRepositoryNotFound),
                                           ".git file points to a missing directory: "
                                               + git_dir.string()));
    }
    return canonical;
}

}  // namespace

verso::Result<RepositoryLocation> locate_repository(const fs::path& working_directory)
{
    std::error_code ec;
    fs::path start = fs::weakly_canonical(fs::absolute(working_directory, ec), ec);
    if (ec || !fs::is_directory(start, ec)) {
        return std::unexpected(not_found(working_directory));
    }

    for (fs::path dir = start;; dir = dir.parent_path()) {
        const fs::path dot_git = dir / ".git";
        if (fs::is_directory(dot_git, ec)) {
            return RepositoryLocation{.project_root = dir, .git_dir = dot_git};
        }
        if (fs::is_regular_file(dot_git, ec)) {
            auto git_dir = follow_gitdir_file(dot_git);
            if (!git_dir) {
                return std::unexpected(git_dir.error());
            }
            return RepositoryLocation{.project_root = dir, .git_dir = *git_dir};
        }
        if (dir == dir.root_path() || !dir.has_parent_path()) {
            break;
        }
    }
    return std::unexpected(not_found(start));
}

}  // namespace verso::repository
