#pragma once

/**
 * @file repository.hpp
 * @brief Read-only repository inspection boundary
 *
 * The engine never walks git objects itself. Everything it needs from the
 * repository goes through RepositoryInspector; GitRepository implements it by
 * running the git executable.
 */

#include "verso/common.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace verso::repository {

using CommitId = std::string;

struct Commit
{
    CommitId sha;
    std::string message;
    std::int64_t timestamp = 0;  ///< Committer time, seconds since epoch (UTC)
};

struct Tag
{
    std::string name;
    CommitId target;  ///< Peeled commit the tag points at
};

class RepositoryInspector
{
public:
    virtual ~RepositoryInspector() = default;

    /// Short branch name of HEAD, or "HEAD" when detached
    [[nodiscard]] virtual verso::Result<std::string> current_branch() const = 0;
    [[nodiscard]] virtual verso::Result<CommitId> current_commit() const = 0;
    [[nodiscard]] virtual verso::Result<bool> is_dirty() const = 0;
    [[nodiscard]] virtual verso::Result<std::vector<Tag>> tags() const = 0;

    /**
     * Commits reachable from @p to but not from @p from (git "from..to"),
     * newest first in topological order. Without @p from, the whole history
     * of @p to.
     */
    [[nodiscard]] virtual verso::Result<std::vector<Commit>>
    commits_between(const std::optional<CommitId>& from, const CommitId& to) const = 0;

    /// Oldest root commit reachable from HEAD
    [[nodiscard]] virtual verso::Result<CommitId> first_commit() const = 0;
};

// ============================================================================
// Repository discovery
// ============================================================================

struct RepositoryLocation
{
    std::filesystem::path project_root;  ///< Working tree root (directory holding .git)
    std::filesystem::path git_dir;       ///< Common .git directory (worktrees resolved)
};

/**
 * Walk up from @p working_directory to the first directory containing .git.
 * A .git file ("gitdir: <path>") is followed, including the "commondir"
 * indirection used by linked worktrees.
 *
 * @return Location or RepositoryNotFound ("Can't find the .git directory in <path>")
 */
[[nodiscard]] verso::Result<RepositoryLocation>
locate_repository(const std::filesystem::path& working_directory);

// ============================================================================
// Snapshot consumed by the version source strategies
// ============================================================================

struct RepositoryView
{
    std::string branch;
    Commit head;
    std::vector<Commit> history;  ///< Reachable from head, newest first (head included)
    std::vector<Tag> tags;
    CommitId first_commit;

    [[nodiscard]] const Commit* find_commit(const CommitId& sha) const;
};

[[nodiscard]] verso::Result<RepositoryView> make_repository_view(const RepositoryInspector& inspector);

// ============================================================================
// git executable backend
// ============================================================================

using Deadline = std::chrono::steady_clock::time_point;

class GitRepository final : public RepositoryInspector
{
public:
    explicit GitRepository(RepositoryLocation location,
                           std::optional<Deadline> deadline = std::nullopt,
                           std::string git_executable = "git");

    [[nodiscard]] verso::Result<std::string> current_branch() const override;
    [[nodiscard]] verso::Result<CommitId> current_commit() const override;
    [[nodiscard]] verso::Result<bool> is_dirty() const override;
    [[nodiscard]] verso::Result<std::vector<Tag>> tags() const override;
    [[nodiscard]] verso::Result<std::vector<Commit>>
    commits_between(const std::optional<CommitId>& from, const CommitId& to) const override;
    [[nodiscard]] verso::Result<CommitId> first_commit() const override;

private:
    struct CommandOutput
    {
        int exit_code = 0;
        std::string output;
    };

    [[nodiscard]] verso::Result<CommandOutput> run(const std::vector<std::string>& args) const;
    [[nodiscard]] verso::Result<std::string> run_checked(const std::vector<std::string>& args) const;

    RepositoryLocation m_location;
    std::optional<Deadline> m_deadline;
    std::string m_git;
};

}  // namespace verso::repository
