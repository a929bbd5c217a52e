/**
 * @file git_repository.cpp
 * @brief RepositoryInspector backed by the git executable
 *
 * Each query runs one `git -C <root> ...` subprocess through popen and parses
 * its stdout. When a deadline is set, the command is wrapped in coreutils
 * `timeout` with the remaining budget; exit status 124 maps to Timeout.
 */

#include "verso/repository.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <format>
#include <ranges>
#include <string_view>
#include <system_error>

#include <sys/wait.h>

namespace verso::repository {

namespace {

constexpr int kTimeoutExitCode = 124;
constexpr char kFieldSeparator = '\x1f';
constexpr char kRecordSeparator = '\x1e';

[[nodiscard]] std::string quote_posix_argument(std::string_view arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');
    for (char ch : arg) {
        if (ch == '\'') {
            quoted += "'\\''";
            continue;
        }
        quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

[[nodiscard]] std::string join_command(const std::vector<std::string>& args)
{
    std::string command;
    for (const auto& arg : args) {
        if (!command.empty()) {
            command.push_back(' ');
        }
        command += quote_posix_argument(arg);
    }
    return command;
}

[[nodiscard]] verso::Error timeout_error(std::string_view what)
{
    return Error::make(std::string(error_code::kTimeout),
                       std::format("Deadline exceeded while running git {}", what));
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view text, char separator)
{
    std::vector<std::string_view> parts;
    for (auto part : text | std::views::split(separator)) {
        parts.emplace_back(part.begin(), part.end());
    }
    return parts;
}

[[nodiscard]] std::string first_line(std::string_view text)
{
    return common::trim(text.substr(0, text.find('\n')));
}

}  // namespace

GitRepository::GitRepository(RepositoryLocation location,
                             std::optional<Deadline> deadline,
                             std::string git_executable)
    : m_location(std::move(location))
    , m_deadline(deadline)
    , m_git(std::move(git_executable))
{}

verso::Result<GitRepository::CommandOutput>
GitRepository::run(const std::vector<std::string>& args) const
{
    std::vector<std::string> argv;
    if (m_deadline) {
        const auto remaining = *m_deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            return std::unexpected(timeout_error(args.empty() ? "" : args.front()));
        }
        const double seconds = std::chrono::duration<double>(remaining).count();
        argv.emplace_back("timeout");
        argv.push_back(std::format("{:.3f}", std::max(seconds, 0.001)));
    }
    argv.push_back(m_git);
    argv.emplace_back("-C");
    argv.push_back(m_location.project_root.string());
    argv.insert(argv.end(), args.begin(), args.end());

    const std::string command = join_command(argv);
    FILE* pipe = popen(command.c_str(), "r");
    if (pipe == nullptr) {
        return std::unexpected(Error::make(std::string(error_code::kGitCommandFailed),
                                           "Failed to launch: " + command));
    }

    CommandOutput result;
    std::array<char, 4096> buffer{};
    std::size_t read = 0;
    while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), read);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        return std::unexpected(Error::make(std::string(error_code::kGitCommandFailed),
                                           "Failed to wait for: " + command));
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (m_deadline && result.exit_code == kTimeoutExitCode) {
        return std::unexpected(timeout_error(args.empty() ? "" : args.front()));
    }
    return result;
}

verso::Result<std::string> GitRepository::run_checked(const std::vector<std::string>& args) const
{
    auto result = run(args);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exit_code != 0) {
        std::string joined;
        for (const auto& arg : args) {
            joined += " " + arg;
        }
        return std::unexpected(
            Error::make(std::string(error_code::kGitCommandFailed),
                        std::format("git{} exited with status {} in {}",
                                    joined,
                                    result->exit_code,
                                    m_location.project_root.string())));
    }
    return std::move(result->output);
}

verso::Result<std::string> GitRepository::current_branch() const
{
    auto result = run({"symbolic-ref", "--quiet", "--short", "HEAD"});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exit_code != 0) {
        return std::string("HEAD");
    }
    return first_line(result->output);
}

verso::Result<CommitId> GitRepository::current_commit() const
{
    auto result = run({"rev-parse", "--verify", "--quiet", "HEAD^{commit}"});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exit_code != 0) {
        return std::unexpected(Error::make(std::string(error_code::kNoCommits),
                                           "Repository has no commits: "
                                               + m_location.project_root.string()));
    }
    return first_line(result->output);
}

verso::Result<bool> GitRepository::is_dirty() const
{
    auto output = run_checked({"status", "--porcelain", "--untracked-files=no"});
    if (!output) {
        return std::unexpected(output.error());
    }
    return !common::trim(*output).empty();
}

verso::Result<std::vector<Tag>> GitRepository::tags() const
{
    auto output = run_checked({"for-each-ref",
                               "--format=%(refname:short)%09%(objectname)%09%(*objectname)",
                               "refs/tags"});
    if (!output) {
        return std::unexpected(output.error());
    }

    std::vector<Tag> tags;
    for (auto line : split(*output, '\n')) {
        if (line.empty()) {
            continue;
        }
        auto fields = split(line, '\t');
        if (fields.size() < 2) {
            continue;
        }
        // Annotated tags report the peeled commit in the third column.
        std::string_view target = fields.size() > 2 && !fields[2].empty() ? fields[2] : fields[1];
        tags.push_back(Tag{.name = std::string(fields[0]), .target = std::string(target)});
    }
    return tags;
}

verso::Result<std::vector<Commit>>
GitRepository::commits_between(const std::optional<CommitId>& from, const CommitId& to) const
{
    std::string range = from ? *from + ".." + to : to;
    auto output = run_checked({"log", "--topo-order", "--format=%H%x1f%ct%x1f%B%x1e", range, "--"});
    if (!output) {
        return std::unexpected(output.error());
    }

    std::vector<Commit> commits;
    for (auto record : split(*output, kRecordSeparator)) {
        while (!record.empty() && (record.front() == '\n' || record.front() == '\r')) {
            record.remove_prefix(1);
        }
        if (record.empty()) {
            continue;
        }
        auto fields = split(record, kFieldSeparator);
        if (fields.size() < 3) {
            return std::unexpected(Error::make(std::string(error_code::kGitCommandFailed),
                                               "Unexpected git log record: " + std::string(record)));
        }
        Commit commit;
        commit.sha = std::string(fields[0]);
        const auto time_field = fields[1];
        auto [ptr, ec] = std::from_chars(time_field.data(),
                                         time_field.data() + time_field.size(),
                                         commit.timestamp);
        if (ec != std::errc{}) {
            return std::unexpected(Error::make(std::string(error_code::kGitCommandFailed),
                                               "Malformed commit time in git log output: "
                                                   + std::string(time_field)));
        }
        commit.message = common::trim(fields[2]);
        commits.push_back(std::move(commit));
    }
    return commits;
}

verso::Result<CommitId> GitRepository::first_commit() const
{
    auto output = run_checked({"rev-list", "--max-parents=0", "HEAD"});
    if (!output) {
        return std::unexpected(output.error());
    }
    // rev-list lists newest first; the last root is the oldest one.
    std::string last;
    for (auto line : split(*output, '\n')) {
        if (!line.empty()) {
            last = std::string(line);
        }
    }
    return last;
}

}  // namespace verso::repository
