/**
 * @file version_source.cpp
 * @brief Tag, merge message and default version sources
 */

#include "verso/version_source.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <ranges>
#include <regex>
#include <utility>
#include <vector>

namespace verso::version {

namespace {

using repository::RepositoryView;
using config::EffectiveConfig;

[[nodiscard]] int kind_rank(SourceKind kind) noexcept
{
    switch (kind) {
        case SourceKind::kTag:
            return 3;
        case SourceKind::kMergeMessage:
            return 2;
        case SourceKind::kConfigDefault:
            return 1;
        case SourceKind::kNextVersionOverride:
            return 0;
    }
    return 0;
}

/// Optional tag prefix anchored at the start of the name.
[[nodiscard]] std::regex prefix_regex(const EffectiveConfig& config)
{
    return std::regex("^(?:" + config.tag_prefix + ")?");
}

[[nodiscard]] std::optional<SemVer> version_after_prefix(const std::string& text, const std::regex& prefix)
{
    std::smatch match;
    std::string_view rest = text;
    if (std::regex_search(text, match, prefix)) {
        rest.remove_prefix(static_cast<std::size_t>(match.length(0)));
    }
    auto parsed = parse_semver(rest);
    if (!parsed) {
        return std::nullopt;
    }
    return *parsed;
}

/// Keep the better of @p best and @p candidate.
void keep_best(std::optional<VersionSource>& best, VersionSource candidate)
{
    if (!best || is_preferred(candidate, *best)) {
        best = std::move(candidate);
    }
}

/// Last '/' or '-' separated segment of @p branch that parses as a version.
[[nodiscard]] std::optional<SemVer> version_from_branch(const std::string& branch, const std::regex& prefix)
{
    std::vector<std::string> segments;
    std::string current;
    for (char c : branch) {
        if (c == '/' || c == '-') {
            segments.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    segments.push_back(std::move(current));

    for (const auto& segment : std::views::reverse(segments)) {
        if (segment.empty()) {
            continue;
        }
        if (auto version = version_after_prefix(segment, prefix)) {
            return version;
        }
    }
    return std::nullopt;
}

[[nodiscard]] bool is_release_branch(const std::string& branch, const EffectiveConfig& config)
{
    return std::ranges::any_of(config.release_branch_patterns, [&branch](const std::string& pattern) {
        return std::regex_search(branch, std::regex(pattern));
    });
}

constexpr std::array kStrategies = {
    Strategy{&tag_version_source},
    Strategy{&merge_message_version_source},
    Strategy{&config_default_version_source},
};

}  // namespace

std::string_view to_string(SourceKind kind) noexcept
{
    switch (kind) {
        case SourceKind::kTag:
            return "Tag";
        case SourceKind::kNextVersionOverride:
            return "NextVersionOverride";
        case SourceKind::kMergeMessage:
            return "MergeMessage";
        case SourceKind::kConfigDefault:
            return "ConfigDefault";
    }
    return "Unknown";
}

bool is_preferred(const VersionSource& lhs, const VersionSource& rhs)
{
    if (auto order = lhs.base_version <=> rhs.base_version; order != 0) {
        return order > 0;
    }
    if (kind_rank(lhs.kind) != kind_rank(rhs.kind)) {
        return kind_rank(lhs.kind) > kind_rank(rhs.kind);
    }
    if (lhs.source_date != rhs.source_date) {
        return lhs.source_date > rhs.source_date;
    }
    return lhs.source_commit < rhs.source_commit;
}

StrategyResult tag_version_source(const RepositoryView& view, const EffectiveConfig& config)
{
    const std::regex prefix = prefix_regex(config);
    std::optional<VersionSource> best;
    for (const auto& tag : view.tags) {
        const auto* commit = view.find_commit(tag.target);
        if (commit == nullptr) {
            continue;
        }
        auto version = version_after_prefix(tag.name, prefix);
        if (!version) {
            continue;
        }
        version->build_metadata.reset();
        keep_best(best,
                  VersionSource{.base_version = std::move(*version),
                                .source_commit = commit->sha,
                                .source_date = commit->timestamp,
                                .kind = SourceKind::kTag,
                                .should_increment = commit->sha != view.head.sha,
                                .description = "Git tag '" + tag.name + "'"});
    }
    return best;
}

std::optional<MergedBranch> parse_merge_message(std::string_view message)
{
    static const std::array<std::regex, 4> kFormats = {
        std::regex(R"(^Merge (?:branch|tag) '([^']+)'(?: into (\S+))?)"),
        std::regex(R"(^Merge pull request #\d+ (?:from|in) (\S+)(?: into (\S+))?)"),
        std::regex(R"(^Merge remote-tracking branch '([^']+)'(?: into (\S+))?)"),
        std::regex(R"(^Finish (\S+))"),
    };

    const std::string text(message.substr(0, message.find('\n')));
    std::smatch match;
    for (const auto& format : kFormats) {
        if (!std::regex_search(text, match, format)) {
            continue;
        }
        MergedBranch merged{.source = match[1].str(), .target = std::nullopt};
        if (match.size() > 2 && match[2].matched) {
            merged.target = match[2].str();
        }
        return merged;
    }
    return std::nullopt;
}

StrategyResult merge_message_version_source(const RepositoryView& view, const EffectiveConfig& config)
{
    const std::regex prefix = prefix_regex(config);
    std::optional<VersionSource> best;
    for (const auto& commit : view.history) {
        auto merged = parse_merge_message(commit.message);
        if (!merged) {
            continue;
        }
        std::string source = config::normalize_branch_name(merged->source);
        // "owner/branch" from pull request titles
        if (!is_release_branch(source, config)) {
            const auto slash = source.find('/');
            if (slash == std::string::npos || !is_release_branch(source.substr(slash + 1), config)) {
                continue;
            }
            source = source.substr(slash + 1);
        }
        auto version = version_from_branch(source, prefix);
        if (!version) {
            continue;
        }
        version->build_metadata.reset();
        // History is newest first: the strict comparison keeps the newest merge per version.
        keep_best(best,
                  VersionSource{.base_version = std::move(*version),
                                .source_commit = commit.sha,
                                .source_date = commit.timestamp,
                                .kind = SourceKind::kMergeMessage,
                                .should_increment = !config.prevent_increment_of_merged_branch_version,
                                .description = "Merge message '" + commit.message.substr(0, commit.message.find('\n'))
                                    + "'"});
    }
    return best;
}

StrategyResult config_default_version_source(const RepositoryView& view, const EffectiveConfig& /*config*/)
{
    const auto* first = view.find_commit(view.first_commit);
    const repository::Commit& anchor = first != nullptr ? *first : view.head;
    return VersionSource{.base_version = SemVer{.major = 0, .minor = 1, .patch = 0},
                         .source_commit = anchor.sha,
                         .source_date = anchor.timestamp,
                         .kind = SourceKind::kConfigDefault,
                         .should_increment = false,
                         .description = "Fallback base version"};
}

std::span<const Strategy> default_strategies()
{
    return kStrategies;
}

verso::Result<VersionSource> locate_version_source(const RepositoryView& view, const EffectiveConfig& config)
{
    std::optional<VersionSource> best;
    for (Strategy strategy : default_strategies()) {
        auto found = strategy(view, config);
        if (!found) {
            return std::unexpected(found.error());
        }
        if (*found) {
            keep_best(best, std::move(**found));
        }
    }
    if (!best) {
        return std::unexpected(Error::make(std::string(error_code::kNoCommits),
                                           "No version source found for " + view.head.sha));
    }

    if (config.next_version && *config.next_version > best->base_version) {
        best->base_version = *config.next_version;
        best->kind = SourceKind::kNextVersionOverride;
        best->should_increment = false;
        best->description = std::format("next-version {} from configuration", config.next_version->to_string());
    }
    return std::move(*best);
}

}  // namespace verso::version
