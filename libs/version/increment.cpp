/**
 * @file increment.cpp
 * @brief Bump directive scan and version increment
 */

#include "verso/increment.hpp"

#include <cctype>
#include <utility>

namespace verso::version {

namespace {

using config::IncrementMode;

[[nodiscard]] int strength(IncrementMode mode) noexcept
{
    switch (mode) {
        case IncrementMode::kMajor:
            return 3;
        case IncrementMode::kMinor:
            return 2;
        case IncrementMode::kPatch:
            return 1;
        case IncrementMode::kNone:
        case IncrementMode::kInherit:
            return 0;
    }
    return 0;
}

[[nodiscard]] std::optional<IncrementMode> stronger(std::optional<IncrementMode> current,
                                                    std::optional<IncrementMode> candidate)
{
    if (!candidate) {
        return current;
    }
    if (!current || strength(*candidate) > strength(*current)) {
        return candidate;
    }
    return current;
}

void bump(SemVer& version, IncrementMode mode)
{
    switch (mode) {
        case IncrementMode::kMajor:
            ++version.major;
            version.minor = 0;
            version.patch = 0;
            break;
        case IncrementMode::kMinor:
            ++version.minor;
            version.patch = 0;
            break;
        case IncrementMode::kPatch:
            ++version.patch;
            break;
        case IncrementMode::kNone:
        case IncrementMode::kInherit:
            break;
    }
}

[[nodiscard]] std::string expand_label(const std::string& label_template, const std::string& branch)
{
    constexpr std::string_view kPlaceholder = "{BranchName}";
    std::string label = label_template;
    const std::string escaped = escape_branch_name(branch);
    for (auto pos = label.find(kPlaceholder); pos != std::string::npos;
         pos = label.find(kPlaceholder, pos + escaped.size())) {
        label.replace(pos, kPlaceholder.size(), escaped);
    }
    return label;
}

}  // namespace

std::string escape_branch_name(std::string_view branch)
{
    std::string escaped(branch);
    for (char& c : escaped) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0) {
            c = '-';
        }
    }
    return escaped;
}

std::optional<IncrementMode> directive_from_token(std::string_view token)
{
    const std::string lower = common::to_lower(token);
    if (lower == "breaking" || lower == "major") {
        return IncrementMode::kMajor;
    }
    if (lower == "feature" || lower == "minor") {
        return IncrementMode::kMinor;
    }
    if (lower == "fix" || lower == "patch") {
        return IncrementMode::kPatch;
    }
    if (lower == "none" || lower == "skip") {
        return IncrementMode::kNone;
    }
    return std::nullopt;
}

std::optional<IncrementMode> find_directive(std::string_view message, const std::regex& bump_pattern)
{
    std::optional<IncrementMode> found;
    const std::string text(message);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), bump_pattern); it != std::sregex_iterator();
         ++it) {
        const auto& match = *it;
        if (match.size() < 2 || !match[1].matched) {
            continue;
        }
        found = stronger(found, directive_from_token(match[1].str()));
    }
    return found;
}

verso::Result<IncrementResult> calculate_increment(const repository::RepositoryInspector& repository,
                                                   const VersionSource& source,
                                                   const repository::Commit& head,
                                                   const config::EffectiveConfig& config)
{
    std::optional<repository::CommitId> from;
    if (!source.source_commit.empty()) {
        from = source.source_commit;
    }
    auto commits = repository.commits_between(from, head.sha);
    if (!commits) {
        return std::unexpected(commits.error());
    }

    const std::regex bump_pattern(config.bump_pattern, std::regex::icase);
    IncrementResult result;
    result.commits_since_source = commits->size();
    for (const auto& commit : *commits) {
        result.directive = stronger(result.directive, find_directive(commit.message, bump_pattern));
    }

    result.version = source.base_version;
    result.version.build_metadata.reset();

    // A tag on head is the version itself, pre-release included.
    if (source.kind == SourceKind::kTag && source.source_commit == head.sha) {
        return result;
    }

    if (source.should_increment) {
        result.applied = result.directive.value_or(config.increment);
        bump(result.version, result.applied);
    }

    const bool triple_unchanged = result.version.major == source.base_version.major
                                  && result.version.minor == source.base_version.minor
                                  && result.version.patch == source.base_version.patch;
    const std::string label = expand_label(config.label, config.branch_name);

    if (!label.empty()) {
        std::uint64_t number = result.commits_since_source;
        if (triple_unchanged && source.base_version.pre_release_label == label) {
            number += source.base_version.pre_release_number.value_or(0);
        }
        result.version.pre_release_label = label;
        result.version.pre_release_number = number;
    } else if (config.mode == config::VersioningMode::kContinuousDeployment
               && result.commits_since_source > 0
               && !config.continuous_delivery_fallback_label.empty()) {
        result.version.pre_release_label = config.continuous_delivery_fallback_label;
        result.version.pre_release_number = result.commits_since_source;
    } else {
        result.version.pre_release_label.reset();
        result.version.pre_release_number.reset();
    }
    return result;
}

}  // namespace verso::version
