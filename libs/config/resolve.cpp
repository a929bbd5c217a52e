/**
 * @file resolve.cpp
 * @brief Branch rule merging and effective configuration fold
 */

#include "config_internal.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <regex>
#include <utility>

namespace verso::config {

namespace {

constexpr std::string_view kHeadsPrefix = "refs/heads/";
constexpr std::string_view kRemotesPrefix = "refs/remotes/";
constexpr std::string_view kOriginPrefix = "origin/";

[[nodiscard]] verso::VoidResult check_regex(const std::string& pattern, std::string_view what)
{
    try {
        std::regex compiled(pattern);
        (void)compiled;
    } catch (const std::regex_error& ex) {
        return std::unexpected(detail::config_error(
            std::format("Invalid regular expression for {} '{}': {}", what, pattern, ex.what())));
    }
    return {};
}

[[nodiscard]] verso::VoidResult merge_rules(std::vector<BranchRule>& rules,
                                            const std::vector<BranchRule>& layer)
{
    for (const auto& rule : layer) {
        auto existing = std::ranges::find(rules, rule.name, &BranchRule::name);
        if (existing != rules.end()) {
            if (!rule.regex.empty()) {
                existing->regex = rule.regex;
            }
            existing->settings.apply(rule.settings);
            continue;
        }
        if (rule.regex.empty()) {
            return std::unexpected(detail::config_error(
                std::format("Branch rule '{}' has no regex", rule.name)));
        }
        rules.push_back(rule);
    }
    return {};
}

[[nodiscard]] verso::VoidResult check_date_format(const std::string& format)
{
    const std::chrono::sys_seconds probe{};
    try {
        const std::string rendered = std::vformat("{:" + format + "}", std::make_format_args(probe));
        (void)rendered;
    } catch (const std::format_error& ex) {
        return std::unexpected(detail::config_error(
            std::format("Invalid commit-date-format '{}': {}", format, ex.what())));
    }
    return {};
}

}  // namespace

std::string normalize_branch_name(std::string_view branch)
{
    if (branch.starts_with(kHeadsPrefix)) {
        branch.remove_prefix(kHeadsPrefix.size());
    } else if (branch.starts_with(kRemotesPrefix)) {
        branch.remove_prefix(kRemotesPrefix.size());
        // Drop the remote name as well.
        const auto slash = branch.find('/');
        if (slash != std::string_view::npos) {
            branch.remove_prefix(slash + 1);
        }
    }
    if (branch.starts_with(kOriginPrefix)) {
        branch.remove_prefix(kOriginPrefix.size());
    }
    return std::string(branch);
}

verso::Result<EffectiveConfig> resolve_effective_config(const ConfigDocument& document,
                                                        const std::optional<ConfigDocument>& override_document,
                                                        std::string_view branch)
{
    ConfigSettings global = default_settings();
    global.apply(document.global);
    if (override_document) {
        global.apply(override_document->global);
    }

    std::vector<BranchRule> rules = default_branch_rules();
    if (auto merged = merge_rules(rules, document.branches); !merged) {
        return std::unexpected(merged.error());
    }
    if (override_document) {
        if (auto merged = merge_rules(rules, override_document->branches); !merged) {
            return std::unexpected(merged.error());
        }
    }

    EffectiveConfig config;
    config.branch_name = normalize_branch_name(branch);

    ConfigSettings settings = global;
    for (const auto& rule : rules) {
        if (auto valid = check_regex(rule.regex, "branch rule " + rule.name); !valid) {
            return std::unexpected(valid.error());
        }
        const std::regex pattern(rule.regex);
        if (rule.settings.is_release_branch.value_or(*global.is_release_branch)) {
            config.release_branch_patterns.push_back(rule.regex);
        }
        if (!std::regex_search(config.branch_name, pattern)) {
            continue;
        }
        settings.apply(rule.settings);
        config.matched_rules.push_back(rule.name);
    }

    if (auto valid = check_regex(*settings.tag_prefix, "tag-prefix"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = check_regex(*settings.bump_pattern, "commit-message-bump-pattern"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = check_date_format(*settings.commit_date_format); !valid) {
        return std::unexpected(valid.error());
    }

    IncrementMode increment = *settings.increment;
    if (increment == IncrementMode::kInherit) {
        increment = *global.increment;
        if (increment == IncrementMode::kInherit) {
            increment = IncrementMode::kPatch;
        }
    }

    config.tag_prefix = *settings.tag_prefix;
    config.increment = increment;
    config.label = *settings.label;
    config.mode = *settings.mode;
    config.bump_pattern = *settings.bump_pattern;
    config.continuous_delivery_fallback_label = *settings.continuous_delivery_fallback_label;
    config.prevent_increment_of_merged_branch_version =
        *settings.prevent_increment_of_merged_branch_version;
    config.is_release_branch = *settings.is_release_branch;
    config.legacy_semver_padding = *settings.legacy_semver_padding;
    config.commits_since_version_source_padding = *settings.commits_since_version_source_padding;
    config.assembly_versioning_scheme = *settings.assembly_versioning_scheme;
    config.assembly_file_versioning_scheme = *settings.assembly_file_versioning_scheme;
    config.commit_date_format = *settings.commit_date_format;
    config.pre_release_weight = *settings.pre_release_weight;

    std::optional<std::string> next_version = document.next_version;
    if (override_document && override_document->next_version) {
        next_version = override_document->next_version;
    }
    if (next_version) {
        auto parsed = parse_semver(*next_version);
        if (!parsed) {
            return std::unexpected(detail::config_error(
                std::format("Invalid next-version '{}': {}", *next_version, parsed.error().message)));
        }
        config.next_version = *parsed;
    }

    config.no_cache = document.no_cache.value_or(false);
    config.no_normalize = document.no_normalize.value_or(false);
    if (override_document) {
        config.no_cache = override_document->no_cache.value_or(config.no_cache);
        config.no_normalize = override_document->no_normalize.value_or(config.no_normalize);
    }
    return config;
}

}  // namespace verso::config
