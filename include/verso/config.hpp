#pragma once

/**
 * @file config.hpp
 * @brief Configuration document loading and per-branch resolution
 *
 * A configuration document is a global settings section plus an ordered list
 * of branch rules. Resolution is a fold over the constant built-in defaults:
 * every layer sets only the fields it explicitly carries.
 */

#include "verso/common.hpp"
#include "verso/semver.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace verso::config {

/// Default configuration file name, looked up at the project root.
inline constexpr std::string_view kDefaultConfigFileName = "verso.yml";

enum class IncrementMode { kMajor, kMinor, kPatch, kNone, kInherit };

enum class VersioningMode { kContinuousDelivery, kContinuousDeployment };

enum class AssemblyVersioningScheme { kMajorMinorPatchTag, kMajorMinorPatch, kMajorMinor, kMajor, kNone };

[[nodiscard]] std::string_view to_string(IncrementMode mode) noexcept;
[[nodiscard]] std::string_view to_string(VersioningMode mode) noexcept;
[[nodiscard]] std::string_view to_string(AssemblyVersioningScheme scheme) noexcept;

[[nodiscard]] std::optional<IncrementMode> parse_increment_mode(std::string_view token) noexcept;
[[nodiscard]] std::optional<VersioningMode> parse_versioning_mode(std::string_view token) noexcept;
[[nodiscard]] std::optional<AssemblyVersioningScheme>
parse_assembly_versioning_scheme(std::string_view token) noexcept;

/**
 * @brief Partial settings; unset fields inherit from the previous layer
 */
struct ConfigSettings
{
    std::optional<std::string> tag_prefix;  ///< Regex matched before the version in tag names
    std::optional<IncrementMode> increment;
    std::optional<std::string> label;  ///< Pre-release label template ("tag"), "{BranchName}" allowed
    std::optional<VersioningMode> mode;
    std::optional<std::string> bump_pattern;  ///< Regex, group 1 is the directive token
    std::optional<std::string> continuous_delivery_fallback_label;
    std::optional<bool> prevent_increment_of_merged_branch_version;
    std::optional<bool> is_release_branch;
    std::optional<int> legacy_semver_padding;
    std::optional<int> commits_since_version_source_padding;
    std::optional<AssemblyVersioningScheme> assembly_versioning_scheme;
    std::optional<AssemblyVersioningScheme> assembly_file_versioning_scheme;
    std::optional<std::string> commit_date_format;  ///< std::chrono format spec, e.g. "%Y-%m-%d"
    std::optional<int> pre_release_weight;

    /// Copy every field set in @p layer over this one.
    void apply(const ConfigSettings& layer);
};

struct BranchRule
{
    std::string name;
    std::string regex;
    ConfigSettings settings;
};

struct ConfigDocument
{
    ConfigSettings global;
    std::optional<std::string> next_version;
    std::vector<BranchRule> branches;
    std::optional<bool> no_cache;
    std::optional<bool> no_normalize;
};

struct LoadedConfig
{
    ConfigDocument document;
    nlohmann::json raw = nlohmann::json::object();  ///< Normalized JSON form, hashed into cache keys
    std::optional<std::filesystem::path> source_path;  ///< Set when a file was read
};

/**
 * @brief Fully resolved settings for one branch of one computation
 */
struct EffectiveConfig
{
    std::string branch_name;                 ///< Normalized branch name
    std::vector<std::string> matched_rules;  ///< Rule names applied, in order
    std::string tag_prefix;
    IncrementMode increment = IncrementMode::kPatch;
    std::string label;
    VersioningMode mode = VersioningMode::kContinuousDelivery;
    std::string bump_pattern;
    std::string continuous_delivery_fallback_label;
    bool prevent_increment_of_merged_branch_version = false;
    bool is_release_branch = false;
    int legacy_semver_padding = 4;
    int commits_since_version_source_padding = 4;
    AssemblyVersioningScheme assembly_versioning_scheme = AssemblyVersioningScheme::kMajorMinorPatch;
    AssemblyVersioningScheme assembly_file_versioning_scheme =
        AssemblyVersioningScheme::kMajorMinorPatch;
    std::string commit_date_format;
    int pre_release_weight = 0;
    std::optional<SemVer> next_version;
    std::vector<std::string> release_branch_patterns;  ///< Regexes of rules marked is-release-branch
    bool no_cache = false;
    bool no_normalize = false;
};

/**
 * Built-in global settings (every field set). Constant; never mutated.
 */
[[nodiscard]] const ConfigSettings& default_settings();

/**
 * Built-in branch rules: main, develop, release, feature, pull-request,
 * hotfix, support.
 */
[[nodiscard]] const std::vector<BranchRule>& default_branch_rules();

// ============================================================================
// Loading
// ============================================================================

/**
 * Parse a YAML configuration document.
 *
 * The YAML is converted to JSON, validated against the configuration schema,
 * and converted to the typed document.
 *
 * @param yaml_text Document text (empty text is an empty document)
 * @param source Name used in error messages
 * @return Loaded configuration (source_path unset) or ConfigError
 */
[[nodiscard]] verso::Result<LoadedConfig> parse_config_document(std::string_view yaml_text,
                                                                std::string_view source);

struct LoadOptions
{
    std::filesystem::path project_root;
    std::filesystem::path working_directory;
    std::optional<std::filesystem::path> config_file;  ///< Explicit file; relative to working_directory
};

/**
 * Load the configuration for a project.
 *
 * Without an explicit file, "<project_root>/verso.yml" is used when present;
 * absence yields an empty document (built-in defaults) and sets
 * @p missing_file to the path that was probed. An explicit file that does not
 * exist is a ConfigError.
 */
[[nodiscard]] verso::Result<LoadedConfig>
load_config(const LoadOptions& options, std::optional<std::filesystem::path>* missing_file = nullptr);

/**
 * Parse one "key=value" override as given on the command line
 * (e.g. "tag-prefix=release-", "next-version=2.0") into @p document.
 */
[[nodiscard]] verso::VoidResult apply_override(ConfigDocument& document, std::string_view assignment);

// ============================================================================
// Resolution
// ============================================================================

/**
 * Strip "refs/heads/", "refs/remotes/<remote>/" and "origin/" prefixes.
 */
[[nodiscard]] std::string normalize_branch_name(std::string_view branch);

/**
 * Resolve the effective configuration for @p branch.
 *
 * Layers, lowest first: built-in defaults, document global, override global;
 * then every matching branch rule in list order (built-in rules with same-named
 * document/override rules merged into them, new rules appended).
 *
 * @return EffectiveConfig or ConfigError (invalid regex, next-version or
 *         commit-date-format)
 */
[[nodiscard]] verso::Result<EffectiveConfig>
resolve_effective_config(const ConfigDocument& document,
                         const std::optional<ConfigDocument>& override_document,
                         std::string_view branch);

}  // namespace verso::config
