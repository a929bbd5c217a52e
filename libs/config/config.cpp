/**
 * @file config.cpp
 * @brief Configuration document loading
 */

#include "config_internal.hpp"

#include "verso/canonical_json.hpp"
#include "verso/schema_validate.hpp"

#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace verso::config {

namespace {

namespace fs = std::filesystem;

template <typename Enum>
struct EnumToken
{
    Enum value;
    std::string_view token;
};

constexpr std::array kIncrementTokens = {
    EnumToken<IncrementMode>{  IncrementMode::kMajor,   "Major"},
    EnumToken<IncrementMode>{  IncrementMode::kMinor,   "Minor"},
    EnumToken<IncrementMode>{  IncrementMode::kPatch,   "Patch"},
    EnumToken<IncrementMode>{   IncrementMode::kNone,    "None"},
    EnumToken<IncrementMode>{IncrementMode::kInherit, "Inherit"},
};

constexpr std::array kModeTokens = {
    EnumToken<VersioningMode>{  VersioningMode::kContinuousDelivery,   "ContinuousDelivery"},
    EnumToken<VersioningMode>{VersioningMode::kContinuousDeployment, "ContinuousDeployment"},
};

constexpr std::array kSchemeTokens = {
    EnumToken<AssemblyVersioningScheme>{AssemblyVersioningScheme::kMajorMinorPatchTag,
                                        "MajorMinorPatchTag"},
    EnumToken<AssemblyVersioningScheme>{AssemblyVersioningScheme::kMajorMinorPatch, "MajorMinorPatch"},
    EnumToken<AssemblyVersioningScheme>{     AssemblyVersioningScheme::kMajorMinor,      "MajorMinor"},
    EnumToken<AssemblyVersioningScheme>{          AssemblyVersioningScheme::kMajor,           "Major"},
    EnumToken<AssemblyVersioningScheme>{           AssemblyVersioningScheme::kNone,            "None"},
};

template <typename Enum, std::size_t N>
[[nodiscard]] std::string_view token_of(const std::array<EnumToken<Enum>, N>& table, Enum value) noexcept
{
    for (const auto& entry : table) {
        if (entry.value == value) {
            return entry.token;
        }
    }
    return {};
}

template <typename Enum, std::size_t N>
[[nodiscard]] std::optional<Enum> value_of(const std::array<EnumToken<Enum>, N>& table,
                                           std::string_view token) noexcept
{
    for (const auto& entry : table) {
        if (entry.token == token) {
            return entry.value;
        }
    }
    return std::nullopt;
}

template <typename T>
void set_if(std::optional<T>& target, const std::optional<T>& value)
{
    if (value) {
        target = value;
    }
}

[[nodiscard]] std::optional<std::string> string_field(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key)) {
        return std::nullopt;
    }
    const auto& value = j.at(key);
    if (value.is_number_integer()) {
        return std::to_string(value.get<std::int64_t>());
    }
    return value.get<std::string>();
}

[[nodiscard]] std::optional<bool> bool_field(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key)) {
        return std::nullopt;
    }
    return j.at(key).get<bool>();
}

[[nodiscard]] std::optional<int> int_field(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key)) {
        return std::nullopt;
    }
    return j.at(key).get<int>();
}

/// Values are schema-checked before this runs, so enum lookups cannot fail.
[[nodiscard]] ConfigSettings settings_from_json(const nlohmann::json& j)
{
    ConfigSettings settings;
    settings.tag_prefix = string_field(j, "tag-prefix");
    if (auto token = string_field(j, "increment")) {
        settings.increment = parse_increment_mode(*token);
    }
    settings.label = string_field(j, "tag");
    if (auto token = string_field(j, "mode")) {
        settings.mode = parse_versioning_mode(*token);
    }
    settings.bump_pattern = string_field(j, "commit-message-bump-pattern");
    settings.continuous_delivery_fallback_label = string_field(j, "continuous-delivery-fallback-tag");
    settings.prevent_increment_of_merged_branch_version =
        bool_field(j, "prevent-increment-of-merged-branch-version");
    settings.is_release_branch = bool_field(j, "is-release-branch");
    settings.legacy_semver_padding = int_field(j, "legacy-semver-padding");
    settings.commits_since_version_source_padding =
        int_field(j, "commits-since-version-source-padding");
    if (auto token = string_field(j, "assembly-versioning-scheme")) {
        settings.assembly_versioning_scheme = parse_assembly_versioning_scheme(*token);
    }
    if (auto token = string_field(j, "assembly-file-versioning-scheme")) {
        settings.assembly_file_versioning_scheme = parse_assembly_versioning_scheme(*token);
    }
    settings.commit_date_format = string_field(j, "commit-date-format");
    settings.pre_release_weight = int_field(j, "pre-release-weight");
    return settings;
}

[[nodiscard]] verso::Result<LoadedConfig> loaded_from_json(nlohmann::json j, std::string_view source)
{
    if (auto valid = common::validate_json(j, detail::config_schema()); !valid) {
        return std::unexpected(detail::config_error(
            std::format("Invalid configuration in {}:\n{}", source, valid.error().message)));
    }
    auto document = detail::document_from_json(j, source);
    if (!document) {
        return std::unexpected(document.error());
    }
    return LoadedConfig{.document = std::move(*document), .raw = std::move(j), .source_path = {}};
}

}  // namespace

// ============================================================================
// Enum tokens
// ============================================================================

std::string_view to_string(IncrementMode mode) noexcept
{
    return token_of(kIncrementTokens, mode);
}

std::string_view to_string(VersioningMode mode) noexcept
{
    return token_of(kModeTokens, mode);
}

std::string_view to_string(AssemblyVersioningScheme scheme) noexcept
{
    return token_of(kSchemeTokens, scheme);
}

std::optional<IncrementMode> parse_increment_mode(std::string_view token) noexcept
{
    return value_of(kIncrementTokens, token);
}

std::optional<VersioningMode> parse_versioning_mode(std::string_view token) noexcept
{
    return value_of(kModeTokens, token);
}

std::optional<AssemblyVersioningScheme> parse_assembly_versioning_scheme(std::string_view token) noexcept
{
    return value_of(kSchemeTokens, token);
}

// ============================================================================
// Settings and defaults
// ============================================================================

void ConfigSettings::apply(const ConfigSettings& layer)
{
    set_if(tag_prefix, layer.tag_prefix);
    set_if(increment, layer.increment);
    set_if(label, layer.label);
    set_if(mode, layer.mode);
    set_if(bump_pattern, layer.bump_pattern);
    set_if(continuous_delivery_fallback_label, layer.continuous_delivery_fallback_label);
    set_if(prevent_increment_of_merged_branch_version, layer.prevent_increment_of_merged_branch_version);
    set_if(is_release_branch, layer.is_release_branch);
    set_if(legacy_semver_padding, layer.legacy_semver_padding);
    set_if(commits_since_version_source_padding, layer.commits_since_version_source_padding);
    set_if(assembly_versioning_scheme, layer.assembly_versioning_scheme);
    set_if(assembly_file_versioning_scheme, layer.assembly_file_versioning_scheme);
    set_if(commit_date_format, layer.commit_date_format);
    set_if(pre_release_weight, layer.pre_release_weight);
}

const ConfigSettings& default_settings()
{
    static const ConfigSettings defaults = [] {
        ConfigSettings settings;
        settings.tag_prefix = "[vV]";
        settings.increment = IncrementMode::kPatch;
        settings.label = "{BranchName}";
        settings.mode = VersioningMode::kContinuousDelivery;
        settings.bump_pattern = R"(\+semver:\s?(breaking|major|feature|minor|fix|patch|none|skip))";
        settings.continuous_delivery_fallback_label = "ci";
        settings.prevent_increment_of_merged_branch_version = false;
        settings.is_release_branch = false;
        settings.legacy_semver_padding = 4;
        settings.commits_since_version_source_padding = 4;
        settings.assembly_versioning_scheme = AssemblyVersioningScheme::kMajorMinorPatch;
        settings.assembly_file_versioning_scheme = AssemblyVersioningScheme::kMajorMinorPatch;
        settings.commit_date_format = "%Y-%m-%d";
        settings.pre_release_weight = 0;
        return settings;
    }();
    return defaults;
}

const std::vector<BranchRule>& default_branch_rules()
{
    static const std::vector<BranchRule> rules = [] {
        std::vector<BranchRule> list;

        BranchRule main{.name = "main", .regex = "^master$|^main$", .settings = {}};
        main.settings.label = "";
        main.settings.increment = IncrementMode::kPatch;
        main.settings.prevent_increment_of_merged_branch_version = true;
        list.push_back(std::move(main));

        BranchRule develop{.name = "develop", .regex = "^dev(elop)?(ment)?$", .settings = {}};
        develop.settings.label = "alpha";
        develop.settings.increment = IncrementMode::kMinor;
        develop.settings.mode = VersioningMode::kContinuousDeployment;
        list.push_back(std::move(develop));

        BranchRule release{.name = "release", .regex = "^releases?[/-]", .settings = {}};
        release.settings.label = "beta";
        release.settings.increment = IncrementMode::kNone;
        release.settings.is_release_branch = true;
        list.push_back(std::move(release));

        BranchRule feature{.name = "feature", .regex = "^features?[/-]", .settings = {}};
        feature.settings.label = "{BranchName}";
        feature.settings.increment = IncrementMode::kInherit;
        list.push_back(std::move(feature));

        BranchRule pull_request{
            .name = "pull-request", .regex = R"(^(pull|pull\-requests|pr)[/-])", .settings = {}};
        pull_request.settings.label = "PullRequest";
        pull_request.settings.increment = IncrementMode::kInherit;
        list.push_back(std::move(pull_request));

        BranchRule hotfix{.name = "hotfix", .regex = "^hotfix(es)?[/-]", .settings = {}};
        hotfix.settings.label = "beta";
        hotfix.settings.increment = IncrementMode::kPatch;
        hotfix.settings.is_release_branch = true;
        list.push_back(std::move(hotfix));

        BranchRule support{.name = "support", .regex = "^support[/-]", .settings = {}};
        support.settings.label = "";
        support.settings.increment = IncrementMode::kPatch;
        support.settings.prevent_increment_of_merged_branch_version = true;
        list.push_back(std::move(support));

        return list;
    }();
    return rules;
}

// ============================================================================
// Loading
// ============================================================================

namespace detail {

verso::Result<ConfigDocument> document_from_json(const nlohmann::json& j, std::string_view source)
{
    ConfigDocument document;
    document.global = settings_from_json(j);
    document.next_version = string_field(j, "next-version");
    document.no_cache = bool_field(j, "no-cache");
    document.no_normalize = bool_field(j, "no-normalize");

    if (j.contains("branches")) {
        for (const auto& rule_json : j.at("branches")) {
            BranchRule rule;
            rule.name = rule_json.at("name").get<std::string>();
            rule.regex = string_field(rule_json, "regex").value_or("");
            rule.settings = settings_from_json(rule_json);
            for (const auto& existing : document.branches) {
                if (existing.name == rule.name) {
                    return std::unexpected(config_error(
                        std::format("{}: branch rule '{}' is declared twice", source, rule.name)));
                }
            }
            document.branches.push_back(std::move(rule));
        }
    }
    return document;
}

}  // namespace detail

verso::Result<LoadedConfig> parse_config_document(std::string_view yaml_text, std::string_view source)
{
    nlohmann::json converted;
    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));
        auto result = detail::yaml_to_config_json(root, source);
        if (!result) {
            return std::unexpected(result.error());
        }
        converted = std::move(*result);
    } catch (const YAML::Exception& ex) {
        return std::unexpected(
            detail::config_error(std::format("Failed to parse {}: {}", source, ex.what())));
    }
    return loaded_from_json(std::move(converted), source);
}

verso::Result<LoadedConfig> load_config(const LoadOptions& options,
                                        std::optional<std::filesystem::path>* missing_file)
{
    fs::path path;
    const bool explicit_file = options.config_file.has_value();
    if (explicit_file) {
        path = options.config_file->is_relative() ? options.working_directory / *options.config_file
                                                  : *options.config_file;
    } else {
        path = options.project_root / kDefaultConfigFileName;
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (explicit_file) {
            return std::unexpected(
                detail::config_error("Configuration file not found: " + path.string()));
        }
        if (missing_file != nullptr) {
            *missing_file = path;
        }
        return LoadedConfig{};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            detail::config_error("Failed to open configuration file: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

    auto loaded = parse_config_document(content, path.string());
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    loaded->source_path = path;
    return loaded;
}

verso::VoidResult apply_override(ConfigDocument& document, std::string_view assignment)
{
    const auto equals = assignment.find('=');
    if (equals == std::string_view::npos || equals == 0) {
        return std::unexpected(detail::config_error(
            std::format("Override '{}' must have the form key=value", assignment)));
    }
    const std::string key = common::trim(assignment.substr(0, equals));
    const std::string value = common::trim(assignment.substr(equals + 1));
    if (key == "branches") {
        return std::unexpected(
            detail::config_error("Branch rules cannot be overridden from the command line"));
    }

    nlohmann::json j = nlohmann::json::object();
    j[key] = detail::plain_scalar_to_json(value);
    auto loaded = loaded_from_json(std::move(j), "override '" + std::string(assignment) + "'");
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    document.global.apply(loaded->document.global);
    set_if(document.next_version, loaded->document.next_version);
    set_if(document.no_cache, loaded->document.no_cache);
    set_if(document.no_normalize, loaded->document.no_normalize);
    return {};
}

}  // namespace verso::config
