/**
 * @file variables.cpp
 * @brief Version variables formatting and cache text format
 */

#include "verso/variables.hpp"

#include "verso/version.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace verso::version {

namespace {

using VV = VersionVariables;

constexpr std::array<VariableField, kVariableFieldCount> kFields = {{
    {                          "Major",                           &VV::major},
    {                          "Minor",                           &VV::minor},
    {                          "Patch",                           &VV::patch},
    {                  "PreReleaseTag",                 &VV::pre_release_tag},
    {          "PreReleaseTagWithDash",       &VV::pre_release_tag_with_dash},
    {                "PreReleaseLabel",               &VV::pre_release_label},
    {               "PreReleaseNumber",              &VV::pre_release_number},
    {       "WeightedPreReleaseNumber",     &VV::weighted_pre_release_number},
    {                  "BuildMetaData",                 &VV::build_meta_data},
    {            "BuildMetaDataPadded",          &VV::build_meta_data_padded},
    {              "FullBuildMetaData",            &VV::full_build_meta_data},
    {                "MajorMinorPatch",               &VV::major_minor_patch},
    {                         "SemVer",                         &VV::sem_ver},
    {                   "LegacySemVer",                  &VV::legacy_sem_ver},
    {             "LegacySemVerPadded",           &VV::legacy_sem_ver_padded},
    {                 "AssemblySemVer",                &VV::assembly_sem_ver},
    {             "AssemblySemFileVer",           &VV::assembly_sem_file_ver},
    {                     "FullSemVer",                    &VV::full_sem_ver},
    {           "InformationalVersion",           &VV::informational_version},
    {                     "BranchName",                     &VV::branch_name},
    {              "EscapedBranchName",             &VV::escaped_branch_name},
    {                            "Sha",                             &VV::sha},
    {                       "ShortSha",                       &VV::short_sha},
    {               "VersionSourceSha",              &VV::version_source_sha},
    {      "CommitsSinceVersionSource",    &VV::commits_since_version_source},
    {"CommitsSinceVersionSourcePadded", &VV::commits_since_version_source_padded},
    {                     "CommitDate",                     &VV::commit_date},
}};

constexpr std::string_view kFileNameField = "FileName";
constexpr std::size_t kShortShaLength = 8;

[[nodiscard]] std::string pad_left(std::string_view digits, int width)
{
    std::string padded(digits);
    if (width > 0 && padded.size() < static_cast<std::size_t>(width)) {
        padded.insert(0, static_cast<std::size_t>(width) - padded.size(), '0');
    }
    return padded;
}

[[nodiscard]] std::string assembly_version(const SemVer& version, config::AssemblyVersioningScheme scheme)
{
    using config::AssemblyVersioningScheme;
    switch (scheme) {
        case AssemblyVersioningScheme::kMajorMinorPatchTag:
            return std::format("{}.{}.{}.{}",
                               version.major,
                               version.minor,
                               version.patch,
                               version.pre_release_number.value_or(0));
        case AssemblyVersioningScheme::kMajorMinorPatch:
            return std::format("{}.{}.{}.0", version.major, version.minor, version.patch);
        case AssemblyVersioningScheme::kMajorMinor:
            return std::format("{}.{}.0.0", version.major, version.minor);
        case AssemblyVersioningScheme::kMajor:
            return std::format("{}.0.0.0", version.major);
        case AssemblyVersioningScheme::kNone:
            return {};
    }
    return {};
}

[[nodiscard]] verso::Error cache_read_error(std::string message)
{
    return Error::make(std::string(error_code::kCacheReadError), std::move(message));
}

[[nodiscard]] bool is_number(std::string_view text)
{
    return !text.empty() && std::ranges::all_of(text, [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

}  // namespace

const std::array<VariableField, kVariableFieldCount>& variable_fields()
{
    return kFields;
}

std::optional<std::string> find_variable(const VersionVariables& variables, std::string_view name)
{
    if (name == kFileNameField) {
        return variables.file_name;
    }
    for (const auto& field : kFields) {
        if (field.name == name) {
            return variables.*field.member;
        }
    }
    return std::nullopt;
}

verso::Result<VersionVariables> assemble_variables(const IncrementResult& increment,
                                                   const VersionSource& source,
                                                   const repository::RepositoryView& view,
                                                   const config::EffectiveConfig& config)
{
    const SemVer& version = increment.version;
    const std::string commits = std::to_string(increment.commits_since_source);

    VersionVariables vars;
    vars.major = std::to_string(version.major);
    vars.minor = std::to_string(version.minor);
    vars.patch = std::to_string(version.patch);
    vars.pre_release_tag = version.pre_release_tag();
    vars.pre_release_tag_with_dash = vars.pre_release_tag.empty() ? "" : "-" + vars.pre_release_tag;
    vars.pre_release_label = version.pre_release_label.value_or("");
    if (version.pre_release_number) {
        vars.pre_release_number = std::to_string(*version.pre_release_number);
        vars.weighted_pre_release_number = std::to_string(
            static_cast<std::int64_t>(*version.pre_release_number) + config.pre_release_weight);
    }

    if (config.mode == config::VersioningMode::kContinuousDelivery && increment.commits_since_source > 0) {
        vars.build_meta_data = commits;
        vars.build_meta_data_padded = pad_left(commits, config.commits_since_version_source_padding);
    }

    vars.branch_name = config.branch_name;
    vars.escaped_branch_name = escape_branch_name(config.branch_name);
    vars.sha = view.head.sha;
    vars.short_sha = view.head.sha.substr(0, kShortShaLength);
    vars.version_source_sha = source.source_commit;
    vars.commits_since_version_source = commits;
    vars.commits_since_version_source_padded = pad_left(commits, config.commits_since_version_source_padding);

    vars.full_build_meta_data = std::format("{}Branch.{}.Sha.{}",
                                            vars.build_meta_data.empty() ? "" : vars.build_meta_data + ".",
                                            vars.escaped_branch_name,
                                            vars.sha);

    vars.major_minor_patch = version.major_minor_patch();
    vars.sem_ver = vars.major_minor_patch + vars.pre_release_tag_with_dash;
    vars.legacy_sem_ver = vars.major_minor_patch;
    vars.legacy_sem_ver_padded = vars.major_minor_patch;
    if (version.pre_release_label) {
        vars.legacy_sem_ver += "-" + vars.pre_release_label + vars.pre_release_number;
        vars.legacy_sem_ver_padded += "-" + vars.pre_release_label
                                      + (vars.pre_release_number.empty()
                                             ? ""
                                             : pad_left(vars.pre_release_number, config.legacy_semver_padding));
    }
    vars.assembly_sem_ver = assembly_version(version, config.assembly_versioning_scheme);
    vars.assembly_sem_file_ver = assembly_version(version, config.assembly_file_versioning_scheme);
    vars.full_sem_ver = vars.sem_ver + (vars.build_meta_data.empty() ? "" : "+" + vars.build_meta_data);
    vars.informational_version = vars.sem_ver + "+" + vars.full_build_meta_data;

    const std::chrono::sys_seconds commit_time{std::chrono::seconds{view.head.timestamp}};
    try {
        vars.commit_date = std::vformat("{:" + config.commit_date_format + "}", std::make_format_args(commit_time));
    } catch (const std::format_error& ex) {
        return std::unexpected(Error::make(std::string(error_code::kConfigError),
                                           std::format("Invalid commit-date-format '{}': {}",
                                                       config.commit_date_format,
                                                       ex.what())));
    }
    return vars;
}

std::string serialize_variables(const VersionVariables& variables, std::chrono::sys_seconds written_at)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& field : kFields) {
        out << YAML::Key << std::string(field.name) << YAML::Value << variables.*field.member;
    }
    out << YAML::EndMap;

    std::string text = std::format("# verso {} {} written {:%Y-%m-%dT%H:%M:%SZ}\n",
                                   kVersion,
                                   kCacheFormatVersion,
                                   written_at);
    text += out.c_str();
    text.push_back('\n');
    return text;
}

verso::Result<VersionVariables> parse_variables(std::string_view text)
{
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& ex) {
        return std::unexpected(cache_read_error(std::string("Malformed cache entry: ") + ex.what()));
    }
    if (!root.IsMap()) {
        return std::unexpected(cache_read_error("Cache entry is not a mapping"));
    }

    VersionVariables vars;
    for (const auto& field : kFields) {
        const YAML::Node node = root[std::string(field.name)];
        if (!node || node.IsNull()) {
            continue;
        }
        if (!node.IsScalar()) {
            return std::unexpected(
                cache_read_error(std::format("Cache entry field {} is not a scalar", field.name)));
        }
        vars.*field.member = node.Scalar();
    }

    for (const auto* required : {&vars.major, &vars.minor, &vars.patch}) {
        if (!is_number(*required)) {
            return std::unexpected(
                cache_read_error("Cache entry is missing a numeric Major, Minor or Patch"));
        }
    }
    return vars;
}

nlohmann::ordered_json variables_to_json(const VersionVariables& variables)
{
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& field : kFields) {
        j[std::string(field.name)] = variables.*field.member;
    }
    if (!variables.file_name.empty()) {
        j[std::string(kFileNameField)] = variables.file_name;
    }
    return j;
}

}  // namespace verso::version
