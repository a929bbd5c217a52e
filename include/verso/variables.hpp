#pragma once

/**
 * @file variables.hpp
 * @brief Version variables assembly and cache text format
 *
 * Every variable is a string; an empty string means "not applicable". The
 * cache text format is a comment line followed by "Key: Value" lines in
 * field-table order, and is kept stable across releases.
 */

#include "verso/common.hpp"
#include "verso/config.hpp"
#include "verso/increment.hpp"
#include "verso/repository.hpp"
#include "verso/version_source.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace verso::version {

struct VersionVariables
{
    std::string major;
    std::string minor;
    std::string patch;
    std::string pre_release_tag;
    std::string pre_release_tag_with_dash;
    std::string pre_release_label;
    std::string pre_release_number;
    std::string weighted_pre_release_number;
    std::string build_meta_data;
    std::string build_meta_data_padded;
    std::string full_build_meta_data;
    std::string major_minor_patch;
    std::string sem_ver;
    std::string legacy_sem_ver;
    std::string legacy_sem_ver_padded;
    std::string assembly_sem_ver;
    std::string assembly_sem_file_ver;
    std::string full_sem_ver;
    std::string informational_version;
    std::string branch_name;
    std::string escaped_branch_name;
    std::string sha;
    std::string short_sha;
    std::string version_source_sha;
    std::string commits_since_version_source;
    std::string commits_since_version_source_padded;
    std::string commit_date;

    std::string file_name;  ///< Cache entry path; in memory only, never serialized

    [[nodiscard]] bool operator==(const VersionVariables& other) const = default;
};

struct VariableField
{
    std::string_view name;
    std::string VersionVariables::* member;
};

inline constexpr std::size_t kVariableFieldCount = 27;

/// Serialized fields, in serialization order (FileName excluded).
[[nodiscard]] const std::array<VariableField, kVariableFieldCount>& variable_fields();

/**
 * Look up a variable by its serialized name ("FullSemVer"), or "FileName".
 */
[[nodiscard]] std::optional<std::string> find_variable(const VersionVariables& variables,
                                                       std::string_view name);

/**
 * Produce every variable from the increment result.
 *
 * @return Variables or ConfigError when the commit date cannot be formatted
 */
[[nodiscard]] verso::Result<VersionVariables> assemble_variables(const IncrementResult& increment,
                                                                 const VersionSource& source,
                                                                 const repository::RepositoryView& view,
                                                                 const config::EffectiveConfig& config);

/**
 * Render the cache text form; the first line is a comment carrying
 * @p written_at (UTC).
 */
[[nodiscard]] std::string serialize_variables(const VersionVariables& variables,
                                              std::chrono::sys_seconds written_at);

/**
 * Parse the cache text form. Unknown keys are ignored and absent keys stay
 * empty. The document must be a mapping with numeric Major, Minor and Patch.
 *
 * @return Variables or CacheReadError
 */
[[nodiscard]] verso::Result<VersionVariables> parse_variables(std::string_view text);

/// JSON object in field-table order, FileName appended when set.
[[nodiscard]] nlohmann::ordered_json variables_to_json(const VersionVariables& variables);

}  // namespace verso::version
