#pragma once

/**
 * @file increment.hpp
 * @brief Commit walk and increment application
 */

#include "verso/common.hpp"
#include "verso/config.hpp"
#include "verso/repository.hpp"
#include "verso/semver.hpp"
#include "verso/version_source.hpp"

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace verso::version {

struct IncrementResult
{
    SemVer version;
    std::uint64_t commits_since_source = 0;
    config::IncrementMode applied = config::IncrementMode::kNone;
    std::optional<config::IncrementMode> directive;  ///< Strongest bump directive seen
};

/// Replace every character that is not [A-Za-z0-9] with '-'.
[[nodiscard]] std::string escape_branch_name(std::string_view branch);

/**
 * Map a bump directive token (group 1 of the bump pattern) to an increment.
 * breaking/major, feature/minor, fix/patch, none/skip; case-insensitive.
 */
[[nodiscard]] std::optional<config::IncrementMode> directive_from_token(std::string_view token);

/**
 * Strongest directive found in @p message, if any.
 */
[[nodiscard]] std::optional<config::IncrementMode> find_directive(std::string_view message,
                                                                  const std::regex& bump_pattern);

/**
 * Walk the commits after @p source up to @p head and compute the version.
 *
 * @return IncrementResult or the inspector's error
 */
[[nodiscard]] verso::Result<IncrementResult>
calculate_increment(const repository::RepositoryInspector& repository,
                    const VersionSource& source,
                    const repository::Commit& head,
                    const config::EffectiveConfig& config);

}  // namespace verso::version
