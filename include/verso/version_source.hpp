#pragma once

/**
 * @file version_source.hpp
 * @brief Version source strategies and selection
 *
 * Each strategy is a pure function of the repository snapshot and the
 * effective configuration. The locator runs them in a fixed order and picks a
 * single winner with one total comparator.
 */

#include "verso/common.hpp"
#include "verso/config.hpp"
#include "verso/repository.hpp"
#include "verso/semver.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace verso::version {

enum class SourceKind { kTag, kNextVersionOverride, kMergeMessage, kConfigDefault };

[[nodiscard]] std::string_view to_string(SourceKind kind) noexcept;

struct VersionSource
{
    SemVer base_version;
    repository::CommitId source_commit;
    std::int64_t source_date = 0;  ///< Commit time of source_commit, seconds since epoch
    SourceKind kind = SourceKind::kConfigDefault;
    bool should_increment = false;
    std::string description;
};

using StrategyResult = verso::Result<std::optional<VersionSource>>;
using Strategy = StrategyResult (*)(const repository::RepositoryView& view,
                                    const config::EffectiveConfig& config);

/// Highest reachable tag matching the tag prefix.
[[nodiscard]] StrategyResult tag_version_source(const repository::RepositoryView& view,
                                                const config::EffectiveConfig& config);

/// Highest version merged from a release branch, per merge commit message.
[[nodiscard]] StrategyResult merge_message_version_source(const repository::RepositoryView& view,
                                                          const config::EffectiveConfig& config);

/// 0.1.0 at the first commit; always yields a source.
[[nodiscard]] StrategyResult config_default_version_source(const repository::RepositoryView& view,
                                                           const config::EffectiveConfig& config);

/// Strategies in evaluation order.
[[nodiscard]] std::span<const Strategy> default_strategies();

/**
 * @brief Branch names recovered from a merge commit message
 */
struct MergedBranch
{
    std::string source;
    std::optional<std::string> target;
};

/**
 * Recognize "Merge branch|tag '<src>' [into <dst>]", "Merge pull request #N
 * from|in <src> [into <dst>]", "Merge remote-tracking branch '<src>'" and
 * "Finish <src>".
 */
[[nodiscard]] std::optional<MergedBranch> parse_merge_message(std::string_view message);

/**
 * Total order used for selection: true when @p lhs beats @p rhs.
 * Higher version, then kind (Tag > MergeMessage > ConfigDefault), then newer
 * source date, then lexicographically smaller sha.
 */
[[nodiscard]] bool is_preferred(const VersionSource& lhs, const VersionSource& rhs);

/**
 * Run every strategy, select the winner and apply the next-version floor.
 *
 * When the configured next-version is greater than the winner's version, the
 * winner keeps its commit but takes that version, becomes
 * kNextVersionOverride and no longer increments.
 */
[[nodiscard]] verso::Result<VersionSource> locate_version_source(const repository::RepositoryView& view,
                                                                 const config::EffectiveConfig& config);

}  // namespace verso::version
