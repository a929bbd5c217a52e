#pragma once

/**
 * @file semver.hpp
 * @brief Semantic version value type
 */

#include "verso/common.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace verso {

/**
 * @brief major.minor.patch[-label[.number]][+build]
 *
 * Ordering compares the numeric triple first; at an equal triple a release
 * (no label) is greater than any pre-release. Labels compare lexicographically,
 * then numbers (absent < present). Build metadata is ignored.
 */
struct SemVer
{
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::optional<std::string> pre_release_label;
    std::optional<std::uint64_t> pre_release_number;
    std::optional<std::string> build_metadata;

    [[nodiscard]] bool has_pre_release() const noexcept { return pre_release_label.has_value(); }

    /// "label.number", "label", or empty
    [[nodiscard]] std::string pre_release_tag() const;

    /// "major.minor.patch"
    [[nodiscard]] std::string major_minor_patch() const;

    /// "major.minor.patch[-label[.number]]"
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::strong_ordering operator<=>(const SemVer& other) const;
    [[nodiscard]] bool operator==(const SemVer& other) const;
};

/**
 * Parse a version as written in tags and configuration.
 *
 * Accepts "1", "1.2", "1.2.3", optional "-label", "-label.N", "-labelN" and
 * "+build". Missing minor/patch components are zero.
 *
 * @return SemVer or InvalidVersion
 */
[[nodiscard]] verso::Result<SemVer> parse_semver(std::string_view text);

}  // namespace verso
