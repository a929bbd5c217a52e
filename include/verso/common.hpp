#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error types, hash, path normalization
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace verso {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

/// Error codes shared across modules
namespace error_code {
inline constexpr std::string_view kRepositoryNotFound = "RepositoryNotFound";
inline constexpr std::string_view kConfigError = "ConfigError";
inline constexpr std::string_view kCacheReadError = "CacheReadError";
inline constexpr std::string_view kCacheWriteError = "CacheWriteError";
inline constexpr std::string_view kGitCommandFailed = "GitCommandFailed";
inline constexpr std::string_view kTimeout = "Timeout";
inline constexpr std::string_view kNoCommits = "NoCommits";
inline constexpr std::string_view kInvalidVersion = "InvalidVersion";
inline constexpr std::string_view kInvalidEncoding = "InvalidEncoding";
}  // namespace error_code

}  // namespace verso

namespace verso::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/// 64 lower-case hex characters
[[nodiscard]] std::string sha256(std::string_view data);

/// "sha256:" followed by sha256(@p data)
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Fold a path to a single spelling: '/' separators, no empty or '.'
 * segments, '..' resolved where possible, no trailing slash. Used on the
 * path part of remote URLs.
 */
[[nodiscard]] std::string normalize_path(std::string_view input);

// ============================================================================
// String helpers
// ============================================================================

[[nodiscard]] std::string trim(std::string_view input);

[[nodiscard]] std::string to_lower(std::string_view input);

}  // namespace verso::common
