#pragma once

/**
 * @file cache.hpp
 * @brief Content-derived cache keys and the on-disk version variables cache
 *
 * Entries live at "<cache dir>/<key>.yml". The key is a SHA-256 over the
 * repository state and the configuration; no filesystem path takes part in it,
 * so two checkouts of the same state share a key.
 */

#include "verso/common.hpp"
#include "verso/config.hpp"
#include "verso/repository.hpp"
#include "verso/variables.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace verso::cache {

/// Directory created under the git directory.
inline constexpr std::string_view kCacheDirectoryName = "verso_cache";

/// Extension of cache entries.
inline constexpr std::string_view kEntryExtension = ".yml";

/**
 * @brief Logical identity of the repository being versioned
 *
 * Build agents clone into arbitrary directories; the target URL and branch
 * identify the repository independently of where it is checked out.
 */
struct RepositoryInfo
{
    std::optional<std::string> target_url;
    std::optional<std::string> target_branch;
};

struct CacheKey
{
    std::string value;  ///< 64 lower-case hex characters

    [[nodiscard]] bool operator==(const CacheKey& other) const = default;
};

/**
 * Normalize a remote URL: scheme and host lower-cased, path folded with
 * common::normalize_path, trailing '/' and ".git" removed.
 */
[[nodiscard]] std::string normalize_target_url(std::string_view url);

class CacheKeyFactory
{
public:
    CacheKeyFactory(const repository::RepositoryInspector& repository,
                    RepositoryInfo repository_info,
                    bool no_normalize);

    /**
     * Fingerprint JSON hashed into the key (exposed for diagnostics and tests).
     */
    [[nodiscard]] verso::Result<nlohmann::json> fingerprint(const config::LoadedConfig& loaded) const;

    [[nodiscard]] verso::Result<CacheKey> create(const config::LoadedConfig& loaded) const;

private:
    const repository::RepositoryInspector& m_repository;
    RepositoryInfo m_repository_info;
    bool m_no_normalize;
};

enum class CacheStatus { kHit, kMiss, kInvalidated, kCorrupt };

[[nodiscard]] std::string_view to_string(CacheStatus status) noexcept;

struct CacheLookup
{
    CacheStatus status = CacheStatus::kMiss;
    std::optional<version::VersionVariables> variables;  ///< Set on kHit, FileName included
    std::filesystem::path path;
    std::string detail;  ///< Reason for kCorrupt
};

class CacheStore
{
public:
    CacheStore(std::filesystem::path directory, std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] const std::filesystem::path& directory() const { return m_directory; }

    [[nodiscard]] std::filesystem::path path_for(const CacheKey& key) const;

    /**
     * Look up an entry.
     *
     * Missing entry is kMiss. A @p config_file written after the cache
     * directory was last modified is kInvalidated. An unreadable or
     * structurally invalid entry is kCorrupt. Otherwise kHit.
     */
    [[nodiscard]] CacheLookup lookup(const CacheKey& key,
                                     const std::optional<std::filesystem::path>& config_file) const;

    /**
     * Write an entry atomically (temporary file renamed over the entry).
     *
     * @return Success or CacheWriteError
     */
    [[nodiscard]] verso::VoidResult store(const CacheKey& key, const version::VersionVariables& variables) const;

private:
    std::filesystem::path m_directory;
    std::shared_ptr<spdlog::logger> m_logger;
};

}  // namespace verso::cache
