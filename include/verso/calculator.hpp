#pragma once

/**
 * @file calculator.hpp
 * @brief Version computation orchestrator
 *
 * One VersionCalculator drives one computation: configuration, cache lookup,
 * version source, increment, variables, cache write.
 */

#include "verso/cache.hpp"
#include "verso/common.hpp"
#include "verso/config.hpp"
#include "verso/repository.hpp"
#include "verso/variables.hpp"

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

namespace verso::calculator {

struct ComputeOptions
{
    std::filesystem::path working_directory;
    std::optional<std::filesystem::path> config_file;  ///< Relative to working_directory
    /// Replaces cache participation entirely when set
    std::optional<config::ConfigDocument> override_config;
    cache::RepositoryInfo repository_info;
    bool no_cache = false;
    bool no_normalize = false;
    std::optional<repository::Deadline> deadline;  ///< Applies to git commands only
    std::shared_ptr<spdlog::logger> logger;        ///< Defaults to log::default_logger()
};

class VersionCalculator
{
public:
    VersionCalculator(ComputeOptions options,
                      repository::RepositoryLocation location,
                      std::shared_ptr<const repository::RepositoryInspector> repository);

    /**
     * Compute the version variables, serving them from the cache when the
     * repository and configuration are unchanged.
     *
     * @return Variables or RepositoryNotFound / ConfigError / inspector error
     */
    [[nodiscard]] verso::Result<version::VersionVariables> compute() const;

    /// "<git dir>/verso_cache"
    [[nodiscard]] std::filesystem::path cache_directory() const;

private:
    [[nodiscard]] verso::Result<version::VersionVariables>
    compute_fresh(const config::EffectiveConfig& config) const;

    [[nodiscard]] verso::Result<std::string> branch_for_resolution() const;

    ComputeOptions m_options;
    repository::RepositoryLocation m_location;
    std::shared_ptr<const repository::RepositoryInspector> m_repository;
    std::shared_ptr<spdlog::logger> m_logger;
};

/**
 * Discover the repository enclosing options.working_directory and compute its
 * version with the git executable backend.
 */
[[nodiscard]] verso::Result<version::VersionVariables> compute_version(const ComputeOptions& options);

}  // namespace verso::calculator
