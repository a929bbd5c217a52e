/**
 * @file calculator.cpp
 * @brief Version computation orchestrator
 */

#include "verso/calculator.hpp"

#include "verso/increment.hpp"
#include "verso/log.hpp"
#include "verso/version_source.hpp"

#include <utility>

#include <spdlog/fmt/ranges.h>

namespace verso::calculator {

namespace {

constexpr std::string_view kDetachedHead = "HEAD";

}  // namespace

VersionCalculator::VersionCalculator(ComputeOptions options,
                                     repository::RepositoryLocation location,
                                     std::shared_ptr<const repository::RepositoryInspector> repository)
    : m_options(std::move(options))
    , m_location(std::move(location))
    , m_repository(std::move(repository))
    , m_logger(log::logger_or_default(m_options.logger))
{}

std::filesystem::path VersionCalculator::cache_directory() const
{
    return m_location.git_dir / cache::kCacheDirectoryName;
}

verso::Result<std::string> VersionCalculator::branch_for_resolution() const
{
    auto branch = m_repository->current_branch();
    if (!branch) {
        return std::unexpected(branch.error());
    }
    if (*branch == kDetachedHead && m_options.repository_info.target_branch) {
        m_logger->debug("HEAD is detached, using target branch {}", *m_options.repository_info.target_branch);
        return *m_options.repository_info.target_branch;
    }
    return branch;
}

verso::Result<version::VersionVariables> VersionCalculator::compute() const
{
    std::optional<std::filesystem::path> missing_file;
    auto loaded = config::load_config(config::LoadOptions{.project_root = m_location.project_root,
                                                          .working_directory = m_options.working_directory,
                                                          .config_file = m_options.config_file},
                                      &missing_file);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    if (missing_file) {
        m_logger->info("Configuration file {} not found, using default configuration", missing_file->string());
    }

    auto branch = branch_for_resolution();
    if (!branch) {
        return std::unexpected(branch.error());
    }
    auto effective = config::resolve_effective_config(loaded->document, m_options.override_config, *branch);
    if (!effective) {
        return std::unexpected(effective.error());
    }
    m_logger->debug("Branch {} matched rules [{}]",
                    effective->branch_name,
                    fmt::join(effective->matched_rules, ", "));

    if (m_options.override_config) {
        m_logger->info("Override configuration supplied, bypassing cache");
        return compute_fresh(*effective);
    }
    if (m_options.no_cache || effective->no_cache) {
        m_logger->info("Cache disabled (NoCache), computing fresh version variables");
        return compute_fresh(*effective);
    }

    const bool no_normalize = m_options.no_normalize || effective->no_normalize;
    cache::CacheKeyFactory factory(*m_repository, m_options.repository_info, no_normalize);
    auto key = factory.create(*loaded);
    if (!key) {
        return std::unexpected(key.error());
    }

    cache::CacheStore store(cache_directory(), m_logger);
    auto lookup = store.lookup(*key, loaded->source_path);
    m_logger->debug("Cache lookup for {}: {}", key->value, cache::to_string(lookup.status));
    switch (lookup.status) {
        case cache::CacheStatus::kHit:
            m_logger->info("Deserializing version variables from cache file {}", lookup.path.string());
            return std::move(*lookup.variables);
        case cache::CacheStatus::kInvalidated:
            m_logger->info("Configuration changed since cache entry was written, computing fresh version variables");
            break;
        case cache::CacheStatus::kCorrupt:
            m_logger->warn("Ignoring unreadable cache file {}: {}", lookup.path.string(), lookup.detail);
            break;
        case cache::CacheStatus::kMiss:
            m_logger->info("Computing fresh version variables (no cache entry for {})", key->value);
            break;
    }

    auto variables = compute_fresh(*effective);
    if (!variables) {
        return variables;
    }
    if (auto stored = store.store(*key, *variables); !stored) {
        m_logger->warn("Failed to write cache entry: {}", stored.error().message);
    }
    variables->file_name = lookup.path.string();
    return variables;
}

verso::Result<version::VersionVariables> VersionCalculator::compute_fresh(const config::EffectiveConfig& config) const
{
    auto view = repository::make_repository_view(*m_repository);
    if (!view) {
        return std::unexpected(view.error());
    }
    auto source = version::locate_version_source(*view, config);
    if (!source) {
        return std::unexpected(source.error());
    }
    m_logger->debug("Version source: {} {} ({}) at {}",
                    version::to_string(source->kind),
                    source->base_version.to_string(),
                    source->description,
                    source->source_commit);

    auto increment = version::calculate_increment(*m_repository, *source, view->head, config);
    if (!increment) {
        return std::unexpected(increment.error());
    }
    m_logger->debug("{} commits since version source, increment {}",
                    increment->commits_since_source,
                    config::to_string(increment->applied));

    return version::assemble_variables(*increment, *source, *view, config);
}

verso::Result<version::VersionVariables> compute_version(const ComputeOptions& options)
{
    auto location = repository::locate_repository(options.working_directory);
    if (!location) {
        return std::unexpected(location.error());
    }
    auto git = std::make_shared<const repository::GitRepository>(*location, options.deadline);
    VersionCalculator calculator(options, *location, std::move(git));
    return calculator.compute();
}

}  // namespace verso::calculator
