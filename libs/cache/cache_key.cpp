/**
 * @file cache_key.cpp
 * @brief Cache key derivation from repository and configuration state
 */

#include "verso/cache.hpp"

#include "verso/canonical_json.hpp"
#include "verso/version.hpp"

#include <utility>

namespace verso::cache {

namespace {

constexpr std::string_view kSchemeSeparator = "://";
constexpr std::string_view kGitSuffix = ".git";

[[nodiscard]] std::string strip_repository_suffix(std::string path)
{
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    if (path.ends_with(kGitSuffix)) {
        path.erase(path.size() - kGitSuffix.size());
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

std::string normalize_target_url(std::string_view url)
{
    const std::string trimmed = common::trim(url);
    std::string_view text = trimmed;

    std::string prefix;
    if (auto scheme_end = text.find(kSchemeSeparator); scheme_end != std::string_view::npos) {
        const auto authority_start = scheme_end + kSchemeSeparator.size();
        auto path_start = text.find('/', authority_start);
        if (path_start == std::string_view::npos) {
            path_start = text.size();
        }
        prefix = common::to_lower(text.substr(0, path_start));
        text.remove_prefix(path_start);
    } else if (auto colon = text.find(':'); colon != std::string_view::npos && text.find('/') > colon) {
        // scp-like "user@host:path"
        prefix = common::to_lower(text.substr(0, colon + 1));
        text.remove_prefix(colon + 1);
    }

    std::string path = text.empty() ? std::string() : common::normalize_path(text);
    return strip_repository_suffix(prefix + path);
}

CacheKeyFactory::CacheKeyFactory(const repository::RepositoryInspector& repository,
                                 RepositoryInfo repository_info,
                                 bool no_normalize)
    : m_repository(repository)
    , m_repository_info(std::move(repository_info))
    , m_no_normalize(no_normalize)
{}

verso::Result<nlohmann::json> CacheKeyFactory::fingerprint(const config::LoadedConfig& loaded) const
{
    auto branch = m_repository.current_branch();
    if (!branch) {
        return std::unexpected(branch.error());
    }
    auto head = m_repository.current_commit();
    if (!head) {
        return std::unexpected(head.error());
    }
    auto dirty = m_repository.is_dirty();
    if (!dirty) {
        return std::unexpected(dirty.error());
    }
    auto config_hash = canonical::hash_canonical(loaded.raw);
    if (!config_hash) {
        return std::unexpected(config_hash.error());
    }

    nlohmann::json target_url = nullptr;
    if (m_repository_info.target_url) {
        target_url = normalize_target_url(*m_repository_info.target_url);
    }
    nlohmann::json target_branch = nullptr;
    if (m_repository_info.target_branch) {
        target_branch = m_no_normalize ? *m_repository_info.target_branch
                                       : config::normalize_branch_name(*m_repository_info.target_branch);
    }

    return nlohmann::json{
        {      "tool",                   kVersion},
        {    "format",        kCacheFormatVersion},
        {"target_url",                 target_url},
        {"target_branch",           target_branch},
        {    "branch",                    *branch},
        {      "head",                      *head},
        {     "dirty",                     *dirty},
        {    "config",               *config_hash},
    };
}

verso::Result<CacheKey> CacheKeyFactory::create(const config::LoadedConfig& loaded) const
{
    auto print = fingerprint(loaded);
    if (!print) {
        return std::unexpected(print.error());
    }
    auto canonical = canonical::canonicalize(*print);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return CacheKey{.value = common::sha256(*canonical)};
}

}  // namespace verso::cache
