/**
 * @file cache_store.cpp
 * @brief On-disk version variables cache
 */

#include "verso/cache.hpp"

#include "verso/log.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>
#include <utility>

namespace verso::cache {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] verso::Error write_error(std::string message)
{
    return Error::make(std::string(error_code::kCacheWriteError), std::move(message));
}

[[nodiscard]] std::string random_suffix()
{
    std::random_device device;
    std::uniform_int_distribution<std::uint32_t> distribution;
    return std::format("{:08x}", distribution(device));
}

[[nodiscard]] verso::Result<std::string> read_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(Error::make(std::string(error_code::kCacheReadError),
                                           "Failed to open file for read: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(Error::make(std::string(error_code::kCacheReadError),
                                           "Failed to read file: " + path.string()));
    }
    return content;
}

}  // namespace

std::string_view to_string(CacheStatus status) noexcept
{
    switch (status) {
        case CacheStatus::kHit:
            return "Hit";
        case CacheStatus::kMiss:
            return "Miss";
        case CacheStatus::kInvalidated:
            return "Invalidated";
        case CacheStatus::kCorrupt:
            return "Corrupt";
    }
    return "Unknown";
}

CacheStore::CacheStore(std::filesystem::path directory, std::shared_ptr<spdlog::logger> logger)
    : m_directory(std::move(directory))
    , m_logger(log::logger_or_default(std::move(logger)))
{}

std::filesystem::path CacheStore::path_for(const CacheKey& key) const
{
    return m_directory / (key.value + std::string(kEntryExtension));
}

CacheLookup CacheStore::lookup(const CacheKey& key, const std::optional<std::filesystem::path>& config_file) const
{
    CacheLookup result;
    result.path = path_for(key);

    std::error_code ec;
    if (!fs::is_regular_file(result.path, ec)) {
        result.status = CacheStatus::kMiss;
        return result;
    }

    if (config_file) {
        std::error_code config_ec;
        std::error_code dir_ec;
        const auto config_time = fs::last_write_time(*config_file, config_ec);
        const auto directory_time = fs::last_write_time(m_directory, dir_ec);
        if (!config_ec && !dir_ec && config_time > directory_time) {
            result.status = CacheStatus::kInvalidated;
            return result;
        }
    }

    auto content = read_file(result.path);
    if (!content) {
        result.status = CacheStatus::kCorrupt;
        result.detail = content.error().message;
        return result;
    }
    auto variables = version::parse_variables(*content);
    if (!variables) {
        result.status = CacheStatus::kCorrupt;
        result.detail = variables.error().message;
        return result;
    }

    variables->file_name = result.path.string();
    result.status = CacheStatus::kHit;
    result.variables = std::move(*variables);
    return result;
}

verso::VoidResult CacheStore::store(const CacheKey& key, const version::VersionVariables& variables) const
{
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        return std::unexpected(write_error(
            std::format("Failed to create cache directory {}: {}", m_directory.string(), ec.message())));
    }

    const fs::path target = path_for(key);
    const fs::path temp = m_directory / (target.filename().string() + ".tmp-" + random_suffix());
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(write_error("Failed to open file for write: " + temp.string()));
        }
        out << version::serialize_variables(variables, now);
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            return std::unexpected(write_error("Failed to write file: " + temp.string()));
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(temp, ec);
        return std::unexpected(
            write_error(std::format("Failed to move {} into place: {}", temp.string(), reason)));
    }
    m_logger->debug("Wrote cache entry {}", target.string());
    return {};
}

}  // namespace verso::cache
