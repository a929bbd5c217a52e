#pragma once

/**
 * @file version.hpp
 * @brief verso tool version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace verso {

/// verso version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Cache entry format version; bumped whenever the cache text layout changes
constexpr const char* kCacheFormatVersion = "cache.v1";

}  // namespace verso
