#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON text used for cache keys and configuration hashes
 *
 * The canonical form is the compact dump of an nlohmann::json value (object
 * keys in byte order, no whitespace). Floating point values are rejected so
 * that the text never depends on number formatting.
 */

#include "verso/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace verso::canonical {

[[nodiscard]] verso::Result<std::string> canonicalize(const nlohmann::json& value);

/**
 * @return "sha256:<hex>" of canonicalize(@p value)
 */
[[nodiscard]] verso::Result<std::string> hash_canonical(const nlohmann::json& value);

}  // namespace verso::canonical
