#pragma once

/**
 * @file config_internal.hpp
 * @brief Helpers shared by the config translation units
 */

#include "verso/config.hpp"

#include <string_view>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace verso::config::detail {

/// JSON Schema of the normalized configuration document.
[[nodiscard]] const nlohmann::json& config_schema();

/**
 * Convert a parsed YAML document to its normalized JSON form.
 *
 * - Null values are dropped (an absent setting, never an empty one)
 * - Plain scalars "true"/"false" become booleans, integer literals integers
 * - Quoted scalars always stay strings
 * - The top-level "branches" mapping becomes an array of objects carrying a
 *   "name" member, in declaration order
 */
[[nodiscard]] verso::Result<nlohmann::json> yaml_to_config_json(const YAML::Node& root,
                                                                std::string_view source);

/// Same scalar typing rules as yaml_to_config_json, for "key=value" overrides.
[[nodiscard]] nlohmann::json plain_scalar_to_json(std::string_view value);

/// Build the typed document from schema-valid JSON.
[[nodiscard]] verso::Result<ConfigDocument> document_from_json(const nlohmann::json& j,
                                                               std::string_view source);

[[nodiscard]] verso::Error config_error(std::string message);

}  // namespace verso::config::detail
