#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "verso/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace verso::common {

/**
 * Validate a JSON document against an in-memory JSON Schema.
 *
 * @param j JSON document to validate
 * @param schema JSON Schema document (draft 7, "$defs" accepted)
 * @return Empty on success, SchemaValidationFailed with one line per violation
 */
[[nodiscard]] verso::VoidResult validate_json(const nlohmann::json& j,
                                              const nlohmann::json& schema);

}  // namespace verso::common
