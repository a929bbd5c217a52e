/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "verso/schema_validate.hpp"

#include <format>
#include <string>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace verso::common {

namespace {

/// valijson resolves "#/definitions/..." only; rewrite "$defs" references.
void normalize_schema_defs(nlohmann::json& schema)
{
    if (schema.is_object()) {
        if (schema.contains("$defs") && !schema.contains("definitions")) {
            schema["definitions"] = schema["$defs"];
        }
        for (auto& [key, value] : schema.items()) {
            if (key == "$ref" && value.is_string()) {
                constexpr std::string_view kPrefix = "#/$defs/";
                std::string ref = value.get<std::string>();
                if (ref.starts_with(kPrefix)) {
                    value = "#/definitions/" + ref.substr(kPrefix.size());
                }
                continue;
            }
            normalize_schema_defs(value);
        }
        return;
    }
    if (schema.is_array()) {
        for (auto& value : schema) {
            normalize_schema_defs(value);
        }
    }
}

[[nodiscard]] std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }
        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context, error.description);
    }
    return result;
}

}  // namespace

verso::VoidResult validate_json(const nlohmann::json& j, const nlohmann::json& schema)
{
    nlohmann::json schema_json = schema;
    normalize_schema_defs(schema_json);

    valijson::Schema parsed_schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(schema_json);
        parser.populateSchema(schema_adapter, parsed_schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);

    if (!validator.validate(parsed_schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }
    return {};
}

}  // namespace verso::common
