/**
 * @file config_schema.cpp
 * @brief Embedded JSON Schema for verso.yml
 */

#include "config_internal.hpp"

namespace verso::config::detail {

namespace {

constexpr std::string_view kConfigSchema = R"json({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "title": "verso configuration",
  "type": "object",
  "$defs": {
    "increment": { "enum": ["Major", "Minor", "Patch", "None", "Inherit"] },
    "mode": { "enum": ["ContinuousDelivery", "ContinuousDeployment"] },
    "scheme": { "enum": ["MajorMinorPatchTag", "MajorMinorPatch", "MajorMinor", "Major", "None"] },
    "padding": { "type": "integer", "minimum": 0, "maximum": 20 }
  },
  "properties": {
    "next-version": { "type": ["string", "integer"] },
    "no-cache": { "type": "boolean" },
    "no-normalize": { "type": "boolean" },
    "tag-prefix": { "type": "string" },
    "increment": { "$ref": "#/$defs/increment" },
    "tag": { "type": "string" },
    "mode": { "$ref": "#/$defs/mode" },
    "commit-message-bump-pattern": { "type": "string" },
    "continuous-delivery-fallback-tag": { "type": "string" },
    "prevent-increment-of-merged-branch-version": { "type": "boolean" },
    "is-release-branch": { "type": "boolean" },
    "legacy-semver-padding": { "$ref": "#/$defs/padding" },
    "commits-since-version-source-padding": { "$ref": "#/$defs/padding" },
    "assembly-versioning-scheme": { "$ref": "#/$defs/scheme" },
    "assembly-file-versioning-scheme": { "$ref": "#/$defs/scheme" },
    "commit-date-format": { "type": "string" },
    "pre-release-weight": { "type": "integer", "minimum": 0 },
    "branches": {
      "type": "array",
      "items": {
        "type": "object",
        "required": ["name"],
        "properties": {
          "name": { "type": "string", "minLength": 1 },
          "regex": { "type": "string" },
          "tag-prefix": { "type": "string" },
          "increment": { "$ref": "#/$defs/increment" },
          "tag": { "type": "string" },
          "mode": { "$ref": "#/$defs/mode" },
          "commit-message-bump-pattern": { "type": "string" },
          "continuous-delivery-fallback-tag": { "type": "string" },
          "prevent-increment-of-merged-branch-version": { "type": "boolean" },
          "is-release-branch": { "type": "boolean" },
          "legacy-semver-padding": { "$ref": "#/$defs/padding" },
          "commits-since-version-source-padding": { "$ref": "#/$defs/padding" },
          "assembly-versioning-scheme": { "$ref": "#/$defs/scheme" },
          "assembly-file-versioning-scheme": { "$ref": "#/$defs/scheme" },
          "commit-date-format": { "type": "string" },
          "pre-release-weight": { "type": "integer", "minimum": 0 }
        },
        "additionalProperties": false
      }
    }
  },
  "additionalProperties": false
})json";

}  // namespace

const nlohmann::json& config_schema()
{
    static const nlohmann::json schema = nlohmann::json::parse(kConfigSchema);
    return schema;
}

}  // namespace verso::config::detail
