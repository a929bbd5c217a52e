/**
 * @file yaml_document.cpp
 * @brief YAML to JSON conversion for configuration documents
 */

#include "config_internal.hpp"

#include <charconv>
#include <cstdint>
#include <format>
#include <system_error>

namespace verso::config::detail {

namespace {

constexpr std::size_t kMaxDepth = 32;

[[nodiscard]] bool is_integer_literal(std::string_view value)
{
    std::size_t start = (!value.empty() && value.front() == '-') ? 1 : 0;
    if (start == value.size()) {
        return false;
    }
    for (char c : value.substr(start)) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

[[nodiscard]] verso::Result<nlohmann::json>
node_to_json(const YAML::Node& node, std::string_view source, std::size_t depth)
{
    if (depth > kMaxDepth) {
        return std::unexpected(
            config_error(std::format("{}: maximum nesting depth exceeded", source)));
    }

    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nlohmann::json(nullptr);

        case YAML::NodeType::Scalar: {
            // Quoted scalars carry the non-specific tag "!" and are never retyped.
            if (node.Tag() == "!") {
                return nlohmann::json(node.Scalar());
            }
            return plain_scalar_to_json(node.Scalar());
        }

        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                auto converted = node_to_json(item, source, depth + 1);
                if (!converted) {
                    return converted;
                }
                array.push_back(std::move(*converted));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& entry : node) {
                if (!entry.first.IsScalar()) {
                    return std::unexpected(
                        config_error(std::format("{}: mapping keys must be scalars", source)));
                }
                auto converted = node_to_json(entry.second, source, depth + 1);
                if (!converted) {
                    return converted;
                }
                if (converted->is_null()) {
                    continue;
                }
                object[entry.first.Scalar()] = std::move(*converted);
            }
            return object;
        }
    }
    return nlohmann::json(nullptr);
}

}  // namespace

verso::Error config_error(std::string message)
{
    return Error::make(std::string(error_code::kConfigError), std::move(message));
}

nlohmann::json plain_scalar_to_json(std::string_view value)
{
    if (value == "true" || value == "True" || value == "TRUE") {
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE") {
        return false;
    }
    if (is_integer_literal(value)) {
        std::int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec == std::errc{} && ptr == value.data() + value.size()) {
            return parsed;
        }
    }
    return std::string(value);
}

verso::Result<nlohmann::json> yaml_to_config_json(const YAML::Node& root, std::string_view source)
{
    if (!root || root.IsNull()) {
        return nlohmann::json::object();
    }
    if (!root.IsMap()) {
        return std::unexpected(
            config_error(std::format("{}: configuration must be a mapping", source)));
    }

    nlohmann::json document = nlohmann::json::object();
    for (const auto& entry : root) {
        const std::string key = entry.first.as<std::string>();
        if (key != "branches") {
            auto converted = node_to_json(entry.second, source, 1);
            if (!converted) {
                return converted;
            }
            if (!converted->is_null()) {
                document[key] = std::move(*converted);
            }
            continue;
        }

        if (entry.second.IsNull()) {
            continue;
        }
        if (!entry.second.IsMap()) {
            return std::unexpected(
                config_error(std::format("{}: 'branches' must map rule names to settings", source)));
        }
        nlohmann::json rules = nlohmann::json::array();
        for (const auto& rule : entry.second) {
            auto settings = node_to_json(rule.second, source, 2);
            if (!settings) {
                return settings;
            }
            nlohmann::json rule_json = settings->is_null() ? nlohmann::json::object() : *settings;
            if (!rule_json.is_object()) {
                return std::unexpected(config_error(std::format(
                    "{}: branch rule '{}' must be a mapping", source, rule.first.as<std::string>())));
            }
            rule_json["name"] = rule.first.as<std::string>();
            rules.push_back(std::move(rule_json));
        }
        document["branches"] = std::move(rules);
    }
    return document;
}

}  // namespace verso::config::detail
