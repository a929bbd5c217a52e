/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "verso/canonical_json.hpp"

#include <format>
#include <optional>
#include <string>
#include <utility>

namespace verso::canonical {

namespace {

[[nodiscard]] verso::Error encoding_error(std::string message)
{
    return Error::make(std::string(error_code::kInvalidEncoding), std::move(message));
}

/// First floating point value in @p value, as a JSON path.
[[nodiscard]] std::optional<std::string> find_float(const nlohmann::json& value, const std::string& path)
{
    if (value.is_number_float()) {
        return path;
    }
    if (value.is_object()) {
        for (const auto& [key, member] : value.items()) {
            if (auto found = find_float(member, path + "." + key)) {
                return found;
            }
        }
    } else if (value.is_array()) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (auto found = find_float(value[i], std::format("{}[{}]", path, i))) {
                return found;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

verso::Result<std::string> canonicalize(const nlohmann::json& value)
{
    if (auto path = find_float(value, "$")) {
        return std::unexpected(
            encoding_error(std::format("Floating point value not allowed in canonical JSON at {}", *path)));
    }
    // nlohmann::json keeps object members in a std::map, so dump() is already key-ordered.
    try {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(encoding_error(std::string("Canonical JSON dump failed: ") + ex.what()));
    }
}

verso::Result<std::string> hash_canonical(const nlohmann::json& value)
{
    auto text = canonicalize(value);
    if (!text) {
        return std::unexpected(text.error());
    }
    return common::sha256_prefixed(*text);
}

}  // namespace verso::canonical
