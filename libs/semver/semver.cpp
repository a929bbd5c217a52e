/**
 * @file semver.cpp
 * @brief Semantic version parsing, formatting and ordering
 */

#include "verso/semver.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <system_error>

namespace verso {

namespace {

[[nodiscard]] std::optional<std::uint64_t> parse_number(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] bool is_identifier(std::string_view text)
{
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

[[nodiscard]] verso::Error invalid_version(std::string_view text, std::string_view reason)
{
    return Error::make(std::string(error_code::kInvalidVersion),
                       std::format("Invalid version '{}': {}", text, reason));
}

/// Split "beta.4" / "beta4" / "beta" into label and trailing number.
void assign_pre_release(SemVer& version, std::string_view pre)
{
    std::size_t digits_start = pre.size();
    while (digits_start > 0 && std::isdigit(static_cast<unsigned char>(pre[digits_start - 1])) != 0) {
        --digits_start;
    }
    std::string_view label = pre.substr(0, digits_start);
    std::string_view number = pre.substr(digits_start);
    if (label.ends_with('.')) {
        label.remove_suffix(1);
    }
    version.pre_release_label = std::string(label);
    if (auto parsed = parse_number(number)) {
        version.pre_release_number = *parsed;
    }
}

}  // namespace

std::string SemVer::pre_release_tag() const
{
    if (!pre_release_label) {
        return {};
    }
    if (!pre_release_number) {
        return *pre_release_label;
    }
    if (pre_release_label->empty()) {
        return std::to_string(*pre_release_number);
    }
    return std::format("{}.{}", *pre_release_label, *pre_release_number);
}

std::string SemVer::major_minor_patch() const
{
    return std::format("{}.{}.{}", major, minor, patch);
}

std::string SemVer::to_string() const
{
    if (!has_pre_release()) {
        return major_minor_patch();
    }
    return major_minor_patch() + "-" + pre_release_tag();
}

std::strong_ordering SemVer::operator<=>(const SemVer& other) const
{
    if (auto cmp = major <=> other.major; cmp != 0) {
        return cmp;
    }
    if (auto cmp = minor <=> other.minor; cmp != 0) {
        return cmp;
    }
    if (auto cmp = patch <=> other.patch; cmp != 0) {
        return cmp;
    }
    if (has_pre_release() != other.has_pre_release()) {
        return has_pre_release() ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    if (!has_pre_release()) {
        return std::strong_ordering::equal;
    }
    if (auto cmp = *pre_release_label <=> *other.pre_release_label; cmp != 0) {
        return cmp;
    }
    return pre_release_number <=> other.pre_release_number;
}

bool SemVer::operator==(const SemVer& other) const
{
    return (*this <=> other) == std::strong_ordering::equal;
}

verso::Result<SemVer> parse_semver(std::string_view text)
{
    std::string_view rest = text;
    SemVer version;

    if (auto plus = rest.find('+'); plus != std::string_view::npos) {
        std::string_view build = rest.substr(plus + 1);
        if (!is_identifier(build)) {
            return std::unexpected(invalid_version(text, "malformed build metadata"));
        }
        version.build_metadata = std::string(build);
        rest = rest.substr(0, plus);
    }

    if (auto dash = rest.find('-'); dash != std::string_view::npos) {
        std::string_view pre = rest.substr(dash + 1);
        if (!is_identifier(pre)) {
            return std::unexpected(invalid_version(text, "malformed pre-release"));
        }
        assign_pre_release(version, pre);
        rest = rest.substr(0, dash);
    }

    std::uint64_t* components[] = {&version.major, &version.minor, &version.patch};
    std::size_t index = 0;
    while (true) {
        if (index == 3) {
            return std::unexpected(invalid_version(text, "too many numeric components"));
        }
        const auto dot = rest.find('.');
        auto parsed = parse_number(rest.substr(0, dot));
        if (!parsed) {
            return std::unexpected(invalid_version(text, "expected a number"));
        }
        *components[index++] = *parsed;
        if (dot == std::string_view::npos) {
            break;
        }
        rest = rest.substr(dot + 1);
    }
    return version;
}

}  // namespace verso
