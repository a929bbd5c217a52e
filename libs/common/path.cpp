/**
 * @file path.cpp
 * @brief Path normalization for deterministic output
 *
 * Used for the path component of repository URLs so that equivalent
 * spellings of the same remote produce the same cache key.
 */

#include "verso/common.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <vector>

namespace verso::common {

namespace {

/// Leading "c:" (lower-cased) or "/" that survives segment folding.
struct PathRoot
{
    std::string prefix;
    bool absolute = false;
    std::size_t rest = 0;
};

[[nodiscard]] PathRoot split_root(std::string_view path)
{
    PathRoot root;
    if (path.size() >= 2 && path[1] == ':'
        && std::isalpha(static_cast<unsigned char>(path[0])) != 0) {
        root.prefix = std::string(1, static_cast<char>(std::tolower(path[0]))) + ":";
        root.absolute = true;
        root.rest = 2;
        return root;
    }
    if (!path.empty() && path.front() == '/') {
        root.absolute = true;
        root.rest = 1;
    }
    return root;
}

[[nodiscard]] std::vector<std::string> fold_segments(std::string_view path, bool absolute)
{
    std::vector<std::string> segments;
    for (auto part : path | std::views::split('/')) {
        std::string_view segment(part.begin(), part.end());
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.emplace_back("..");
            }
            continue;
        }
        segments.emplace_back(segment);
    }
    return segments;
}

}  // namespace

std::string normalize_path(std::string_view input)
{
    if (input.empty()) {
        return ".";
    }
    std::string path(input);
    std::ranges::replace(path, '\\', '/');

    const PathRoot root = split_root(path);
    const auto segments = fold_segments(std::string_view(path).substr(root.rest), root.absolute);

    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += segment;
    }

    if (!root.prefix.empty()) {
        return root.prefix + "/" + joined;
    }
    if (root.absolute) {
        return "/" + joined;
    }
    return joined.empty() ? "." : joined;
}

std::string trim(std::string_view input)
{
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

std::string to_lower(std::string_view input)
{
    std::string lowered(input);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

}  // namespace verso::common
