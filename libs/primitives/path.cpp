/**
 * @file path.cpp
 * @brief Path and glob safety rules
 *
 * Paths in META.json are relative to the distribution root and must never
 * reach outside it.
 */

#include "pgxnmeta/primitives.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <string>
#include <vector>

namespace pgxnmeta::primitive {

namespace {

constexpr std::string_view kWildcards = "*?[]{}";

[[nodiscard]] pgxnmeta::Error path_error(std::string_view kind,
                                         std::string_view value,
                                         std::string_view reason)
{
    return pgxnmeta::Error::make(errc::kSemanticViolation,
                                 std::format("'{}' is not a valid {}: {}", value, kind, reason));
}

/**
 * @brief Split a path string on '/' keeping empty segments
 */
[[nodiscard]] std::vector<std::string_view> split_path(std::string_view path)
{
    std::vector<std::string_view> parts;
    for (auto part : path | std::views::split('/')) {
        parts.emplace_back(part.begin(), part.end());
    }
    return parts;
}

[[nodiscard]] bool has_control(std::string_view value) noexcept
{
    return std::ranges::any_of(value, [](unsigned char c) { return c < 0x20 || c == 0x7f; });
}

[[nodiscard]] bool is_wildcard_segment(std::string_view segment) noexcept
{
    return segment.find_first_of(kWildcards) != std::string_view::npos;
}

/**
 * @brief Shared segment rules for paths and globs
 */
[[nodiscard]] pgxnmeta::VoidResult check_segments(std::string_view kind,
                                                  std::string_view value,
                                                  std::string_view relative,
                                                  bool allow_wildcards)
{
    const auto segments = split_path(relative);
    for (auto [i, segment] : std::views::enumerate(segments)) {
        const auto index = static_cast<std::size_t>(i);
        const bool last = index + 1 == segments.size();
        if (segment.empty()) {
            // Only a trailing slash may leave an empty segment.
            if (last && index > 0) {
                continue;
            }
            return std::unexpected(path_error(kind, value, "empty path segment"));
        }
        if (allow_wildcards && is_wildcard_segment(segment)) {
            continue;
        }
        if (segment == "..") {
            return std::unexpected(path_error(kind, value, "references parent dir"));
        }
        if (segment == "." && index != 0) {
            return std::unexpected(path_error(kind, value, "current dir segment after the first"));
        }
    }
    return {};
}

[[nodiscard]] pgxnmeta::VoidResult check_characters(std::string_view kind, std::string_view value)
{
    if (value.empty()) {
        return std::unexpected(path_error(kind, value, "empty string"));
    }
    if (value.find('\\') != std::string_view::npos) {
        return std::unexpected(path_error(kind, value, "backslash separator"));
    }
    if (has_control(value)) {
        return std::unexpected(path_error(kind, value, "control character"));
    }
    return {};
}

}  // namespace

pgxnmeta::VoidResult validate_path(std::string_view value)
{
    constexpr std::string_view kKind = "path";
    if (auto chars = check_characters(kKind, value); !chars) {
        return chars;
    }
    if (value.front() == '/') {
        return std::unexpected(path_error(kKind, value, "absolute path"));
    }
    return check_segments(kKind, value, value, false);
}

pgxnmeta::VoidResult validate_glob(std::string_view value)
{
    constexpr std::string_view kKind = "glob";
    if (auto chars = check_characters(kKind, value); !chars) {
        return chars;
    }
    std::string_view relative = value;
    if (relative.front() == '/') {
        relative.remove_prefix(1);
        if (relative.empty()) {
            return std::unexpected(path_error(kKind, value, "matches the distribution root"));
        }
    }
    return check_segments(kKind, value, relative, true);
}

}  // namespace pgxnmeta::primitive
