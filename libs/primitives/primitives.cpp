/**
 * @file primitives.cpp
 * @brief Term, tag, platform, digest, email, URI and timestamp grammars
 */

#include "pgxnmeta/primitives.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <ranges>
#include <string>
#include <vector>

namespace pgxnmeta::primitive {

namespace {

constexpr std::array<std::string_view, 18> kOperatingSystems = {
    "aix",     "android", "any",     "darwin",  "dragonfly", "freebsd",
    "gnulinux", "illumos", "ios",    "js",      "linux",     "musllinux",
    "netbsd",  "openbsd", "plan9",   "solaris", "wasip1",    "windows",
};

constexpr std::array<std::string_view, 15> kArchitectures = {
    "386",  "amd64",    "arm",   "arm64",   "loong64", "mips",  "mips64", "mips64le",
    "mipsle", "ppc64",  "ppc64le", "riscv64", "s390x", "sparc64", "wasm",
};

[[nodiscard]] pgxnmeta::Error invalid(std::string_view kind,
                                      std::string_view value,
                                      std::string_view reason)
{
    return pgxnmeta::Error::make(errc::kSemanticViolation,
                                 std::format("'{}' is not a valid {}: {}", value, kind, reason));
}

[[nodiscard]] bool is_control(unsigned char c) noexcept
{
    return c < 0x20 || c == 0x7f;
}

template <std::size_t N>
[[nodiscard]] bool contains(const std::array<std::string_view, N>& list, std::string_view value)
{
    return std::ranges::find(list, value) != list.end();
}

[[nodiscard]] bool is_hex(std::string_view s) noexcept
{
    return std::ranges::all_of(s, [](unsigned char c) { return std::isxdigit(c) != 0; });
}

[[nodiscard]] bool parse_fixed(std::string_view s, int& out) noexcept
{
    if (s.empty() || !std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

[[nodiscard]] int days_in_month(int year, int month) noexcept
{
    constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        return 29;
    }
    return kDays[static_cast<std::size_t>(month - 1)];
}

}  // namespace

pgxnmeta::VoidResult validate_term(std::string_view value)
{
    if (value.size() < 2) {
        return std::unexpected(invalid("term", value, "must be at least two characters"));
    }
    for (unsigned char c : value) {
        if (c == '/' || c == '\\' || c == ' ' || is_control(c)) {
            return std::unexpected(
                invalid("term", value, "contains a slash, backslash, space or control character"));
        }
    }
    return {};
}

pgxnmeta::VoidResult validate_tag(std::string_view value)
{
    if (value.size() < 2 || value.size() > 255) {
        return std::unexpected(invalid("tag", value, "must be 2 to 255 characters"));
    }
    for (unsigned char c : value) {
        if (c == '/' || c == '\\' || is_control(c)) {
            return std::unexpected(
                invalid("tag", value, "contains a slash, backslash or control character"));
        }
    }
    return {};
}

pgxnmeta::VoidResult validate_platform(std::string_view value)
{
    std::vector<std::string_view> parts;
    for (auto part : value | std::views::split('-')) {
        parts.emplace_back(part.begin(), part.end());
    }
    if (parts.empty() || !contains(kOperatingSystems, parts.front())) {
        return std::unexpected(invalid("platform", value, "unknown operating system"));
    }
    if (parts.front() == "any") {
        if (parts.size() != 1) {
            return std::unexpected(invalid("platform", value, "'any' takes no qualifiers"));
        }
        return {};
    }
    if (parts.size() > 3) {
        return std::unexpected(invalid("platform", value, "too many components"));
    }

    std::size_t next = 1;
    if (next < parts.size() && !contains(kArchitectures, parts[next])) {
        const auto version = parts[next];
        const bool numeric = !version.empty() && std::isdigit(static_cast<unsigned char>(version.front())) != 0
                             && std::ranges::all_of(version, [](unsigned char c) {
                                    return std::isdigit(c) != 0 || c == '.';
                                })
                             && !version.ends_with('.') && version.find("..") == std::string_view::npos;
        if (!numeric) {
            return std::unexpected(invalid("platform", value, "invalid OS version"));
        }
        ++next;
    }
    if (next < parts.size()) {
        if (!contains(kArchitectures, parts[next])) {
            return std::unexpected(invalid("platform", value, "unknown architecture"));
        }
        ++next;
    }
    if (next != parts.size()) {
        return std::unexpected(invalid("platform", value, "unexpected trailing component"));
    }
    return {};
}

std::size_t digest_hex_length(std::string_view algorithm) noexcept
{
    if (algorithm == "sha1") {
        return 40;
    }
    if (algorithm == "sha256") {
        return 64;
    }
    if (algorithm == "sha512") {
        return 128;
    }
    return 0;
}

pgxnmeta::VoidResult validate_digest_hex(std::string_view algorithm, std::string_view hex)
{
    const std::size_t expected = digest_hex_length(algorithm);
    if (expected == 0) {
        return std::unexpected(pgxnmeta::Error::make(
            errc::kSemanticViolation, std::format("unknown digest algorithm '{}'", algorithm)));
    }
    if (hex.size() != expected || !is_hex(hex)) {
        return std::unexpected(pgxnmeta::Error::make(
            errc::kSemanticViolation,
            std::format("{} digest must be {} hex characters", algorithm, expected)));
    }
    return {};
}

pgxnmeta::VoidResult validate_email(std::string_view value)
{
    const auto at = value.find('@');
    if (at == std::string_view::npos || at == 0 || at + 1 == value.size()
        || value.find('@', at + 1) != std::string_view::npos) {
        return std::unexpected(invalid("email address", value, "expected local@domain"));
    }
    for (unsigned char c : value) {
        if (std::isspace(c) != 0 || is_control(c)) {
            return std::unexpected(invalid("email address", value, "contains whitespace"));
        }
    }
    const auto domain = value.substr(at + 1);
    if (domain.starts_with('.') || domain.ends_with('.')
        || domain.find("..") != std::string_view::npos) {
        return std::unexpected(invalid("email address", value, "malformed domain"));
    }
    return {};
}

pgxnmeta::VoidResult validate_uri(std::string_view value)
{
    const auto colon = value.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == value.size()) {
        return std::unexpected(invalid("URI", value, "expected scheme:rest"));
    }
    const auto scheme = value.substr(0, colon);
    if (std::isalpha(static_cast<unsigned char>(scheme.front())) == 0
        || !std::ranges::all_of(scheme, [](unsigned char c) {
               return std::isalnum(c) != 0 || c == '+' || c == '.' || c == '-';
           })) {
        return std::unexpected(invalid("URI", value, "invalid scheme"));
    }
    for (unsigned char c : value) {
        if (std::isspace(c) != 0 || is_control(c)) {
            return std::unexpected(invalid("URI", value, "contains whitespace"));
        }
    }
    return {};
}

pgxnmeta::VoidResult validate_timestamp(std::string_view value)
{
    // YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)
    if (value.size() < 20 || value[4] != '-' || value[7] != '-'
        || (value[10] != 'T' && value[10] != 't') || value[13] != ':' || value[16] != ':') {
        return std::unexpected(invalid("timestamp", value, "expected RFC 3339 date-time"));
    }
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parse_fixed(value.substr(0, 4), year) || !parse_fixed(value.substr(5, 2), month)
        || !parse_fixed(value.substr(8, 2), day) || !parse_fixed(value.substr(11, 2), hour)
        || !parse_fixed(value.substr(14, 2), minute) || !parse_fixed(value.substr(17, 2), second)) {
        return std::unexpected(invalid("timestamp", value, "non-numeric field"));
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23
        || minute > 59 || second > 60) {
        return std::unexpected(invalid("timestamp", value, "field out of range"));
    }

    std::string_view rest = value.substr(19);
    if (rest.starts_with('.')) {
        std::size_t digits = 1;
        while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits])) != 0) {
            ++digits;
        }
        if (digits == 1) {
            return std::unexpected(invalid("timestamp", value, "empty fraction"));
        }
        rest.remove_prefix(digits);
    }
    if (rest == "Z" || rest == "z") {
        return {};
    }
    int offset_hour = 0;
    int offset_minute = 0;
    if (rest.size() == 6 && (rest[0] == '+' || rest[0] == '-') && rest[3] == ':'
        && parse_fixed(rest.substr(1, 2), offset_hour) && parse_fixed(rest.substr(4, 2), offset_minute)
        && offset_hour <= 23 && offset_minute <= 59) {
        return {};
    }
    return std::unexpected(invalid("timestamp", value, "invalid time zone offset"));
}

}  // namespace pgxnmeta::primitive
