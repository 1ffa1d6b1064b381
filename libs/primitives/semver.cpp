/**
 * @file semver.cpp
 * @brief Semantic version parsing, precedence and range evaluation
 */

#include "pgxnmeta/semver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <ranges>
#include <utility>

namespace pgxnmeta::semver {

namespace {

[[nodiscard]] pgxnmeta::Error version_error(std::string_view text, std::string_view reason)
{
    return pgxnmeta::Error::make(errc::kSemanticViolation,
                                 std::format("'{}' is not a valid version: {}", text, reason));
}

[[nodiscard]] std::string_view trim(std::string_view input) noexcept
{
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front())) != 0) {
        input.remove_prefix(1);
    }
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back())) != 0) {
        input.remove_suffix(1);
    }
    return input;
}

[[nodiscard]] bool is_digits(std::string_view s) noexcept
{
    return !s.empty()
           && std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c) != 0; });
}

[[nodiscard]] bool is_identifier(std::string_view s) noexcept
{
    return !s.empty() && std::ranges::all_of(s, [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-';
    });
}

[[nodiscard]] std::vector<std::string> split(std::string_view s, char sep)
{
    std::vector<std::string> parts;
    for (auto part : s | std::views::split(sep)) {
        parts.emplace_back(part.begin(), part.end());
    }
    return parts;
}

[[nodiscard]] bool parse_number(std::string_view s, std::uint64_t& out) noexcept
{
    if (!is_digits(s) || (s.size() > 1 && s.front() == '0')) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

struct Parts
{
    std::string_view core;
    std::string_view pre;
    std::string_view build;
    bool has_pre = false;
    bool has_build = false;
};

[[nodiscard]] Parts split_parts(std::string_view text) noexcept
{
    Parts parts;
    std::string_view rest = text;
    if (auto plus = rest.find('+'); plus != std::string_view::npos) {
        parts.build = rest.substr(plus + 1);
        parts.has_build = true;
        rest = rest.substr(0, plus);
    }
    if (auto dash = rest.find('-'); dash != std::string_view::npos) {
        parts.pre = rest.substr(dash + 1);
        parts.has_pre = true;
        rest = rest.substr(0, dash);
    }
    parts.core = rest;
    return parts;
}

[[nodiscard]] int compare_identifiers(const std::string& lhs, const std::string& rhs) noexcept
{
    const bool lhs_numeric = is_digits(lhs);
    const bool rhs_numeric = is_digits(rhs);
    if (lhs_numeric && rhs_numeric) {
        // No leading zeros, so length orders first.
        if (lhs.size() != rhs.size()) {
            return lhs.size() < rhs.size() ? -1 : 1;
        }
        return lhs.compare(rhs) < 0 ? -1 : (lhs == rhs ? 0 : 1);
    }
    if (lhs_numeric != rhs_numeric) {
        return lhs_numeric ? -1 : 1;
    }
    const int cmp = lhs.compare(rhs);
    return cmp < 0 ? -1 : (cmp == 0 ? 0 : 1);
}

}  // namespace

pgxnmeta::Result<Version> Version::parse(std::string_view text)
{
    auto version = parse_lenient(text);
    if (!version) {
        return version;
    }
    const auto core = split_parts(text).core;
    if (std::ranges::count(core, '.') != 2) {
        return std::unexpected(version_error(text, "expected MAJOR.MINOR.PATCH"));
    }
    return version;
}

pgxnmeta::Result<Version> Version::parse_lenient(std::string_view text)
{
    if (text.empty()) {
        return std::unexpected(version_error(text, "empty string"));
    }
    const Parts parts = split_parts(text);
    if ((parts.has_pre && parts.pre.empty()) || (parts.has_build && parts.build.empty())) {
        return std::unexpected(version_error(text, "empty pre-release or build metadata"));
    }

    const auto numbers = split(parts.core, '.');
    if (numbers.empty() || numbers.size() > 3) {
        return std::unexpected(version_error(text, "expected MAJOR.MINOR.PATCH"));
    }
    std::array<std::uint64_t, 3> core{};
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (!parse_number(numbers[i], core[i])) {
            return std::unexpected(
                version_error(text, std::format("invalid numeric component '{}'", numbers[i])));
        }
    }

    Version version(core[0], core[1], core[2]);
    if (parts.has_pre) {
        for (auto& ident : split(parts.pre, '.')) {
            if (!is_identifier(ident)) {
                return std::unexpected(version_error(text, "invalid pre-release identifier"));
            }
            if (is_digits(ident) && ident.size() > 1 && ident.front() == '0') {
                return std::unexpected(
                    version_error(text, "numeric pre-release identifier has a leading zero"));
            }
            version.m_pre.push_back(std::move(ident));
        }
    }
    if (parts.has_build) {
        for (auto& ident : split(parts.build, '.')) {
            if (!is_identifier(ident)) {
                return std::unexpected(version_error(text, "invalid build metadata"));
            }
            version.m_build.push_back(std::move(ident));
        }
    }
    return version;
}

int Version::compare(const Version& other) const noexcept
{
    for (auto [lhs, rhs] : {std::pair{m_major, other.m_major},
                            std::pair{m_minor, other.m_minor},
                            std::pair{m_patch, other.m_patch}}) {
        if (lhs != rhs) {
            return lhs < rhs ? -1 : 1;
        }
    }
    // A pre-release sorts before its release.
    if (m_pre.empty() || other.m_pre.empty()) {
        if (m_pre.empty() == other.m_pre.empty()) {
            return 0;
        }
        return m_pre.empty() ? 1 : -1;
    }
    const std::size_t common = std::min(m_pre.size(), other.m_pre.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (const int cmp = compare_identifiers(m_pre[i], other.m_pre[i]); cmp != 0) {
            return cmp;
        }
    }
    if (m_pre.size() == other.m_pre.size()) {
        return 0;
    }
    return m_pre.size() < other.m_pre.size() ? -1 : 1;
}

std::string Version::to_string() const
{
    std::string out = std::format("{}.{}.{}", m_major, m_minor, m_patch);
    auto join = [](const std::vector<std::string>& idents) {
        std::string joined;
        for (const auto& ident : idents) {
            if (!joined.empty()) {
                joined += '.';
            }
            joined += ident;
        }
        return joined;
    };
    if (!m_pre.empty()) {
        out += "-" + join(m_pre);
    }
    if (!m_build.empty()) {
        out += "+" + join(m_build);
    }
    return out;
}

std::string_view comparator_symbol(Comparator op) noexcept
{
    switch (op) {
    case Comparator::kLess:
        return "<";
    case Comparator::kLessEqual:
        return "<=";
    case Comparator::kGreater:
        return ">";
    case Comparator::kGreaterEqual:
        return ">=";
    case Comparator::kEqual:
        return "==";
    case Comparator::kNotEqual:
        return "!=";
    }
    return ">=";
}

bool Constraint::satisfied_by(const Version& candidate) const noexcept
{
    const int cmp = candidate.compare(version);
    switch (op) {
    case Comparator::kLess:
        return cmp < 0;
    case Comparator::kLessEqual:
        return cmp <= 0;
    case Comparator::kGreater:
        return cmp > 0;
    case Comparator::kGreaterEqual:
        return cmp >= 0;
    case Comparator::kEqual:
        return cmp == 0;
    case Comparator::kNotEqual:
        return cmp != 0;
    }
    return false;
}

pgxnmeta::Result<VersionRange> VersionRange::parse(std::string_view text)
{
    static constexpr std::array<std::pair<std::string_view, Comparator>, 6> kOperators{{
        {"==", Comparator::kEqual},
        {"!=", Comparator::kNotEqual},
        {">=", Comparator::kGreaterEqual},
        {"<=", Comparator::kLessEqual},
        {">", Comparator::kGreater},
        {"<", Comparator::kLess},
    }};

    if (trim(text).empty()) {
        return std::unexpected(pgxnmeta::Error::make(errc::kSemanticViolation,
                                                     "version range is empty"));
    }

    VersionRange range;
    range.m_text = std::string(text);
    range.m_constraints.clear();

    for (auto piece : text | std::views::split(',')) {
        std::string_view term = trim(std::string_view(piece.begin(), piece.end()));
        Constraint constraint;
        for (const auto& [symbol, op] : kOperators) {
            if (term.starts_with(symbol)) {
                constraint.op = op;
                term = trim(term.substr(symbol.size()));
                break;
            }
        }
        if (term.empty()) {
            return std::unexpected(pgxnmeta::Error::make(
                errc::kSemanticViolation,
                std::format("'{}' is not a valid version range: empty constraint", text)));
        }
        auto version = Version::parse_lenient(term);
        if (!version) {
            return std::unexpected(pgxnmeta::Error::make(
                errc::kSemanticViolation,
                std::format("'{}' is not a valid version range: {}", text, version.error().message)));
        }
        constraint.version = std::move(*version);
        range.m_constraints.push_back(std::move(constraint));
    }
    return range;
}

pgxnmeta::Result<VersionRange> VersionRange::from_json(const nlohmann::json& value)
{
    if (value.is_number_integer() && value.get<std::int64_t>() == 0) {
        return VersionRange{};
    }
    if (value.is_string()) {
        return parse(value.get<std::string>());
    }
    return std::unexpected(pgxnmeta::Error::make(
        errc::kSemanticViolation, "version range must be a string or the integer 0"));
}

bool VersionRange::satisfies(const Version& candidate) const noexcept
{
    return std::ranges::all_of(m_constraints, [&candidate](const Constraint& constraint) {
        return constraint.satisfied_by(candidate);
    });
}

nlohmann::json VersionRange::to_json() const
{
    if (m_text == "0") {
        return 0;
    }
    return m_text;
}

std::string VersionRange::to_string() const
{
    std::string out;
    for (const auto& constraint : m_constraints) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::format("{} {}", comparator_symbol(constraint.op), constraint.version.to_string());
    }
    return out;
}

}  // namespace pgxnmeta::semver
