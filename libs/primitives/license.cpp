/**
 * @file license.cpp
 * @brief SPDX identifier lists and expression parser
 */

#include "pgxnmeta/license.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <ranges>

namespace pgxnmeta::license {

namespace {

#include "spdx_lists.inc"

[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

[[nodiscard]] bool is_idstring(std::string_view text) noexcept
{
    return !text.empty() && std::ranges::all_of(text, [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-' || c == '.';
    });
}

[[nodiscard]] bool is_license_ref(std::string_view token) noexcept
{
    constexpr std::string_view kLicenseRef = "LicenseRef-";
    constexpr std::string_view kDocumentRef = "DocumentRef-";
    if (token.starts_with(kDocumentRef)) {
        const auto colon = token.find(':');
        if (colon == std::string_view::npos || !is_idstring(token.substr(kDocumentRef.size(), colon - kDocumentRef.size()))) {
            return false;
        }
        token = token.substr(colon + 1);
    }
    return token.starts_with(kLicenseRef) && is_idstring(token.substr(kLicenseRef.size()));
}

[[nodiscard]] std::vector<std::string_view> tokenize(std::string_view text)
{
    std::vector<std::string_view> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }
        if (c == '(' || c == ')') {
            tokens.push_back(text.substr(i, 1));
            ++i;
            continue;
        }
        const std::size_t start = i;
        while (i < text.size() && text[i] != '(' && text[i] != ')'
               && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
            ++i;
        }
        tokens.push_back(text.substr(start, i - start));
    }
    return tokens;
}

/**
 * @brief Recursive-descent parser; OR binds loosest, then AND, then WITH
 */
class ExpressionParser
{
public:
    explicit ExpressionParser(std::string_view text)
        : m_text(text)
        , m_tokens(tokenize(text))
    {}

    [[nodiscard]] pgxnmeta::Result<std::vector<std::string>> run()
    {
        if (m_tokens.empty()) {
            return std::unexpected(fail("empty expression"));
        }
        if (auto result = parse_or(); !result) {
            return std::unexpected(result.error());
        }
        if (m_pos != m_tokens.size()) {
            return std::unexpected(fail(std::format("unexpected '{}'", m_tokens[m_pos])));
        }
        return std::move(m_ids);
    }

private:
    [[nodiscard]] pgxnmeta::Error fail(std::string_view reason) const
    {
        return pgxnmeta::Error::make(
            errc::kSemanticViolation,
            std::format("'{}' is not a valid SPDX license expression: {}", m_text, reason));
    }

    [[nodiscard]] bool accept(std::string_view keyword)
    {
        if (m_pos < m_tokens.size() && m_tokens[m_pos] == keyword) {
            ++m_pos;
            return true;
        }
        return false;
    }

    [[nodiscard]] pgxnmeta::VoidResult parse_or()
    {
        if (auto lhs = parse_and(); !lhs) {
            return lhs;
        }
        while (accept("OR")) {
            if (auto rhs = parse_and(); !rhs) {
                return rhs;
            }
        }
        return {};
    }

    [[nodiscard]] pgxnmeta::VoidResult parse_and()
    {
        if (auto lhs = parse_with(); !lhs) {
            return lhs;
        }
        while (accept("AND")) {
            if (auto rhs = parse_with(); !rhs) {
                return rhs;
            }
        }
        return {};
    }

    [[nodiscard]] pgxnmeta::VoidResult parse_with()
    {
        if (auto primary = parse_primary(); !primary) {
            return primary;
        }
        if (accept("WITH")) {
            if (m_pos >= m_tokens.size()) {
                return std::unexpected(fail("missing exception after WITH"));
            }
            const auto exception = m_tokens[m_pos++];
            if (!is_exception_id(exception)) {
                return std::unexpected(fail(std::format("unknown license exception '{}'", exception)));
            }
        }
        return {};
    }

    [[nodiscard]] pgxnmeta::VoidResult parse_primary()
    {
        if (m_pos >= m_tokens.size()) {
            return std::unexpected(fail("unexpected end of expression"));
        }
        if (accept("(")) {
            if (auto inner = parse_or(); !inner) {
                return inner;
            }
            if (!accept(")")) {
                return std::unexpected(fail("unbalanced parentheses"));
            }
            return {};
        }

        std::string_view token = m_tokens[m_pos];
        if (token == ")" || token == "AND" || token == "OR" || token == "WITH") {
            return std::unexpected(fail(std::format("unexpected '{}'", token)));
        }
        ++m_pos;
        if (is_license_ref(token)) {
            m_ids.emplace_back(token);
            return {};
        }
        // "GPL-2.0+" is in the list as a deprecated id; any other id takes "+" as "or later".
        if (!is_license_id(token) && token.ends_with('+')) {
            token.remove_suffix(1);
        }
        if (!is_license_id(token)) {
            return std::unexpected(fail(std::format("unknown license identifier '{}'", token)));
        }
        m_ids.emplace_back(token);
        return {};
    }

    std::string_view m_text;
    std::vector<std::string_view> m_tokens;
    std::size_t m_pos = 0;
    std::vector<std::string> m_ids;
};

}  // namespace

bool is_license_id(std::string_view id) noexcept
{
    return std::ranges::any_of(kLicenses, [id](std::string_view known) { return iequals(known, id); });
}

bool is_exception_id(std::string_view id) noexcept
{
    return std::ranges::any_of(kExceptions,
                               [id](std::string_view known) { return iequals(known, id); });
}

pgxnmeta::VoidResult validate_expression(std::string_view expression)
{
    if (auto ids = license_ids(expression); !ids) {
        return std::unexpected(ids.error());
    }
    return {};
}

pgxnmeta::Result<std::vector<std::string>> license_ids(std::string_view expression)
{
    return ExpressionParser(expression).run();
}

}  // namespace pgxnmeta::license
