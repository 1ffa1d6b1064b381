/**
 * @file purl.cpp
 * @brief Package URL parsing and canonical encoding
 */

#include "pgxnmeta/purl.hpp"

#include "pgxnmeta/primitives.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>
#include <vector>

namespace pgxnmeta::purl {

namespace {

constexpr std::string_view kScheme = "pkg:";

[[nodiscard]] pgxnmeta::Error purl_error(std::string_view text, std::string_view reason)
{
    return pgxnmeta::Error::make(errc::kSemanticViolation,
                                 std::format("'{}' is not a valid purl: {}", text, reason));
}

[[nodiscard]] int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_unreserved(unsigned char c) noexcept
{
    return std::isalnum(c) != 0 || c == '-' || c == '.' || c == '_' || c == '~';
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view text, char sep)
{
    std::vector<std::string_view> parts;
    for (auto part : text | std::views::split(sep)) {
        parts.emplace_back(part.begin(), part.end());
    }
    return parts;
}

[[nodiscard]] std::string lowercase(std::string_view text)
{
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

[[nodiscard]] bool valid_type(std::string_view type) noexcept
{
    return !type.empty() && std::isalpha(static_cast<unsigned char>(type.front())) != 0
           && std::ranges::all_of(type, [](unsigned char c) {
                  return std::isalnum(c) != 0 || c == '.' || c == '+' || c == '-';
              });
}

[[nodiscard]] bool valid_qualifier_key(std::string_view key) noexcept
{
    return !key.empty() && std::isalpha(static_cast<unsigned char>(key.front())) != 0
           && std::ranges::all_of(key, [](unsigned char c) {
                  return std::isalnum(c) != 0 || c == '.' || c == '-' || c == '_';
              });
}

/**
 * @brief Decode '/'-separated segments, dropping empty ones
 */
[[nodiscard]] pgxnmeta::Result<std::string> decode_segments(std::string_view text,
                                                            bool reject_dots)
{
    std::string out;
    for (auto segment : split(text, '/')) {
        if (segment.empty()) {
            continue;
        }
        auto decoded = percent_decode(segment);
        if (!decoded) {
            return decoded;
        }
        if (reject_dots && (*decoded == "." || *decoded == "..")) {
            return std::unexpected(pgxnmeta::Error::make(errc::kSemanticViolation,
                                                         "segment may not be '.' or '..'"));
        }
        if (!out.empty()) {
            out += '/';
        }
        out += *decoded;
    }
    return out;
}

}  // namespace

std::string percent_encode(std::string_view text)
{
    static constexpr std::string_view kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0f];
        }
    }
    return out;
}

pgxnmeta::Result<std::string> percent_decode(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out += text[i];
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::unexpected(pgxnmeta::Error::make(
                errc::kSemanticViolation, std::format("truncated percent escape in '{}'", text)));
        }
        const int hi = hex_value(text[i + 1]);
        const int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::unexpected(pgxnmeta::Error::make(
                errc::kSemanticViolation, std::format("invalid percent escape in '{}'", text)));
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

pgxnmeta::Result<Purl> Purl::parse(std::string_view text)
{
    if (text.size() <= kScheme.size() || lowercase(text.substr(0, kScheme.size())) != kScheme) {
        return std::unexpected(purl_error(text, "missing 'pkg:' scheme"));
    }
    std::string_view rest = text.substr(kScheme.size());
    while (rest.starts_with('/')) {
        rest.remove_prefix(1);
    }

    Purl purl;

    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        auto subpath = decode_segments(rest.substr(hash + 1), true);
        if (!subpath) {
            return std::unexpected(purl_error(text, subpath.error().message));
        }
        purl.m_subpath = std::move(*subpath);
        rest = rest.substr(0, hash);
    }

    if (auto question = rest.find('?'); question != std::string_view::npos) {
        for (auto pair : split(rest.substr(question + 1), '&')) {
            if (pair.empty()) {
                continue;
            }
            const auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                return std::unexpected(purl_error(text, "qualifier without '='"));
            }
            std::string key = lowercase(pair.substr(0, eq));
            if (!valid_qualifier_key(key)) {
                return std::unexpected(purl_error(text, std::format("invalid qualifier key '{}'", key)));
            }
            auto value = percent_decode(pair.substr(eq + 1));
            if (!value) {
                return std::unexpected(purl_error(text, value.error().message));
            }
            // Empty values are the same as an absent qualifier.
            if (value->empty()) {
                continue;
            }
            if (purl.m_qualifiers.contains(key)) {
                return std::unexpected(purl_error(text, std::format("duplicate qualifier '{}'", key)));
            }
            purl.m_qualifiers.emplace(std::move(key), std::move(*value));
        }
        rest = rest.substr(0, question);
    }

    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return std::unexpected(purl_error(text, "missing name"));
    }
    if (!valid_type(rest.substr(0, slash))) {
        return std::unexpected(purl_error(text, "invalid type"));
    }
    purl.m_type = lowercase(rest.substr(0, slash));
    rest = rest.substr(slash + 1);
    while (rest.ends_with('/')) {
        rest.remove_suffix(1);
    }

    if (auto at = rest.rfind('@'); at != std::string_view::npos) {
        auto version = percent_decode(rest.substr(at + 1));
        if (!version) {
            return std::unexpected(purl_error(text, version.error().message));
        }
        auto range = semver::VersionRange::parse(*version);
        if (!range) {
            return std::unexpected(purl_error(text, range.error().message));
        }
        purl.m_version = std::move(*range);
        rest = rest.substr(0, at);
    }

    const auto last_slash = rest.rfind('/');
    const std::string_view raw_name =
        last_slash == std::string_view::npos ? rest : rest.substr(last_slash + 1);
    auto name = percent_decode(raw_name);
    if (!name) {
        return std::unexpected(purl_error(text, name.error().message));
    }
    if (name->empty()) {
        return std::unexpected(purl_error(text, "missing name"));
    }
    purl.m_name = std::move(*name);

    if (last_slash != std::string_view::npos) {
        auto ns = decode_segments(rest.substr(0, last_slash), false);
        if (!ns) {
            return std::unexpected(purl_error(text, ns.error().message));
        }
        purl.m_namespace = std::move(*ns);
    }

    if (purl.is_pgxn()) {
        if (purl.m_namespace.empty()) {
            return std::unexpected(purl_error(text, "pgxn purls require the username as namespace"));
        }
        if (auto user = primitive::validate_term(purl.m_namespace); !user) {
            return std::unexpected(purl_error(text, "pgxn namespace must be a valid username"));
        }
    }

    return purl;
}

std::string Purl::to_string() const
{
    std::string out = std::format("{}{}/", kScheme, m_type);
    if (!m_namespace.empty()) {
        for (auto segment : split(m_namespace, '/')) {
            out += percent_encode(segment);
            out += '/';
        }
    }
    out += percent_encode(m_name);
    if (m_version) {
        out += '@';
        out += percent_encode(m_version->text());
    }
    if (!m_qualifiers.empty()) {
        char sep = '?';
        for (const auto& [key, value] : m_qualifiers) {
            out += std::format("{}{}={}", sep, key, percent_encode(value));
            sep = '&';
        }
    }
    if (!m_subpath.empty()) {
        out += '#';
        bool first = true;
        for (auto segment : split(m_subpath, '/')) {
            if (!first) {
                out += '/';
            }
            out += percent_encode(segment);
            first = false;
        }
    }
    return out;
}

}  // namespace pgxnmeta::purl
