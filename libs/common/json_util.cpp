/**
 * @file json_util.cpp
 * @brief JSON file loading, custom properties and JSON pointer helpers
 */

#include "pgxnmeta/common.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <iterator>

namespace pgxnmeta::common {

pgxnmeta::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            pgxnmeta::Error::make(errc::kIOError, "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(pgxnmeta::Error::make(
            errc::kParseError, "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

pgxnmeta::Result<std::string> read_file_bytes(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            pgxnmeta::Error::make(errc::kIOError, "Failed to open file: " + path.string()));
    }
    std::string bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return std::unexpected(
            pgxnmeta::Error::make(errc::kIOError, "Failed to read file: " + path.string()));
    }
    return bytes;
}

bool is_custom_key(std::string_view key) noexcept
{
    return key.size() > 2 && (key[0] == 'x' || key[0] == 'X') && key[1] == '_';
}

pgxnmeta::CustomProps custom_props(const nlohmann::json& object)
{
    pgxnmeta::CustomProps props;
    if (!object.is_object()) {
        return props;
    }
    for (const auto& [key, value] : object.items()) {
        if (is_custom_key(key)) {
            props.emplace(key, value);
        }
    }
    return props;
}

void put_custom_props(nlohmann::json& object, const pgxnmeta::CustomProps& props)
{
    for (const auto& [key, value] : props) {
        object[key] = value;
    }
}

std::string pointer_append(std::string_view base, std::string_view token)
{
    std::string result(base);
    result += '/';
    for (char c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

}  // namespace pgxnmeta::common

namespace pgxnmeta {

std::string Error::describe() const
{
    std::string out = std::format("{}: {}", code, message);
    if (!path.empty()) {
        out += std::format(" (at '{}')", path);
    }
    for (const auto& violation : violations) {
        out += std::format("\n  at '{}': {} [{}]",
                           violation.location.empty() ? "/" : violation.location,
                           violation.description,
                           violation.keyword);
    }
    return out;
}

}  // namespace pgxnmeta
