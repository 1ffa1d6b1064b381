#pragma once

/**
 * @file json_fields.hpp
 * @brief Field access helpers shared by the model readers and writers
 *
 * Readers run only on documents that already passed schema validation, so
 * field types are known; the helpers only deal with presence.
 */

#include "pgxnmeta/common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgxnmeta::detail {

[[nodiscard]] inline std::optional<std::string> opt_string(const nlohmann::json& object,
                                                           std::string_view key)
{
    const auto it = object.find(std::string(key));
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

/// A string or an array of strings as a list; absent is empty.
[[nodiscard]] inline std::vector<std::string> string_list(const nlohmann::json& object,
                                                          std::string_view key)
{
    std::vector<std::string> out;
    const auto it = object.find(std::string(key));
    if (it == object.end()) {
        return out;
    }
    if (it->is_string()) {
        out.push_back(it->get<std::string>());
        return out;
    }
    if (it->is_array()) {
        for (const auto& item : *it) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

inline void put_opt(nlohmann::json& object,
                    std::string_view key,
                    const std::optional<std::string>& value)
{
    if (value) {
        object[std::string(key)] = *value;
    }
}

inline void put_list(nlohmann::json& object,
                     std::string_view key,
                     const std::vector<std::string>& values)
{
    if (!values.empty()) {
        object[std::string(key)] = values;
    }
}

/**
 * Attach a field path to a primitive grammar failure.
 */
[[nodiscard]] inline pgxnmeta::VoidResult at_path(pgxnmeta::VoidResult result, std::string path)
{
    if (result) {
        return result;
    }
    pgxnmeta::Error error = std::move(result.error());
    error.path = std::move(path);
    return std::unexpected(std::move(error));
}

[[nodiscard]] inline pgxnmeta::Error semantic(std::string path, std::string message)
{
    return pgxnmeta::Error::at(errc::kSemanticViolation, std::move(path), std::move(message));
}

}  // namespace pgxnmeta::detail
