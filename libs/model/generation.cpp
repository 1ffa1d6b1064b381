/**
 * @file generation.cpp
 * @brief Generation dispatch on meta-spec.version
 */

#include "pgxnmeta/generation.hpp"

#include <format>
#include <string_view>

#include <spdlog/spdlog.h>

namespace pgxnmeta {

pgxnmeta::Result<Generation> detect_generation(const nlohmann::json& document)
{
    constexpr std::string_view kUnknown = "Cannot determine meta-spec version";

    if (!document.is_object()) {
        return std::unexpected(
            Error::make(errc::kUnsupportedSpecVersion, std::string(kUnknown)));
    }
    const auto spec = document.find("meta-spec");
    if (spec == document.end() || !spec->is_object()) {
        return std::unexpected(
            Error::at(errc::kUnsupportedSpecVersion, "/meta-spec", std::string(kUnknown)));
    }
    const auto version = spec->find("version");
    if (version == spec->end() || !version->is_string()) {
        return std::unexpected(
            Error::at(errc::kUnsupportedSpecVersion, "/meta-spec/version", std::string(kUnknown)));
    }

    const auto& text = version->get_ref<const std::string&>();
    if (text.starts_with("1.")) {
        spdlog::debug("meta-spec {} is generation 1", text);
        return Generation::kV1;
    }
    if (text.starts_with("2.")) {
        spdlog::debug("meta-spec {} is generation 2", text);
        return Generation::kV2;
    }
    return std::unexpected(Error::at(errc::kUnsupportedSpecVersion,
                                     "/meta-spec/version",
                                     std::format("{}: unsupported version '{}'", kUnknown, text)));
}

}  // namespace pgxnmeta
