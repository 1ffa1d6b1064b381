/**
 * @file convert.cpp
 * @brief Generation 1 to generation 2 upgrade and generation-agnostic loading
 */

#include "pgxnmeta/convert.hpp"

#include "pgxnmeta/primitives.hpp"
#include "pgxnmeta/schema.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <set>

#include <spdlog/spdlog.h>

namespace pgxnmeta {

namespace {

using nlohmann::json;

constexpr std::size_t kMaxTags = 32;

constexpr std::array<std::string_view, 2> kLegacyMetaSpecUrls = {
    "https://pgxn.org/meta/spec.txt",
    "http://pgxn.org/meta/spec.txt",
};

struct LicenseMapping
{
    std::string_view legacy;
    std::string_view spdx;
};

// open_source, restricted, unrestricted, ssleay and unknown have no SPDX
// equivalent.
constexpr std::array<LicenseMapping, 23> kLicenseNames = {{
    {"agpl_3", "AGPL-3.0"},
    {"apache_1_1", "Apache-1.1"},
    {"apache_2_0", "Apache-2.0"},
    {"artistic_1", "Artistic-1.0"},
    {"artistic_2", "Artistic-2.0"},
    {"bsd", "BSD-3-Clause"},
    {"freebsd", "BSD-2-Clause-FreeBSD"},
    {"gfdl_1_2", "GFDL-1.2-or-later"},
    {"gfdl_1_3", "GFDL-1.3-or-later"},
    {"gpl_1", "GPL-1.0-only"},
    {"gpl_2", "GPL-2.0-only"},
    {"gpl_3", "GPL-3.0-only"},
    {"lgpl_2_1", "LGPL-2.1"},
    {"lgpl_3_0", "LGPL-3.0"},
    {"mit", "MIT"},
    {"mozilla_1_0", "MPL-1.0"},
    {"mozilla_1_1", "MPL-1.1"},
    {"openssl", "OpenSSL"},
    {"perl_5", "Artistic-1.0-Perl OR GPL-1.0-or-later"},
    {"postgresql", "PostgreSQL"},
    {"qpl_1_0", "QPL-1.0"},
    {"sun", "SISSL"},
    {"zlib", "Zlib"},
}};

// Keys seen in license objects of published generation 1 releases.
constexpr std::array<LicenseMapping, 8> kLicenseKeys = {{
    {"PostgreSQL", "PostgreSQL"},
    {"Apache", "Apache-2.0"},
    {"ISC", "ISC"},
    {"mit", "MIT"},
    {"mozilla_2_0", "MPL-2.0"},
    {"gpl_3", "GPL-3.0-only"},
    {"BSD", "BSD-2-Clause"},
    {"BSD 2 Clause", "BSD-2-Clause"},
}};

constexpr std::string_view kDiffixLicenseUrl =
    "https://github.com/diffix/pg_diffix/blob/master/LICENSE.md";

[[nodiscard]] Error conversion_error(std::string path, std::string message)
{
    return Error::at(errc::kConversionFailure, std::move(path), std::move(message));
}

[[nodiscard]] std::optional<std::string_view> spdx_for_name(std::string_view name)
{
    const auto it = std::ranges::find(kLicenseNames, name, &LicenseMapping::legacy);
    if (it == kLicenseNames.end()) {
        return std::nullopt;
    }
    return it->spdx;
}

[[nodiscard]] std::string join_or(const std::vector<std::string>& parts)
{
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) {
            out += " OR ";
        }
        out += part;
    }
    return out;
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

/**
 * Parse "Name <email>" or a bare address into a maintainer object.
 */
[[nodiscard]] Result<json> upgrade_maintainer(std::string_view text, std::size_t index)
{
    const std::string path = std::format("/maintainer/{}", index);
    const std::string_view value = trim(text);

    std::string_view name;
    std::string_view email;
    const auto open = value.rfind('<');
    if (open != std::string_view::npos && value.ends_with('>')) {
        name = trim(value.substr(0, open));
        email = trim(value.substr(open + 1, value.size() - open - 2));
    } else {
        email = value;
    }

    if (auto valid = primitive::validate_email(email); !valid) {
        return std::unexpected(conversion_error(
            path, std::format("maintainer '{}' has no extractable email address", text)));
    }
    if (name.empty()) {
        name = email;
    }
    return json{{"name", std::string(name)}, {"email", std::string(email)}};
}

[[nodiscard]] json upgrade_meta_spec(const LegacyMetaSpec& spec)
{
    json out = {{"version", "2.0.0"}};
    if (spec.url) {
        if (std::ranges::find(kLegacyMetaSpecUrls, std::string_view(*spec.url)) != kLegacyMetaSpecUrls.end()) {
            out["url"] = std::string(kMetaSpecV2Url);
        } else {
            spdlog::warn("dropping non-canonical meta-spec url {}", *spec.url);
        }
    }
    common::put_custom_props(out, spec.custom);
    return out;
}

[[nodiscard]] json upgrade_contents(const std::map<std::string, LegacyExtension>& provides)
{
    json extensions = json::object();
    for (const auto& [name, ext] : provides) {
        // Generation 1 has no control file; assume it sits in the root.
        json entry = {{"control", name + ".control"}, {"sql", ext.file}};
        if (ext.docfile) {
            entry["doc"] = *ext.docfile;
        }
        if (ext.abstract) {
            entry["abstract"] = *ext.abstract;
        }
        common::put_custom_props(entry, ext.custom);
        extensions[name] = std::move(entry);
    }
    return json{{"extensions", std::move(extensions)}};
}

[[nodiscard]] std::vector<std::string> upgrade_tags(const std::vector<std::string>& tags)
{
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& tag : tags) {
        if (!seen.insert(tag).second) {
            continue;
        }
        if (out.size() == kMaxTags) {
            spdlog::warn("dropping legacy tag '{}': generation 2 allows at most {} tags", tag, kMaxTags);
            continue;
        }
        out.push_back(tag);
    }
    return out;
}

[[nodiscard]] std::vector<std::string> upgrade_ignore(const NoIndex& no_index)
{
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto* list : {&no_index.file, &no_index.directory}) {
        for (const auto& entry : *list) {
            if (seen.insert(entry).second) {
                out.push_back(entry);
            }
        }
    }
    return out;
}

}  // namespace

pgxnmeta::Result<std::string> upgrade_license(const LegacyLicense& license)
{
    if (const auto* name = std::get_if<std::string>(&license)) {
        const auto spdx = spdx_for_name(*name);
        if (!spdx) {
            return std::unexpected(conversion_error(
                "/license", std::format("legacy license '{}' has no SPDX equivalent", *name)));
        }
        return std::string(*spdx);
    }

    std::vector<std::string> parts;
    if (const auto* names = std::get_if<std::vector<std::string>>(&license)) {
        for (std::size_t i = 0; i < names->size(); ++i) {
            const auto spdx = spdx_for_name((*names)[i]);
            if (!spdx) {
                return std::unexpected(
                    conversion_error(std::format("/license/{}", i),
                                     std::format("legacy license '{}' has no SPDX equivalent", (*names)[i])));
            }
            parts.emplace_back(*spdx);
        }
        return join_or(parts);
    }

    for (const auto& [key, url] : std::get<std::map<std::string, std::string>>(license)) {
        if (key == "restricted" && url == kDiffixLicenseUrl) {
            parts.emplace_back("BUSL-1.1");
            continue;
        }
        const auto it = std::ranges::find(kLicenseKeys, key, &LicenseMapping::legacy);
        if (it == kLicenseKeys.end()) {
            return std::unexpected(
                conversion_error(common::pointer_append("/license", key),
                                 std::format("unknown legacy license '{}': {}", key, url)));
        }
        parts.emplace_back(it->spdx);
    }
    return join_or(parts);
}

pgxnmeta::Result<json> upgrade_document(const LegacyDistribution& legacy)
{
    json maintainers = json::array();
    for (std::size_t i = 0; i < legacy.maintainers().size(); ++i) {
        auto maintainer = upgrade_maintainer(legacy.maintainers()[i], i);
        if (!maintainer) {
            return std::unexpected(maintainer.error());
        }
        maintainers.push_back(std::move(*maintainer));
    }

    auto license = upgrade_license(legacy.license());
    if (!license) {
        return std::unexpected(license.error());
    }

    json out = {
        {"name", legacy.name()},
        {"version", legacy.version().to_string()},
        {"abstract", legacy.abstract()},
        {"maintainers", std::move(maintainers)},
        {"license", std::move(*license)},
        {"contents", upgrade_contents(legacy.provides())},
        {"meta-spec", upgrade_meta_spec(legacy.meta_spec())},
    };
    if (legacy.description()) {
        out["description"] = *legacy.description();
    }
    if (legacy.generated_by()) {
        out["producer"] = *legacy.generated_by();
    }
    if (auto tags = upgrade_tags(legacy.tags()); !tags.empty()) {
        out["classifications"] = json{{"tags", std::move(tags)}};
    }
    if (legacy.no_index()) {
        if (auto ignore = upgrade_ignore(*legacy.no_index()); !ignore.empty()) {
            out["ignore"] = std::move(ignore);
        }
    }
    common::put_custom_props(out, legacy.custom());
    return out;
}

pgxnmeta::Result<Distribution> upgrade(const LegacyDistribution& legacy,
                                       const schema::SchemaRegistry& registry)
{
    auto document = upgrade_document(legacy);
    if (!document) {
        return std::unexpected(document.error());
    }
    auto dist = Distribution::try_from(*document, registry);
    if (!dist) {
        Error error = dist.error();
        error.code = errc::kConversionFailure;
        error.message = std::format("upgraded {} {} is not a valid distribution: {}",
                                    legacy.name(),
                                    legacy.version().to_string(),
                                    error.message);
        return std::unexpected(std::move(error));
    }
    spdlog::debug("upgraded {} {} to meta-spec 2.0.0", legacy.name(), legacy.version().to_string());
    return dist;
}

pgxnmeta::Result<Distribution> upgrade(const LegacyDistribution& legacy)
{
    auto registry = schema::default_registry();
    if (!registry) {
        return std::unexpected(registry.error());
    }
    return upgrade(legacy, **registry);
}

pgxnmeta::Result<Distribution> Distribution::load(const json& document,
                                                  const schema::SchemaRegistry& registry)
{
    auto any = load_distribution(document, registry);
    if (!any) {
        return std::unexpected(any.error());
    }
    if (auto* legacy = std::get_if<LegacyDistribution>(&*any)) {
        return upgrade(*legacy, registry);
    }
    return std::get<Distribution>(std::move(*any));
}

pgxnmeta::Result<Distribution> Distribution::load(const json& document)
{
    auto registry = schema::default_registry();
    if (!registry) {
        return std::unexpected(registry.error());
    }
    return load(document, **registry);
}

pgxnmeta::Result<Distribution> Distribution::load_file(const std::filesystem::path& path,
                                                       const schema::SchemaRegistry& registry)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    return load(*document, registry);
}

}  // namespace pgxnmeta
