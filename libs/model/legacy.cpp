/**
 * @file legacy.cpp
 * @brief Generation 1 distribution construction, serialization and dispatch
 */

#include "pgxnmeta/legacy.hpp"

#include "json_fields.hpp"
#include "pgxnmeta/primitives.hpp"
#include "pgxnmeta/schema.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace pgxnmeta {

namespace {

using nlohmann::json;
using detail::at_path;
using detail::opt_string;
using detail::put_opt;
using detail::semantic;

constexpr std::string_view kSchemaKey = "v1/distribution";

[[nodiscard]] LegacyLicense read_license(const json& value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_array()) {
        return value.get<std::vector<std::string>>();
    }
    return value.get<std::map<std::string, std::string>>();
}

[[nodiscard]] json license_to_json(const LegacyLicense& license)
{
    return std::visit([](const auto& value) { return json(value); }, license);
}

/// A string or list of strings, written back as a string when there is one.
[[nodiscard]] json string_or_list(const std::vector<std::string>& values)
{
    if (values.size() == 1) {
        return values.front();
    }
    return values;
}

[[nodiscard]] VoidResult check_list(const std::vector<std::string>& values,
                                    std::string_view base,
                                    VoidResult (*check)(std::string_view))
{
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (auto valid = at_path(check(values[i]), std::format("{}/{}", base, i)); !valid) {
            return valid;
        }
    }
    return {};
}

[[nodiscard]] Result<std::map<std::string, LegacyExtension>> read_provides(const json& object)
{
    std::map<std::string, LegacyExtension> out;
    for (const auto& [name, item] : object.items()) {
        const std::string base = common::pointer_append("/provides", name);
        if (auto valid = at_path(primitive::validate_term(name), base); !valid) {
            return std::unexpected(valid.error());
        }
        auto version = semver::Version::parse(item.at("version").get<std::string>());
        if (!version) {
            return std::unexpected(semantic(base + "/version", version.error().message));
        }
        LegacyExtension ext{
            .file = item.at("file").get<std::string>(),
            .version = std::move(*version),
            .abstract = opt_string(item, "abstract"),
            .docfile = opt_string(item, "docfile"),
            .custom = common::custom_props(item),
        };
        if (auto valid = at_path(primitive::validate_path(ext.file), base + "/file"); !valid) {
            return std::unexpected(valid.error());
        }
        if (ext.docfile) {
            if (auto valid = at_path(primitive::validate_path(*ext.docfile), base + "/docfile"); !valid) {
                return std::unexpected(valid.error());
            }
        }
        out.emplace(name, std::move(ext));
    }
    return out;
}

}  // namespace

pgxnmeta::Result<LegacyDistribution> LegacyDistribution::try_from(const json& document,
                                                                  const schema::SchemaRegistry& registry)
{
    auto generation = detect_generation(document);
    if (!generation) {
        return std::unexpected(generation.error());
    }
    if (*generation != Generation::kV1) {
        return std::unexpected(Error::at(errc::kUnsupportedSpecVersion,
                                         "/meta-spec/version",
                                         "expected a generation 1 (meta-spec 1.x) document"));
    }
    if (auto valid = schema::require_valid(registry, kSchemaKey, document, "legacy distribution");
        !valid) {
        return std::unexpected(valid.error());
    }

    LegacyDistribution dist;
    try {
        dist.m_name = document.at("name").get<std::string>();
        if (auto valid = at_path(primitive::validate_term(dist.m_name), "/name"); !valid) {
            return std::unexpected(valid.error());
        }
        auto version = semver::Version::parse(document.at("version").get<std::string>());
        if (!version) {
            return std::unexpected(semantic("/version", version.error().message));
        }
        dist.m_version = std::move(*version);
        dist.m_abstract = document.at("abstract").get<std::string>();
        dist.m_description = opt_string(document, "description");
        dist.m_maintainers = detail::string_list(document, "maintainer");
        dist.m_license = read_license(document.at("license"));

        auto provides = read_provides(document.at("provides"));
        if (!provides) {
            return std::unexpected(provides.error());
        }
        dist.m_provides = std::move(*provides);

        const json& spec = document.at("meta-spec");
        auto spec_version = semver::Version::parse(spec.at("version").get<std::string>());
        if (!spec_version) {
            return std::unexpected(semantic("/meta-spec/version", spec_version.error().message));
        }
        if (spec_version->major() != 1) {
            return std::unexpected(semantic("/meta-spec/version", "meta-spec major version must be 1"));
        }
        dist.m_meta_spec = LegacyMetaSpec{
            .version = std::move(*spec_version),
            .url = opt_string(spec, "url"),
            .custom = common::custom_props(spec),
        };

        dist.m_generated_by = opt_string(document, "generated_by");

        dist.m_tags = detail::string_list(document, "tags");
        if (auto valid = check_list(dist.m_tags, "/tags", &primitive::validate_tag); !valid) {
            return std::unexpected(valid.error());
        }

        if (document.contains("no_index")) {
            const json& no_index = document.at("no_index");
            NoIndex value{
                .file = detail::string_list(no_index, "file"),
                .directory = detail::string_list(no_index, "directory"),
                .custom = common::custom_props(no_index),
            };
            // Entries become generation 2 ignore globs on upgrade.
            if (auto valid = check_list(value.file, "/no_index/file", &primitive::validate_glob); !valid) {
                return std::unexpected(valid.error());
            }
            if (auto valid = check_list(value.directory, "/no_index/directory", &primitive::validate_glob);
                !valid) {
                return std::unexpected(valid.error());
            }
            dist.m_no_index = std::move(value);
        }

        if (document.contains("prereqs")) {
            dist.m_prereqs = document.at("prereqs");
        }
        dist.m_release_status = opt_string(document, "release_status");
        if (document.contains("resources")) {
            dist.m_resources = document.at("resources");
        }
        dist.m_custom = common::custom_props(document);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(errc::kSemanticViolation,
                                           std::format("unexpected legacy distribution shape: {}", ex.what())));
    }

    spdlog::debug("constructed legacy distribution {} {}", dist.m_name, dist.m_version.to_string());
    return dist;
}

pgxnmeta::Result<LegacyDistribution> LegacyDistribution::try_from(const json& document)
{
    auto registry = schema::default_registry();
    if (!registry) {
        return std::unexpected(registry.error());
    }
    return try_from(document, **registry);
}

json LegacyDistribution::to_json() const
{
    json out = {
        {"name", m_name},
        {"version", m_version.to_string()},
        {"abstract", m_abstract},
        {"maintainer", string_or_list(m_maintainers)},
        {"license", license_to_json(m_license)},
    };
    put_opt(out, "description", m_description);

    json provides = json::object();
    for (const auto& [name, ext] : m_provides) {
        json obj = {{"file", ext.file}, {"version", ext.version.to_string()}};
        put_opt(obj, "abstract", ext.abstract);
        put_opt(obj, "docfile", ext.docfile);
        common::put_custom_props(obj, ext.custom);
        provides[name] = std::move(obj);
    }
    out["provides"] = std::move(provides);

    json spec = {{"version", m_meta_spec.version.to_string()}};
    put_opt(spec, "url", m_meta_spec.url);
    common::put_custom_props(spec, m_meta_spec.custom);
    out["meta-spec"] = std::move(spec);

    put_opt(out, "generated_by", m_generated_by);
    detail::put_list(out, "tags", m_tags);
    if (m_no_index) {
        json no_index = json::object();
        if (!m_no_index->file.empty()) {
            no_index["file"] = string_or_list(m_no_index->file);
        }
        if (!m_no_index->directory.empty()) {
            no_index["directory"] = string_or_list(m_no_index->directory);
        }
        common::put_custom_props(no_index, m_no_index->custom);
        out["no_index"] = std::move(no_index);
    }
    if (m_prereqs) {
        out["prereqs"] = *m_prereqs;
    }
    put_opt(out, "release_status", m_release_status);
    if (m_resources) {
        out["resources"] = *m_resources;
    }
    common::put_custom_props(out, m_custom);
    return out;
}

pgxnmeta::Result<AnyDistribution> load_distribution(const json& document,
                                                    const schema::SchemaRegistry& registry)
{
    auto generation = detect_generation(document);
    if (!generation) {
        return std::unexpected(generation.error());
    }
    if (*generation == Generation::kV1) {
        auto legacy = LegacyDistribution::try_from(document, registry);
        if (!legacy) {
            return std::unexpected(legacy.error());
        }
        return AnyDistribution{std::move(*legacy)};
    }
    auto dist = Distribution::try_from(document, registry);
    if (!dist) {
        return std::unexpected(dist.error());
    }
    return AnyDistribution{std::move(*dist)};
}

pgxnmeta::Result<AnyDistribution> load_distribution(const json& document)
{
    auto registry = schema::default_registry();
    if (!registry) {
        return std::unexpected(registry.error());
    }
    return load_distribution(document, **registry);
}

}  // namespace pgxnmeta
