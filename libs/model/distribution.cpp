/**
 * @file distribution.cpp
 * @brief Generation 2 distribution construction and serialization
 */

#include "pgxnmeta/distribution.hpp"

#include "json_fields.hpp"
#include "pgxnmeta/license.hpp"
#include "pgxnmeta/primitives.hpp"
#include "pgxnmeta/purl.hpp"
#include "pgxnmeta/schema.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace pgxnmeta {

namespace {

using nlohmann::json;
using common::pointer_append;
using detail::at_path;
using detail::opt_string;
using detail::put_opt;
using detail::semantic;

constexpr std::string_view kSchemaKey = "v2/distribution";

/// Check an optional path field.
[[nodiscard]] VoidResult check_opt_path(const std::optional<std::string>& value,
                                        const std::string& base,
                                        std::string_view key)
{
    if (!value) {
        return {};
    }
    return at_path(primitive::validate_path(*value), pointer_append(base, key));
}

[[nodiscard]] Preload read_preload(const json& value)
{
    if (value.get_ref<const std::string&>() == "server") {
        return Preload::kServer;
    }
    return Preload::kSession;
}

[[nodiscard]] std::string_view preload_name(Preload preload) noexcept
{
    return preload == Preload::kServer ? "server" : "session";
}

[[nodiscard]] std::string_view module_type_name(ModuleType type) noexcept
{
    switch (type) {
    case ModuleType::kExtension:
        return "extension";
    case ModuleType::kHook:
        return "hook";
    case ModuleType::kBgw:
        return "bgw";
    }
    return "extension";
}

[[nodiscard]] ModuleType read_module_type(std::string_view text) noexcept
{
    if (text == "hook") {
        return ModuleType::kHook;
    }
    if (text == "bgw") {
        return ModuleType::kBgw;
    }
    return ModuleType::kExtension;
}

// ============================================================================
// Readers
// ============================================================================

[[nodiscard]] Result<std::vector<Maintainer>> read_maintainers(const json& array)
{
    std::vector<Maintainer> out;
    for (std::size_t i = 0; i < array.size(); ++i) {
        const json& item = array.at(i);
        const std::string base = std::format("/maintainers/{}", i);
        Maintainer maintainer{
            .name = item.at("name").get<std::string>(),
            .email = opt_string(item, "email"),
            .url = opt_string(item, "url"),
            .custom = common::custom_props(item),
        };
        if (!maintainer.email && !maintainer.url) {
            return std::unexpected(semantic(base, "maintainer must have an email or a url"));
        }
        if (maintainer.email) {
            if (auto valid = at_path(primitive::validate_email(*maintainer.email), base + "/email");
                !valid) {
                return std::unexpected(valid.error());
            }
        }
        if (maintainer.url) {
            if (auto valid = at_path(primitive::validate_uri(*maintainer.url), base + "/url"); !valid) {
                return std::unexpected(valid.error());
            }
        }
        out.push_back(std::move(maintainer));
    }
    return out;
}

template <typename Entry, typename Build>
[[nodiscard]] Result<std::map<std::string, Entry>> read_kind(const json& contents,
                                                              std::string_view kind,
                                                              Build build)
{
    std::map<std::string, Entry> out;
    const auto it = contents.find(std::string(kind));
    if (it == contents.end()) {
        return out;
    }
    const std::string kind_path = pointer_append("/contents", kind);
    for (const auto& [name, item] : it->items()) {
        const std::string base = pointer_append(kind_path, name);
        if (auto valid = at_path(primitive::validate_term(name), base); !valid) {
            return std::unexpected(valid.error());
        }
        auto entry = build(item, base);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        out.emplace(name, std::move(*entry));
    }
    return out;
}

[[nodiscard]] Result<Contents> read_contents(const json& object)
{
    Contents contents;
    contents.custom = common::custom_props(object);

    auto extensions = read_kind<Extension>(object, "extensions", [](const json& item, const std::string& base)
                                               -> Result<Extension> {
        Extension ext{
            .control = item.at("control").get<std::string>(),
            .sql = item.at("sql").get<std::string>(),
            .doc = opt_string(item, "doc"),
            .abstract = opt_string(item, "abstract"),
            .tle = item.contains("tle") ? std::optional<bool>(item.at("tle").get<bool>()) : std::nullopt,
            .custom = common::custom_props(item),
        };
        for (const auto& [key, value] : {std::pair{"control", std::optional<std::string>(ext.control)},
                                         std::pair{"sql", std::optional<std::string>(ext.sql)},
                                         std::pair{"doc", ext.doc}}) {
            if (auto valid = check_opt_path(value, base, key); !valid) {
                return std::unexpected(valid.error());
            }
        }
        return ext;
    });
    if (!extensions) {
        return std::unexpected(extensions.error());
    }
    contents.extensions = std::move(*extensions);

    auto modules = read_kind<Module>(object, "modules", [](const json& item, const std::string& base)
                                         -> Result<Module> {
        Module module{
            .type = read_module_type(item.at("type").get<std::string>()),
            .lib = item.at("lib").get<std::string>(),
            .doc = opt_string(item, "doc"),
            .abstract = opt_string(item, "abstract"),
            .preload = std::nullopt,
            .custom = common::custom_props(item),
        };
        if (item.contains("preload")) {
            module.preload = read_preload(item.at("preload"));
        }
        for (const auto& [key, value] : {std::pair{"lib", std::optional<std::string>(module.lib)},
                                         std::pair{"doc", module.doc}}) {
            if (auto valid = check_opt_path(value, base, key); !valid) {
                return std::unexpected(valid.error());
            }
        }
        return module;
    });
    if (!modules) {
        return std::unexpected(modules.error());
    }
    contents.modules = std::move(*modules);

    auto apps = read_kind<App>(object, "apps", [](const json& item, const std::string& base) -> Result<App> {
        App app{
            .bin = item.at("bin").get<std::string>(),
            .lang = opt_string(item, "lang"),
            .abstract = opt_string(item, "abstract"),
            .doc = opt_string(item, "doc"),
            .lib = opt_string(item, "lib"),
            .man = opt_string(item, "man"),
            .html = opt_string(item, "html"),
            .custom = common::custom_props(item),
        };
        for (const auto& [key, value] : {std::pair{"bin", std::optional<std::string>(app.bin)},
                                         std::pair{"doc", app.doc},
                                         std::pair{"lib", app.lib},
                                         std::pair{"man", app.man},
                                         std::pair{"html", app.html}}) {
            if (auto valid = check_opt_path(value, base, key); !valid) {
                return std::unexpected(valid.error());
            }
        }
        return app;
    });
    if (!apps) {
        return std::unexpected(apps.error());
    }
    contents.apps = std::move(*apps);

    auto workers = read_kind<Worker>(object, "workers", [](const json& item, const std::string& base)
                                         -> Result<Worker> {
        Worker worker{
            .lib = item.at("lib").get<std::string>(),
            .doc = opt_string(item, "doc"),
            .abstract = opt_string(item, "abstract"),
            .preload = std::nullopt,
            .custom = common::custom_props(item),
        };
        if (item.contains("preload")) {
            worker.preload = read_preload(item.at("preload"));
        }
        for (const auto& [key, value] : {std::pair{"lib", std::optional<std::string>(worker.lib)},
                                         std::pair{"doc", worker.doc}}) {
            if (auto valid = check_opt_path(value, base, key); !valid) {
                return std::unexpected(valid.error());
            }
        }
        return worker;
    });
    if (!workers) {
        return std::unexpected(workers.error());
    }
    contents.workers = std::move(*workers);

    auto libraries = read_kind<Library>(object, "libraries", [](const json& item, const std::string& base)
                                            -> Result<Library> {
        Library library{
            .lib = item.at("lib").get<std::string>(),
            .doc = opt_string(item, "doc"),
            .abstract = opt_string(item, "abstract"),
            .custom = common::custom_props(item),
        };
        for (const auto& [key, value] : {std::pair{"lib", std::optional<std::string>(library.lib)},
                                         std::pair{"doc", library.doc}}) {
            if (auto valid = check_opt_path(value, base, key); !valid) {
                return std::unexpected(valid.error());
            }
        }
        return library;
    });
    if (!libraries) {
        return std::unexpected(libraries.error());
    }
    contents.libraries = std::move(*libraries);

    if (contents.empty()) {
        return std::unexpected(semantic("/contents", "contents must provide at least one item"));
    }
    return contents;
}

[[nodiscard]] Result<PackageMap> read_package_map(const json& object, const std::string& base)
{
    PackageMap out;
    for (const auto& [key, value] : object.items()) {
        const std::string path = pointer_append(base, key);
        if (auto purl = purl::Purl::parse(key); !purl) {
            return std::unexpected(semantic(path, purl.error().message));
        }
        auto range = semver::VersionRange::from_json(value);
        if (!range) {
            return std::unexpected(semantic(path, range.error().message));
        }
        out.emplace(key, std::move(*range));
    }
    return out;
}

[[nodiscard]] Result<Packages> read_packages(const json& object, const std::string& base)
{
    Packages packages;
    packages.custom = common::custom_props(object);
    for (const auto& [phase_name, phase_json] : object.items()) {
        if (common::is_custom_key(phase_name)) {
            continue;
        }
        const std::string phase_path = pointer_append(base, phase_name);
        Phase phase;
        phase.custom = common::custom_props(phase_json);
        for (const auto& [relation, packages_json] : phase_json.items()) {
            if (common::is_custom_key(relation)) {
                continue;
            }
            auto map = read_package_map(packages_json, pointer_append(phase_path, relation));
            if (!map) {
                return std::unexpected(map.error());
            }
            phase.relations.emplace(relation, std::move(*map));
        }
        packages.phases.emplace(phase_name, std::move(phase));
    }
    return packages;
}

[[nodiscard]] Result<Dependencies> read_dependencies(const json& object,
                                                     const std::string& base,
                                                     bool allow_variations)
{
    Dependencies deps;
    deps.custom = common::custom_props(object);
    deps.pipeline = opt_string(object, "pipeline");

    deps.platforms = detail::string_list(object, "platforms");
    for (std::size_t i = 0; i < deps.platforms.size(); ++i) {
        if (auto valid = at_path(primitive::validate_platform(deps.platforms[i]),
                                 std::format("{}/platforms/{}", base, i));
            !valid) {
            return std::unexpected(valid.error());
        }
    }

    if (object.contains("postgres")) {
        const json& pg = object.at("postgres");
        auto range = semver::VersionRange::from_json(pg.at("version"));
        if (!range) {
            return std::unexpected(semantic(base + "/postgres/version", range.error().message));
        }
        Postgres postgres{
            .version = std::move(*range),
            .with = detail::string_list(pg, "with"),
            .custom = common::custom_props(pg),
        };
        for (std::size_t i = 0; i < postgres.with.size(); ++i) {
            if (auto valid = at_path(primitive::validate_term(postgres.with[i]),
                                     std::format("{}/postgres/with/{}", base, i));
                !valid) {
                return std::unexpected(valid.error());
            }
        }
        deps.postgres = std::move(postgres);
    }

    if (object.contains("packages")) {
        auto packages = read_packages(object.at("packages"), base + "/packages");
        if (!packages) {
            return std::unexpected(packages.error());
        }
        deps.packages = std::move(*packages);
    }

    if (object.contains("variations")) {
        if (!allow_variations) {
            return std::unexpected(
                semantic(base + "/variations", "variations may not contain variations"));
        }
        const json& variations = object.at("variations");
        for (std::size_t i = 0; i < variations.size(); ++i) {
            const json& item = variations.at(i);
            const std::string item_path = std::format("{}/variations/{}", base, i);
            auto where = read_dependencies(item.at("where"), item_path + "/where", false);
            if (!where) {
                return std::unexpected(where.error());
            }
            auto nested = read_dependencies(item.at("dependencies"), item_path + "/dependencies", false);
            if (!nested) {
                return std::unexpected(nested.error());
            }
            deps.variations.push_back(Variation{
                .where = std::move(*where),
                .dependencies = std::move(*nested),
                .custom = common::custom_props(item),
            });
        }
    }
    return deps;
}

[[nodiscard]] Result<Resources> read_resources(const json& object)
{
    Resources resources;
    resources.custom = common::custom_props(object);
    for (const auto& [key, member] : {std::pair{"homepage", &Resources::homepage},
                                      std::pair{"issues", &Resources::issues},
                                      std::pair{"repository", &Resources::repository},
                                      std::pair{"docs", &Resources::docs},
                                      std::pair{"support", &Resources::support}}) {
        resources.*member = opt_string(object, key);
        if (resources.*member) {
            if (auto valid = at_path(primitive::validate_uri(*(resources.*member)),
                                     pointer_append("/resources", key));
                !valid) {
                return std::unexpected(valid.error());
            }
        }
    }
    if (object.contains("badges")) {
        const json& badges = object.at("badges");
        for (std::size_t i = 0; i < badges.size(); ++i) {
            const json& item = badges.at(i);
            const std::string base = std::format("/resources/badges/{}", i);
            Badge badge{
                .src = item.at("src").get<std::string>(),
                .alt = item.at("alt").get<std::string>(),
                .url = opt_string(item, "url"),
                .custom = common::custom_props(item),
            };
            if (auto valid = at_path(primitive::validate_uri(badge.src), base + "/src"); !valid) {
                return std::unexpected(valid.error());
            }
            if (badge.url) {
                if (auto valid = at_path(primitive::validate_uri(*badge.url), base + "/url"); !valid) {
                    return std::unexpected(valid.error());
                }
            }
            resources.badges.push_back(std::move(badge));
        }
    }
    return resources;
}

[[nodiscard]] Result<std::vector<Artifact>> read_artifacts(const json& array)
{
    std::vector<Artifact> out;
    for (std::size_t i = 0; i < array.size(); ++i) {
        const json& item = array.at(i);
        const std::string base = std::format("/artifacts/{}", i);
        Artifact artifact{
            .url = item.at("url").get<std::string>(),
            .type = item.at("type").get<std::string>(),
            .platform = opt_string(item, "platform"),
            .sha256 = opt_string(item, "sha256"),
            .sha512 = opt_string(item, "sha512"),
            .custom = common::custom_props(item),
        };
        if (auto valid = at_path(primitive::validate_uri(artifact.url), base + "/url"); !valid) {
            return std::unexpected(valid.error());
        }
        if (artifact.platform) {
            if (auto valid = at_path(primitive::validate_platform(*artifact.platform), base + "/platform");
                !valid) {
                return std::unexpected(valid.error());
            }
        }
        if (auto digests = artifact.digests(); !digests) {
            pgxnmeta::Error error = digests.error();
            error.path = base + error.path;
            return std::unexpected(std::move(error));
        }
        out.push_back(std::move(artifact));
    }
    return out;
}

// ============================================================================
// Writers
// ============================================================================

[[nodiscard]] json with_custom(json object, const CustomProps& custom)
{
    common::put_custom_props(object, custom);
    return object;
}

template <typename Entry, typename Write>
void put_kind(json& contents, std::string_view kind, const std::map<std::string, Entry>& entries, Write write)
{
    if (entries.empty()) {
        return;
    }
    json out = json::object();
    for (const auto& [name, entry] : entries) {
        out[name] = with_custom(write(entry), entry.custom);
    }
    contents[std::string(kind)] = std::move(out);
}

[[nodiscard]] json contents_to_json(const Contents& contents)
{
    json out = json::object();
    put_kind(out, "extensions", contents.extensions, [](const Extension& ext) {
        json obj = {{"control", ext.control}, {"sql", ext.sql}};
        put_opt(obj, "doc", ext.doc);
        put_opt(obj, "abstract", ext.abstract);
        if (ext.tle) {
            obj["tle"] = *ext.tle;
        }
        return obj;
    });
    put_kind(out, "modules", contents.modules, [](const Module& module) {
        json obj = {{"type", module_type_name(module.type)}, {"lib", module.lib}};
        put_opt(obj, "doc", module.doc);
        put_opt(obj, "abstract", module.abstract);
        if (module.preload) {
            obj["preload"] = preload_name(*module.preload);
        }
        return obj;
    });
    put_kind(out, "apps", contents.apps, [](const App& app) {
        json obj = {{"bin", app.bin}};
        put_opt(obj, "lang", app.lang);
        put_opt(obj, "abstract", app.abstract);
        put_opt(obj, "doc", app.doc);
        put_opt(obj, "lib", app.lib);
        put_opt(obj, "man", app.man);
        put_opt(obj, "html", app.html);
        return obj;
    });
    put_kind(out, "workers", contents.workers, [](const Worker& worker) {
        json obj = {{"lib", worker.lib}};
        put_opt(obj, "doc", worker.doc);
        put_opt(obj, "abstract", worker.abstract);
        if (worker.preload) {
            obj["preload"] = preload_name(*worker.preload);
        }
        return obj;
    });
    put_kind(out, "libraries", contents.libraries, [](const Library& library) {
        json obj = {{"lib", library.lib}};
        put_opt(obj, "doc", library.doc);
        put_opt(obj, "abstract", library.abstract);
        return obj;
    });
    return with_custom(std::move(out), contents.custom);
}

[[nodiscard]] json dependencies_to_json(const Dependencies& deps)
{
    json out = json::object();
    detail::put_list(out, "platforms", deps.platforms);
    if (deps.postgres) {
        json pg = {{"version", deps.postgres->version.to_json()}};
        detail::put_list(pg, "with", deps.postgres->with);
        out["postgres"] = with_custom(std::move(pg), deps.postgres->custom);
    }
    put_opt(out, "pipeline", deps.pipeline);
    if (deps.packages) {
        json packages = json::object();
        for (const auto& [phase_name, phase] : deps.packages->phases) {
            json phase_json = json::object();
            for (const auto& [relation, map] : phase.relations) {
                json relation_json = json::object();
                for (const auto& [purl, range] : map) {
                    relation_json[purl] = range.to_json();
                }
                phase_json[relation] = std::move(relation_json);
            }
            packages[phase_name] = with_custom(std::move(phase_json), phase.custom);
        }
        out["packages"] = with_custom(std::move(packages), deps.packages->custom);
    }
    if (!deps.variations.empty()) {
        json variations = json::array();
        for (const auto& variation : deps.variations) {
            variations.push_back(with_custom({{"where", dependencies_to_json(variation.where)},
                                              {"dependencies", dependencies_to_json(variation.dependencies)}},
                                             variation.custom));
        }
        out["variations"] = std::move(variations);
    }
    return with_custom(std::move(out), deps.custom);
}

[[nodiscard]] json resources_to_json(const Resources& resources)
{
    json out = json::object();
    put_opt(out, "homepage", resources.homepage);
    put_opt(out, "issues", resources.issues);
    put_opt(out, "repository", resources.repository);
    put_opt(out, "docs", resources.docs);
    put_opt(out, "support", resources.support);
    if (!resources.badges.empty()) {
        json badges = json::array();
        for (const auto& badge : resources.badges) {
            json obj = {{"src", badge.src}, {"alt", badge.alt}};
            put_opt(obj, "url", badge.url);
            badges.push_back(with_custom(std::move(obj), badge.custom));
        }
        out["badges"] = std::move(badges);
    }
    return with_custom(std::move(out), resources.custom);
}

}  // namespace

bool Dependencies::operator==(const Dependencies&) const = default;

pgxnmeta::Result<Digests> Artifact::digests() const
{
    return Digests::make(std::nullopt, sha256, sha512);
}

pgxnmeta::Result<Distribution> Distribution::try_from(const json& document,
                                                      const schema::SchemaRegistry& registry)
{
    auto generation = detect_generation(document);
    if (!generation) {
        return std::unexpected(generation.error());
    }
    if (*generation != Generation::kV2) {
        return std::unexpected(Error::at(errc::kUnsupportedSpecVersion,
                                         "/meta-spec/version",
                                         "expected a generation 2 (meta-spec 2.x) document"));
    }
    if (auto valid = schema::require_valid(registry, kSchemaKey, document, "distribution"); !valid) {
        return std::unexpected(valid.error());
    }

    Distribution dist;
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
        dist.m_producer = opt_string(document, "producer");

        dist.m_license = document.at("license").get<std::string>();
        if (auto valid = at_path(license::validate_expression(dist.m_license), "/license"); !valid) {
            return std::unexpected(valid.error());
        }

        auto maintainers = read_maintainers(document.at("maintainers"));
        if (!maintainers) {
            return std::unexpected(maintainers.error());
        }
        dist.m_maintainers = std::move(*maintainers);

        const json& spec = document.at("meta-spec");
        auto spec_version = semver::Version::parse(spec.at("version").get<std::string>());
        if (!spec_version) {
            return std::unexpected(semantic("/meta-spec/version", spec_version.error().message));
        }
        if (spec_version->major() != 2) {
            return std::unexpected(semantic("/meta-spec/version", "meta-spec major version must be 2"));
        }
        dist.m_meta_spec = MetaSpec{
            .version = std::move(*spec_version),
            .url = opt_string(spec, "url"),
            .custom = common::custom_props(spec),
        };

        auto contents = read_contents(document.at("contents"));
        if (!contents) {
            return std::unexpected(contents.error());
        }
        dist.m_contents = std::move(*contents);

        if (document.contains("classifications")) {
            const json& cls = document.at("classifications");
            Classifications classifications{
                .tags = detail::string_list(cls, "tags"),
                .categories = detail::string_list(cls, "categories"),
                .custom = common::custom_props(cls),
            };
            for (std::size_t i = 0; i < classifications.tags.size(); ++i) {
                if (auto valid = at_path(primitive::validate_tag(classifications.tags[i]),
                                         std::format("/classifications/tags/{}", i));
                    !valid) {
                    return std::unexpected(valid.error());
                }
            }
            dist.m_classifications = std::move(classifications);
        }

        dist.m_ignore = detail::string_list(document, "ignore");
        for (std::size_t i = 0; i < dist.m_ignore.size(); ++i) {
            if (auto valid = at_path(primitive::validate_glob(dist.m_ignore[i]), std::format("/ignore/{}", i));
                !valid) {
                return std::unexpected(valid.error());
            }
        }

        if (document.contains("dependencies")) {
            auto deps = read_dependencies(document.at("dependencies"), "/dependencies", true);
            if (!deps) {
                return std::unexpected(deps.error());
            }
            dist.m_dependencies = std::move(*deps);
        }

        if (document.contains("resources")) {
            auto resources = read_resources(document.at("resources"));
            if (!resources) {
                return std::unexpected(resources.error());
            }
            dist.m_resources = std::move(*resources);
        }

        if (document.contains("artifacts")) {
            auto artifacts = read_artifacts(document.at("artifacts"));
            if (!artifacts) {
                return std::unexpected(artifacts.error());
            }
            dist.m_artifacts = std::move(*artifacts);
        }

        dist.m_custom = common::custom_props(document);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(errc::kSemanticViolation,
                                           std::format("unexpected distribution shape: {}", ex.what())));
    }

    spdlog::debug("constructed distribution {} {}", dist.m_name, dist.m_version.to_string());
    return dist;
}

pgxnmeta::Result<Distribution> Distribution::try_from(const json& document)
{
    auto registry = schema::default_registry();
    if (!registry) {
        return std::unexpected(registry.error());
    }
    return try_from(document, **registry);
}

json Distribution::to_json() const
{
    json out = {
        {"name", m_name},
        {"version", m_version.to_string()},
        {"abstract", m_abstract},
        {"license", m_license},
    };
    put_opt(out, "description", m_description);
    put_opt(out, "producer", m_producer);

    json maintainers = json::array();
    for (const auto& maintainer : m_maintainers) {
        json obj = {{"name", maintainer.name}};
        put_opt(obj, "email", maintainer.email);
        put_opt(obj, "url", maintainer.url);
        maintainers.push_back(with_custom(std::move(obj), maintainer.custom));
    }
    out["maintainers"] = std::move(maintainers);

    json spec = {{"version", m_meta_spec.version.to_string()}};
    put_opt(spec, "url", m_meta_spec.url);
    out["meta-spec"] = with_custom(std::move(spec), m_meta_spec.custom);

    out["contents"] = contents_to_json(m_contents);

    if (m_classifications) {
        json cls = json::object();
        detail::put_list(cls, "tags", m_classifications->tags);
        detail::put_list(cls, "categories", m_classifications->categories);
        out["classifications"] = with_custom(std::move(cls), m_classifications->custom);
    }
    detail::put_list(out, "ignore", m_ignore);
    if (m_dependencies) {
        out["dependencies"] = dependencies_to_json(*m_dependencies);
    }
    if (m_resources) {
        out["resources"] = resources_to_json(*m_resources);
    }
    if (!m_artifacts.empty()) {
        json artifacts = json::array();
        for (const auto& artifact : m_artifacts) {
            json obj = {{"url", artifact.url}, {"type", artifact.type}};
            put_opt(obj, "platform", artifact.platform);
            put_opt(obj, "sha256", artifact.sha256);
            put_opt(obj, "sha512", artifact.sha512);
            artifacts.push_back(with_custom(std::move(obj), artifact.custom));
        }
        out["artifacts"] = std::move(artifacts);
    }

    common::put_custom_props(out, m_custom);
    return out;
}

}  // namespace pgxnmeta
