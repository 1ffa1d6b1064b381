#pragma once

/**
 * @file distribution.hpp
 * @brief Typed generation 2 distribution metadata (META.json)
 *
 * A Distribution is only ever built by try_from(): the document must pass
 * the v2 distribution schema, every constrained string is re-checked by its
 * grammar, and the cross-field rules are enforced. Values are immutable.
 */

#include "pgxnmeta/common.hpp"
#include "pgxnmeta/digest.hpp"
#include "pgxnmeta/generation.hpp"
#include "pgxnmeta/semver.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgxnmeta {

namespace schema {
class SchemaRegistry;
}  // namespace schema

struct Maintainer
{
    std::string name;
    std::optional<std::string> email;
    std::optional<std::string> url;
    CustomProps custom;

    bool operator==(const Maintainer&) const = default;
};

struct Extension
{
    std::string control;
    std::string sql;
    std::optional<std::string> doc;
    std::optional<std::string> abstract;
    std::optional<bool> tle;
    CustomProps custom;

    bool operator==(const Extension&) const = default;
};

enum class ModuleType {
    kExtension,
    kHook,
    kBgw
};

enum class Preload {
    kServer,
    kSession
};

struct Module
{
    ModuleType type = ModuleType::kExtension;
    std::string lib;
    std::optional<std::string> doc;
    std::optional<std::string> abstract;
    std::optional<Preload> preload;
    CustomProps custom;

    bool operator==(const Module&) const = default;
};

struct App
{
    std::string bin;
    std::optional<std::string> lang;
    std::optional<std::string> abstract;
    std::optional<std::string> doc;
    std::optional<std::string> lib;
    std::optional<std::string> man;
    std::optional<std::string> html;
    CustomProps custom;

    bool operator==(const App&) const = default;
};

struct Worker
{
    std::string lib;
    std::optional<std::string> doc;
    std::optional<std::string> abstract;
    std::optional<Preload> preload;
    CustomProps custom;

    bool operator==(const Worker&) const = default;
};

struct Library
{
    std::string lib;
    std::optional<std::string> doc;
    std::optional<std::string> abstract;
    CustomProps custom;

    bool operator==(const Library&) const = default;
};

/**
 * @brief Everything the distribution provides, keyed by kind then by name
 */
struct Contents
{
    std::map<std::string, Extension> extensions;
    std::map<std::string, Module> modules;
    std::map<std::string, App> apps;
    std::map<std::string, Worker> workers;
    std::map<std::string, Library> libraries;
    CustomProps custom;

    [[nodiscard]] bool empty() const noexcept
    {
        return extensions.empty() && modules.empty() && apps.empty() && workers.empty()
               && libraries.empty();
    }

    bool operator==(const Contents&) const = default;
};

struct MetaSpec
{
    semver::Version version;
    std::optional<std::string> url;
    CustomProps custom;

    bool operator==(const MetaSpec&) const = default;
};

struct Classifications
{
    std::vector<std::string> tags;
    std::vector<std::string> categories;
    CustomProps custom;

    bool operator==(const Classifications&) const = default;
};

struct Postgres
{
    semver::VersionRange version;
    std::vector<std::string> with;
    CustomProps custom;

    bool operator==(const Postgres&) const = default;
};

/// Purl (as written) to version range.
using PackageMap = std::map<std::string, semver::VersionRange>;

/**
 * @brief Packages for one phase, keyed by relation
 * (requires, recommends, suggests, conflicts)
 */
struct Phase
{
    std::map<std::string, PackageMap> relations;
    CustomProps custom;

    bool operator==(const Phase&) const = default;
};

/**
 * @brief Phases keyed by name (configure, build, test, run, develop)
 */
struct Packages
{
    std::map<std::string, Phase> phases;
    CustomProps custom;

    bool operator==(const Packages&) const = default;
};

struct Variation;

struct Dependencies
{
    std::vector<std::string> platforms;
    std::optional<Postgres> postgres;
    std::optional<std::string> pipeline;
    std::optional<Packages> packages;
    std::vector<Variation> variations;
    CustomProps custom;

    bool operator==(const Dependencies&) const;
};

/// Variations never carry variations of their own.
struct Variation
{
    Dependencies where;
    Dependencies dependencies;
    CustomProps custom;

    bool operator==(const Variation&) const = default;
};

struct Badge
{
    std::string src;
    std::string alt;
    std::optional<std::string> url;
    CustomProps custom;

    bool operator==(const Badge&) const = default;
};

struct Resources
{
    std::optional<std::string> homepage;
    std::optional<std::string> issues;
    std::optional<std::string> repository;
    std::optional<std::string> docs;
    std::optional<std::string> support;
    std::vector<Badge> badges;
    CustomProps custom;

    bool operator==(const Resources&) const = default;
};

struct Artifact
{
    std::string url;
    std::string type;
    std::optional<std::string> platform;
    std::optional<std::string> sha256;
    std::optional<std::string> sha512;
    CustomProps custom;

    /// The artifact's sha256/sha512 as a digest set.
    [[nodiscard]] pgxnmeta::Result<Digests> digests() const;

    bool operator==(const Artifact&) const = default;
};

class Distribution
{
public:
    /**
     * Build from a generation 2 document.
     *
     * @return Distribution, or UnsupportedSpecVersion, SchemaViolation
     *         (with every violation) or SemanticViolation (with field path)
     */
    [[nodiscard]] static pgxnmeta::Result<Distribution>
    try_from(const nlohmann::json& document, const schema::SchemaRegistry& registry);

    /// try_from() against the default schema registry.
    [[nodiscard]] static pgxnmeta::Result<Distribution> try_from(const nlohmann::json& document);

    /**
     * Build from a document of either generation, upgrading generation 1.
     */
    [[nodiscard]] static pgxnmeta::Result<Distribution>
    load(const nlohmann::json& document, const schema::SchemaRegistry& registry);

    [[nodiscard]] static pgxnmeta::Result<Distribution> load(const nlohmann::json& document);

    /**
     * Read a META.json file and load() it.
     * @return Distribution, IOError, ParseError or any load() error
     */
    [[nodiscard]] static pgxnmeta::Result<Distribution>
    load_file(const std::filesystem::path& path, const schema::SchemaRegistry& registry);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const semver::Version& version() const noexcept { return m_version; }
    [[nodiscard]] const std::string& abstract() const noexcept { return m_abstract; }
    [[nodiscard]] const std::optional<std::string>& description() const noexcept
    {
        return m_description;
    }
    [[nodiscard]] const std::optional<std::string>& producer() const noexcept { return m_producer; }
    [[nodiscard]] const std::string& license() const noexcept { return m_license; }
    [[nodiscard]] const std::vector<Maintainer>& maintainers() const noexcept
    {
        return m_maintainers;
    }
    [[nodiscard]] const MetaSpec& meta_spec() const noexcept { return m_meta_spec; }
    [[nodiscard]] const Contents& contents() const noexcept { return m_contents; }
    [[nodiscard]] const std::optional<Classifications>& classifications() const noexcept
    {
        return m_classifications;
    }
    [[nodiscard]] const std::vector<std::string>& ignore() const noexcept { return m_ignore; }
    [[nodiscard]] const std::optional<Dependencies>& dependencies() const noexcept
    {
        return m_dependencies;
    }
    [[nodiscard]] const std::optional<Resources>& resources() const noexcept
    {
        return m_resources;
    }
    [[nodiscard]] const std::vector<Artifact>& artifacts() const noexcept { return m_artifacts; }
    [[nodiscard]] const CustomProps& custom() const noexcept { return m_custom; }

    /// Serialize back to a v2 META.json document.
    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const Distribution&) const = default;

private:
    Distribution() = default;

    std::string m_name;
    semver::Version m_version;
    std::string m_abstract;
    std::optional<std::string> m_description;
    std::optional<std::string> m_producer;
    std::string m_license;
    std::vector<Maintainer> m_maintainers;
    MetaSpec m_meta_spec;
    Contents m_contents;
    std::optional<Classifications> m_classifications;
    std::vector<std::string> m_ignore;
    std::optional<Dependencies> m_dependencies;
    std::optional<Resources> m_resources;
    std::vector<Artifact> m_artifacts;
    CustomProps m_custom;
};

}  // namespace pgxnmeta
