#pragma once

/**
 * @file legacy.hpp
 * @brief Typed generation 1 distribution metadata and generation dispatch
 */

#include "pgxnmeta/common.hpp"
#include "pgxnmeta/distribution.hpp"
#include "pgxnmeta/semver.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace pgxnmeta {

/// A single v1 license name, a list of names, or names mapped to URLs.
using LegacyLicense =
    std::variant<std::string, std::vector<std::string>, std::map<std::string, std::string>>;

struct LegacyExtension
{
    std::string file;
    semver::Version version;
    std::optional<std::string> abstract;
    std::optional<std::string> docfile;
    CustomProps custom;

    bool operator==(const LegacyExtension&) const = default;
};

struct LegacyMetaSpec
{
    semver::Version version;
    std::optional<std::string> url;
    CustomProps custom;

    bool operator==(const LegacyMetaSpec&) const = default;
};

struct NoIndex
{
    std::vector<std::string> file;
    std::vector<std::string> directory;
    CustomProps custom;

    bool operator==(const NoIndex&) const = default;
};

class LegacyDistribution
{
public:
    /**
     * Build from a generation 1 document.
     *
     * prereqs and resources are schema-checked and kept as written; they
     * have no generation 2 counterpart the upgrade can fill.
     */
    [[nodiscard]] static pgxnmeta::Result<LegacyDistribution>
    try_from(const nlohmann::json& document, const schema::SchemaRegistry& registry);

    [[nodiscard]] static pgxnmeta::Result<LegacyDistribution> try_from(const nlohmann::json& document);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const semver::Version& version() const noexcept { return m_version; }
    [[nodiscard]] const std::string& abstract() const noexcept { return m_abstract; }
    [[nodiscard]] const std::optional<std::string>& description() const noexcept
    {
        return m_description;
    }
    /// Maintainer strings; a single string in the document becomes one entry.
    [[nodiscard]] const std::vector<std::string>& maintainers() const noexcept
    {
        return m_maintainers;
    }
    [[nodiscard]] const LegacyLicense& license() const noexcept { return m_license; }
    [[nodiscard]] const std::map<std::string, LegacyExtension>& provides() const noexcept
    {
        return m_provides;
    }
    [[nodiscard]] const LegacyMetaSpec& meta_spec() const noexcept { return m_meta_spec; }
    [[nodiscard]] const std::optional<std::string>& generated_by() const noexcept
    {
        return m_generated_by;
    }
    [[nodiscard]] const std::vector<std::string>& tags() const noexcept { return m_tags; }
    [[nodiscard]] const std::optional<NoIndex>& no_index() const noexcept { return m_no_index; }
    [[nodiscard]] const std::optional<nlohmann::json>& prereqs() const noexcept { return m_prereqs; }
    [[nodiscard]] const std::optional<std::string>& release_status() const noexcept
    {
        return m_release_status;
    }
    [[nodiscard]] const std::optional<nlohmann::json>& resources() const noexcept
    {
        return m_resources;
    }
    [[nodiscard]] const CustomProps& custom() const noexcept { return m_custom; }

    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const LegacyDistribution&) const = default;

private:
    LegacyDistribution() = default;

    std::string m_name;
    semver::Version m_version;
    std::string m_abstract;
    std::optional<std::string> m_description;
    std::vector<std::string> m_maintainers;
    LegacyLicense m_license;
    std::map<std::string, LegacyExtension> m_provides;
    LegacyMetaSpec m_meta_spec;
    std::optional<std::string> m_generated_by;
    std::vector<std::string> m_tags;
    std::optional<NoIndex> m_no_index;
    std::optional<nlohmann::json> m_prereqs;
    std::optional<std::string> m_release_status;
    std::optional<nlohmann::json> m_resources;
    CustomProps m_custom;
};

/// A distribution of either generation, as found in the document.
using AnyDistribution = std::variant<LegacyDistribution, Distribution>;

/**
 * Dispatch on meta-spec.version and construct the matching generation.
 * @return AnyDistribution or UnsupportedSpecVersion / construction error
 */
[[nodiscard]] pgxnmeta::Result<AnyDistribution> load_distribution(const nlohmann::json& document,
                                                                  const schema::SchemaRegistry& registry);

[[nodiscard]] pgxnmeta::Result<AnyDistribution> load_distribution(const nlohmann::json& document);

}  // namespace pgxnmeta
