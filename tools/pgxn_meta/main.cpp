/**
 * @file main.cpp
 * @brief pgxn_meta CLI entry point
 *
 * Validates a META.json distribution file (either generation) or, with
 * --release, a release document including its JWS payload. With --archive
 * the release digests are also checked against the archive bytes.
 */

#include "pgxnmeta/common.hpp"
#include "pgxnmeta/distribution.hpp"
#include "pgxnmeta/release.hpp"
#include "pgxnmeta/schema.hpp"
#include "pgxnmeta/version.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace {

void print_version()
{
    std::println("pgxn_meta {} ({})", pgxnmeta::kVersion, pgxnmeta::kBuildId);
    std::println("  meta-spec generations: 1, {}", pgxnmeta::kLatestGeneration);
}

void print_help()
{
    std::print(R"(pgxn_meta - Validate PGXN distribution and release metadata

Usage: pgxn_meta [options] [FILE]

Arguments:
  FILE                 Metadata file to validate (default: META.json)

Options:
  --release            Validate FILE as release metadata
  --archive FILE       Verify release digests against an archive (implies --release)
  --schema-dir DIR     Load schemas from DIR instead of the built-in directory
  --verbose            Log debug diagnostics
  --help, -h           Show this help message
  --version, -v        Show version information
)");
}

struct Options
{
    std::string file;
    std::optional<std::string> schema_dir;
    std::optional<std::string> archive;
    bool release;
    bool verbose;
    bool show_help;
    bool show_version;
};

[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> pgxnmeta::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            pgxnmeta::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] pgxnmeta::Result<Options> parse_args(std::span<char*> args)
{
    Options options{.file = "META.json",
                    .schema_dir = std::nullopt,
                    .archive = std::nullopt,
                    .release = false,
                    .verbose = false,
                    .show_help = false,
                    .show_version = false};
    bool have_file = false;
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            options.show_version = true;
            continue;
        }
        if (arg == "--release") {
            options.release = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "--schema-dir" || arg == "--archive") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (arg == "--archive") {
                options.archive = *value;
                options.release = true;
            } else {
                options.schema_dir = *value;
            }
            skip_next = true;
            continue;
        }
        if (arg.starts_with('-')) {
            return std::unexpected(
                pgxnmeta::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        if (have_file) {
            return std::unexpected(
                pgxnmeta::Error::make("InvalidArgument", std::format("Unexpected argument: {}", arg)));
        }
        options.file = std::string(arg);
        have_file = true;
    }
    return options;
}

[[nodiscard]] pgxnmeta::VoidResult validate_release(const Options& options,
                                                    const pgxnmeta::schema::SchemaRegistry& registry)
{
    auto release = pgxnmeta::Release::load_file(options.file, registry);
    if (!release) {
        return std::unexpected(release.error());
    }
    if (!release->is_signed()) {
        spdlog::warn("{} carries no PGXN signature", options.file);
    }
    if (!options.archive) {
        return {};
    }
    auto bytes = pgxnmeta::common::read_file_bytes(*options.archive);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return release->verify_archive(*bytes);
}

[[nodiscard]] int run(const Options& options)
{
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    if (options.schema_dir) {
        pgxnmeta::schema::set_default_schema_dir(*options.schema_dir);
    }
    auto registry = pgxnmeta::schema::default_registry();
    if (!registry) {
        std::println(stderr, "Error: {}", registry.error().describe());
        return 2;
    }

    pgxnmeta::VoidResult outcome;
    if (options.release) {
        outcome = validate_release(options, **registry);
    } else if (auto dist = pgxnmeta::Distribution::load_file(options.file, **registry); !dist) {
        outcome = std::unexpected(dist.error());
    }

    if (!outcome) {
        std::println(stderr, "{}: {}", options.file, outcome.error().describe());
        return 1;
    }
    std::println("{} is OK", options.file);
    return 0;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        std::span<char*> args(argv, static_cast<std::size_t>(argc));
        auto options = parse_args(args.subspan(1));
        if (!options) {
            std::println(stderr, "Error: {}", options.error().message);
            print_help();
            return 2;
        }
        if (options->show_help) {
            print_help();
            return 0;
        }
        if (options->show_version) {
            print_version();
            return 0;
        }
        return run(*options);
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
