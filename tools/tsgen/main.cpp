/**
 * @file main.cpp
 * @brief tsgen CLI entry point
 *
 * Commands:
 *   generate  - Analyze a backend tree and write the TypeScript client
 *   analyze   - Analyze a backend tree and dump the semantic model
 *   version   - Show version information
 */

#include "tsgen/analyzer.hpp"
#include "tsgen/canonical_json.hpp"
#include "tsgen/common.hpp"
#include "tsgen/config.hpp"
#include "tsgen/diagnostics.hpp"
#include "tsgen/render.hpp"
#include "tsgen/schema_validate.hpp"
#include "tsgen/source.hpp"
#include "tsgen/version.hpp"
#include "tsgen/writer.hpp"

#include <charconv>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef TSGEN_DEFAULT_SCHEMA_DIR
    #define TSGEN_DEFAULT_SCHEMA_DIR "schemas"
#endif

namespace {

void print_version()
{
    std::println("tsgen {} ({})", tsgen::kVersion, tsgen::kBuildId);
    std::println("  model:  {}", tsgen::kModelSchemaVersion);
    std::println("  config: {}", tsgen::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(tsgen - TypeScript client generator for Tauri backends

Usage: tsgen <command> [options]

Commands:
  generate    Analyze the backend sources and write the TypeScript client
  analyze     Analyze the backend sources and dump the semantic model
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'tsgen <command> --help' for command-specific options.
)");
}

void print_generate_help()
{
    std::print(R"(Usage: tsgen generate [options]

Analyze the backend sources and write the TypeScript client

Options:
  --config FILE             JSON configuration file
  --input-path DIR          Root of the backend source tree
  --output-path DIR         Output directory for the generated TypeScript
  --mock-api                Also emit mock implementations of every interface
  --jobs N, -j N            Number of parallel jobs (default: auto)
  --model-out FILE          Also write the semantic model as canonical JSON
  --schema-dir DIR          Path to schema directory
  --verbose                 Print every scanned file and written artifact
  --help, -h                Show this help

Either --config or both --input-path and --output-path must be provided.
Command-line values override the configuration file.

Output:
  <output>/tauria-api/<dirs>/<Module>.ts
  <output>/tauria-api/events/<Scope>EventHandlers.ts
  <output>/interface/commands/<dirs>/<Module>.ts
  <output>/interface/types/index.ts
  <output>/index.ts
)");
}

void print_analyze_help()
{
    std::print(R"(Usage: tsgen analyze [options]

Analyze the backend sources and dump the semantic model

Options:
  --input-path DIR          Root of the backend source tree (required)
  --model-out FILE, -o      Output file (default: stdout)
  --jobs N, -j N            Number of parallel jobs (default: auto)
  --schema-dir DIR          Path to schema directory
  --verbose                 Print every scanned file
  --help, -h                Show this help
)");
}

struct GenerateOptions
{
    tsgen::config::ConfigOverrides overrides;
    std::optional<std::string> model_out;
    std::string schema_dir;
    bool verbose;
    bool show_help;
};

struct AnalyzeOptions
{
    std::string input_path;
    std::optional<std::string> model_out;
    int jobs;
    std::string schema_dir;
    bool verbose;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> tsgen::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size()) {
        return std::unexpected(
            tsgen::Error::make("MissingArgument",
                               std::string("Missing value for option: ") + std::string(option)));
    }
    const char* value_ptr = args[value_index];
    if (value_ptr == nullptr) {
        return std::unexpected(
            tsgen::Error::make("MissingArgument",
                               std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(value_ptr);
}

[[nodiscard]] tsgen::Result<int> parse_jobs_value(std::string_view value)
{
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed < 0) {
        return std::unexpected(
            tsgen::Error::make("InvalidArgument",
                               std::string("Invalid --jobs value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] tsgen::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                          const nlohmann::json& payload)
{
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(tsgen::Error::make(
                "IOError",
                "Failed to create directory " + path.parent_path().string() + ": " + ec.message()));
        }
    }
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            tsgen::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    auto canonical = tsgen::canonical::canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    out << *canonical << "\n";
    if (!out) {
        return std::unexpected(
            tsgen::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

[[nodiscard]] auto set_generate_option(std::string_view arg,
                                       // CLI parsing signature is stable.
                                       // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                       std::span<char*> args,
                                       std::size_t idx,
                                       GenerateOptions& options,
                                       bool& skip_next) -> tsgen::Result<bool>
{
    if (arg == "--mock-api") {
        options.overrides.mock_api = true;
        return tsgen::Result<bool>{true};
    }
    if (arg == "--verbose") {
        options.verbose = true;
        return tsgen::Result<bool>{true};
    }
    if (arg == "--jobs" || arg == "-j") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto parsed = parse_jobs_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.overrides.jobs = *parsed;
        skip_next = true;
        return tsgen::Result<bool>{true};
    }
    if (arg != "--config" && arg != "--input-path" && arg != "--output-path" && arg != "--model-out"
        && arg != "--schema-dir") {
        return tsgen::Result<bool>{false};
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (arg == "--config") {
        options.overrides.config_file = *value;
    } else if (arg == "--input-path") {
        options.overrides.input_path = *value;
    } else if (arg == "--output-path") {
        options.overrides.output_path = *value;
    } else if (arg == "--model-out") {
        options.model_out = *value;
    } else {
        options.schema_dir = *value;
    }
    skip_next = true;
    return tsgen::Result<bool>{true};
}

[[nodiscard]] tsgen::Result<GenerateOptions> parse_generate_args(std::span<char*> args)
{
    GenerateOptions options{.overrides = {},
                            .model_out = std::nullopt,
                            .schema_dir = TSGEN_DEFAULT_SCHEMA_DIR,
                            .verbose = false,
                            .show_help = false};
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
        auto handled = set_generate_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                tsgen::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] tsgen::Result<AnalyzeOptions> parse_analyze_args(std::span<char*> args)
{
    AnalyzeOptions options{.input_path = std::string{},
                           .model_out = std::nullopt,
                           .jobs = 0,
                           .schema_dir = TSGEN_DEFAULT_SCHEMA_DIR,
                           .verbose = false,
                           .show_help = false};
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
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "--input-path") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.input_path = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--model-out" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.model_out = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--jobs" || arg == "-j") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto parsed = parse_jobs_value(*value);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            options.jobs = *parsed;
            skip_next = true;
            continue;
        }
        if (arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            tsgen::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

void print_diagnostics(const std::vector<tsgen::Diagnostic>& diagnostics)
{
    for (const auto& diagnostic : diagnostics) {
        std::println(stderr, "{}", tsgen::format_diagnostic(diagnostic));
    }
}

void print_scanned_files(const tsgen::model::SemanticModel& model)
{
    for (const auto& file : model.files) {
        std::println("  scanned: {}{}", file.path, file.parsed ? "" : " (not parsed)");
    }
}

[[nodiscard]] tsgen::Result<tsgen::model::AnalysisResult> analyze_tree(const std::string& input_path,
                                                                       int jobs)
{
    const tsgen::source::DiskFileProvider provider{std::filesystem::path(input_path)};
    const tsgen::analyzer::Analyzer analyzer(tsgen::analyzer::AnalyzeOptions{.jobs = jobs});
    return analyzer.analyze(provider);
}

[[nodiscard]] tsgen::VoidResult write_model(const tsgen::model::SemanticModel& model,
                                            const std::string& schema_dir,
                                            const std::filesystem::path& path)
{
    const nlohmann::json payload = model;
    if (auto validation = tsgen::common::validate_json(
            payload,
            tsgen::common::schema_file(schema_dir, tsgen::kModelSchemaVersion));
        !validation) {
        return std::unexpected(tsgen::Error::make(
            validation.error().code,
            "model schema validation failed: " + validation.error().message));
    }
    return write_canonical_json_file(path, payload);
}

[[nodiscard]] int run_generate(const GenerateOptions& options)
{
    auto config = tsgen::config::resolve_config(options.overrides, options.schema_dir);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }

    auto analysis = analyze_tree(config->input_path, config->jobs);
    if (!analysis) {
        std::println(stderr, "Error: analyze failed: {}", analysis.error().message);
        return 1;
    }
    if (options.verbose) {
        print_scanned_files(analysis->model);
    }
    print_diagnostics(analysis->diagnostics);

    if (options.model_out.has_value()) {
        if (auto write = write_model(analysis->model, options.schema_dir, *options.model_out); !write) {
            std::println(stderr, "Error: failed to write model: {}", write.error().message);
            return 1;
        }
    }

    const auto plans = tsgen::render::plan_artifacts(
        analysis->model,
        tsgen::render::RenderOptions{.mock_api = config->mock_api});
    const tsgen::render::TypeScriptRenderer renderer;
    auto artifacts = tsgen::render::render_artifacts(plans, renderer);
    if (!artifacts) {
        std::println(stderr, "Error: render failed: {}", artifacts.error().message);
        return 1;
    }

    tsgen::writer::DiskWriter writer{std::filesystem::path(config->output_path)};
    if (auto commit = writer.commit(*artifacts); !commit) {
        std::println(stderr, "Error: {}", commit.error().message);
        return 1;
    }

    std::println("[generate] Wrote {} artifacts", artifacts->size());
    std::println("  input:  {}", config->input_path);
    std::println("  output: {}", config->output_path);
    if (options.verbose) {
        for (const auto& artifact : *artifacts) {
            std::println("  wrote: {}", artifact.path);
        }
    }
    if (tsgen::has_errors(analysis->diagnostics)) {
        std::println(stderr, "Error: some source files could not be analyzed");
        return 1;
    }
    return 0;
}

[[nodiscard]] int run_analyze(const AnalyzeOptions& options)
{
    auto analysis = analyze_tree(options.input_path, options.jobs);
    if (!analysis) {
        std::println(stderr, "Error: analyze failed: {}", analysis.error().message);
        return 1;
    }
    if (options.verbose) {
        print_scanned_files(analysis->model);
    }
    print_diagnostics(analysis->diagnostics);

    if (options.model_out.has_value()) {
        if (auto write = write_model(analysis->model, options.schema_dir, *options.model_out); !write) {
            std::println(stderr, "Error: failed to write model: {}", write.error().message);
            return 1;
        }
        std::println("[analyze] Wrote semantic model");
        std::println("  input:  {}", options.input_path);
        std::println("  output: {}", *options.model_out);
    } else {
        const nlohmann::json payload = analysis->model;
        auto pretty = tsgen::canonical::canonicalize_pretty(payload);
        if (!pretty) {
            std::println(stderr, "Error: {}", pretty.error().message);
            return 1;
        }
        std::println("{}", *pretty);
    }
    return tsgen::has_errors(analysis->diagnostics) ? 1 : 0;
}

int cmd_generate(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_generate_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_generate_help();
        return 0;
    }
    return run_generate(*options);
}

int cmd_analyze(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analyze_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_analyze_help();
        return 0;
    }
    if (options->input_path.empty()) {
        std::println(stderr, "Error: --input-path is required");
        print_analyze_help();
        return 1;
    }
    return run_analyze(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h" || cmd == "help") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "generate") {
            return cmd_generate(sub_argc, sub_argv);
        }
        if (cmd == "analyze") {
            return cmd_analyze(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
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
