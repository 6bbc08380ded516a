/**
 * @file analyzer.cpp
 * @brief Analyzer: parallel per-file phases, then cross-file resolution and assembly
 */

#include "tsgen/analyzer.hpp"
#include "tsgen/events.hpp"
#include "tsgen/version.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>
#include <thread>
#include <utility>
#include <vector>

namespace tsgen::analyzer {

namespace {

/**
 * Run fn(i) for every i in [0, count) on @p jobs threads.
 * Each index is claimed exactly once; results are stored by index, so the
 * joined result does not depend on completion order.
 */
template <typename Fn>
void run_indexed(std::size_t count, std::size_t jobs, Fn&& fn)
{
    if (jobs <= 1 || count <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }
    std::atomic<std::size_t> next{0};
    std::vector<std::thread> workers;
    workers.reserve(jobs);
    for (std::size_t w = 0; w < jobs; ++w) {
        workers.emplace_back([&next, count, &fn] {
            for (std::size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                fn(i);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

}  // namespace

model::FileAnalysis analyze_file(const std::string& path, std::string_view text)
{
    model::FileAnalysis analysis;
    analysis.file.path = path;
    analysis.file.module_path = model::module_path_of(path);

    auto parsed = syntax::parse_source(path, text);
    if (!parsed) {
        const auto& error = parsed.error();
        analysis.diagnostics.push_back(Diagnostic::error(
            diag::kSyntaxError,
            SourceLocation{.file = path, .line = error.line, .column = error.column},
            error.reason));
        return analysis;
    }

    analysis.file.parsed = true;
    analysis.file.aliases = parsed->aliases;

    types::TypeResolver resolver(parsed->aliases, analysis.diagnostics);
    analysis.commands = model::build_commands(*parsed, resolver, analysis.diagnostics);
    analysis.types = model::build_types(*parsed, resolver);
    analysis.events = events::EventDetector(*parsed, resolver, analysis.diagnostics).detect();
    return analysis;
}

std::size_t resolve_jobs(int jobs, std::size_t work)
{
    std::size_t count = jobs > 0 ? static_cast<std::size_t>(jobs) : std::thread::hardware_concurrency();
    count = std::min(count, work);
    return std::max<std::size_t>(count, 1);
}

Analyzer::Analyzer(AnalyzeOptions options)
    : m_options(options)
{}

tsgen::Result<model::AnalysisResult> Analyzer::analyze(const source::FileProvider& provider) const
{
    // Scan
    auto listed = provider.list();
    if (!listed) {
        return std::unexpected(listed.error());
    }
    const std::vector<std::string>& paths = *listed;

    // Parse + first-pass resolve + detect, per file
    std::vector<model::FileAnalysis> files(paths.size());
    run_indexed(paths.size(), resolve_jobs(m_options.jobs, paths.size()), [&](std::size_t i) {
        auto text = provider.read(paths[i]);
        if (!text) {
            model::FileAnalysis failed;
            failed.file.path = paths[i];
            failed.file.module_path = model::module_path_of(paths[i]);
            failed.diagnostics.push_back(Diagnostic::error(diag::kSourceReadFailed,
                                                           SourceLocation{.file = paths[i]},
                                                           text.error().message));
            files[i] = std::move(failed);
            return;
        }
        files[i] = analyze_file(paths[i], *text);
    });

    model::AnalysisResult result;
    for (auto& file : files) {
        std::ranges::move(file.diagnostics, std::back_inserter(result.diagnostics));
        file.diagnostics.clear();
    }

    // Second pass
    model::resolve_references(files, result.diagnostics);
    model::check_type_collisions(files, result.diagnostics);

    // Events, scan order
    std::vector<events::EventSite> sites;
    for (const auto& file : files) {
        sites.insert(sites.end(), file.events.begin(), file.events.end());
    }

    auto& semantic = result.model;
    semantic.schema_version = kModelSchemaVersion;
    semantic.events = events::merge_event_sites(sites, result.diagnostics);
    for (const auto& file : files) {
        semantic.files.push_back(file.file);
    }

    // Assemble
    auto root = model::assemble_module_tree(files, result.diagnostics);
    if (!root) {
        return std::unexpected(root.error());
    }
    semantic.root = std::move(*root);

    sort_diagnostics(result.diagnostics);
    return result;
}

}  // namespace tsgen::analyzer
