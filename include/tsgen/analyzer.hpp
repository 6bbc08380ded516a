#pragma once

/**
 * @file analyzer.hpp
 * @brief Analysis pipeline: Scan -> Parse -> Resolve -> Detect-Events -> Assemble
 */

#include "tsgen/common.hpp"
#include "tsgen/model.hpp"
#include "tsgen/source.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace tsgen::analyzer {

struct AnalyzeOptions
{
    int jobs = 0;  ///< worker threads, 0 = hardware concurrency
};

/**
 * Parse one file and run every per-file phase on it (first-pass type
 * resolution, command and type building, event detection). A syntax error
 * yields an unparsed FileAnalysis carrying one SyntaxError diagnostic.
 */
[[nodiscard]] model::FileAnalysis analyze_file(const std::string& path, std::string_view text);

/// Worker count for @p work items: @p jobs, or hardware concurrency when 0; never 0.
[[nodiscard]] std::size_t resolve_jobs(int jobs, std::size_t work);

class Analyzer
{
public:
    explicit Analyzer(AnalyzeOptions options = {});

    /**
     * Analyze the tree behind @p provider.
     *
     * Per-file failures become diagnostics; only an unlistable input root
     * or a broken internal invariant fails the whole run.
     */
    [[nodiscard]] tsgen::Result<model::AnalysisResult> analyze(const source::FileProvider& provider) const;

private:
    AnalyzeOptions m_options;
};

}  // namespace tsgen::analyzer
