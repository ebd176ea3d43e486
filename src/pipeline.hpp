#pragma once

#include "diagnostics.hpp"
#include "markup_config.hpp"
#include "pseudo_xml_parser.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace tei_standoff {

struct ParseJob {
    std::filesystem::path source;
    std::string prefix;
    std::filesystem::path text_path;
    std::filesystem::path annotation_dir;
};

struct ParseJobResult {
    bool ok = false;
    ParseStats stats;
    std::string error;
    std::vector<Diagnostic> diagnostics;
};

struct BatchStats {
    std::size_t documents_total = 0;
    std::size_t documents_failed = 0;
    std::size_t workers_used = 0;
    std::chrono::milliseconds wall_time{0};
    double documents_per_second = 0.0;
};

// Parses one job into its output files. The default is parse_file.
using DocumentParser =
    std::function<bool(const ParseJob&, const MarkupConfig&, DiagnosticSink&, ParseStats&, Error&)>;

// Each document gets its own parser and anchor store, so results do not
// depend on scheduling. A failing document does not stop the others.
bool parse_documents_parallel(
    const std::vector<ParseJob>& jobs,
    const MarkupConfig& config,
    std::size_t workers,
    std::vector<ParseJobResult>& out_results,
    BatchStats& out_stats,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback = {}
);

// Exceptions thrown by parser fail only the job that raised them.
bool parse_documents_parallel(
    const std::vector<ParseJob>& jobs,
    const MarkupConfig& config,
    std::size_t workers,
    const DocumentParser& parser,
    std::vector<ParseJobResult>& out_results,
    BatchStats& out_stats,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback = {}
);

}  // namespace tei_standoff
