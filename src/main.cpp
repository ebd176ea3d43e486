#include "config.hpp"
#include "corpus_text.hpp"
#include "diagnostics.hpp"
#include "markup_analyzer.hpp"
#include "markup_config.hpp"
#include "pipeline.hpp"
#include "segment_rechunker.hpp"
#include "span_tokenizer.hpp"
#include "writer_xml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace tei_standoff;

namespace {

bool has_xml_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".xml";
}

bool collect_input_files(
    const std::filesystem::path& input,
    std::vector<std::filesystem::path>& out_files,
    std::string& error
) {
    out_files.clear();

    if (!std::filesystem::exists(input)) {
        error = "Input path does not exist: " + input.string();
        return false;
    }

    if (std::filesystem::is_regular_file(input)) {
        out_files.push_back(input);
        return true;
    }

    if (!std::filesystem::is_directory(input)) {
        error = "Input path is neither file nor directory: " + input.string();
        return false;
    }

    for (const auto& entry : std::filesystem::recursive_directory_iterator(input)) {
        if (entry.is_regular_file() && has_xml_extension(entry.path())) {
            out_files.push_back(entry.path());
        }
    }

    std::sort(out_files.begin(), out_files.end());

    if (out_files.empty()) {
        error = "No XML files found under: " + input.string();
        return false;
    }

    return true;
}

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

void print_progress(std::size_t done, std::size_t total, bool finished) {
    if (total == 0) {
        return;
    }

    const double fraction = static_cast<double>(done) / static_cast<double>(total);
    const auto pct = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100.0);

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(fraction, 30)
        << "] "
        << std::setw(3) << pct << "% "
        << "documents " << done << "/" << total;

    std::cerr << line.str();
    if (finished) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

DiagnosticCallback stderr_printer(bool quiet) {
    return [quiet](const Diagnostic& diagnostic) {
        if (quiet && diagnostic.severity != Severity::Error) {
            return;
        }
        std::cerr << format_diagnostic(diagnostic) << "\n";
    };
}

std::string document_id(const std::filesystem::path& input_root, bool root_is_dir, const std::filesystem::path& file) {
    std::filesystem::path rel = root_is_dir ? std::filesystem::relative(file, input_root) : file.filename();
    rel.replace_extension();
    std::string id = rel.generic_string();
    std::replace(id.begin(), id.end(), '/', '_');
    return id;
}

int run_parse(const AppConfig& config) {
    std::string error;
    MarkupConfig markup;
    Error config_error;
    if (!build_markup_config(config.markup, markup, config_error)) {
        std::cerr << "[fatal] " << config_error.message << "\n";
        return 1;
    }

    std::vector<std::filesystem::path> input_files;
    if (!collect_input_files(config.input_path, input_files, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    const bool input_is_dir = std::filesystem::is_directory(config.input_path);
    std::vector<ParseJob> jobs;
    jobs.reserve(input_files.size());
    for (const auto& file : input_files) {
        ParseJob job;
        job.source = file;
        job.prefix = document_id(config.input_path, input_is_dir, file);
        job.annotation_dir = config.output_path / job.prefix;
        job.text_path = job.annotation_dir / "text";
        jobs.push_back(std::move(job));
    }

    auto progress_callback = [&](std::size_t done, std::size_t total) {
        if (config.show_progress) {
            print_progress(done, total, done == total);
        }
    };

    std::vector<ParseJobResult> results;
    BatchStats stats;
    const bool all_ok = parse_documents_parallel(jobs, markup, config.workers, results, stats, error, progress_callback);

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        const auto& result = results[i];
        for (const auto& diagnostic : result.diagnostics) {
            if (diagnostic.severity == Severity::Info) {
                continue;
            }
            if (config.quiet && diagnostic.severity != Severity::Error) {
                continue;
            }
            std::cerr << jobs[i].source.filename().string() << " " << format_diagnostic(diagnostic) << "\n";
        }
        if (!result.ok) {
            std::cerr << "[error] " << jobs[i].source.string() << ": " << result.error << "\n";
            continue;
        }
        if (!config.quiet) {
            std::cout
                << "[ok] " << jobs[i].source.filename().string()
                << " chars=" << result.stats.text_bytes
                << " anchors=" << result.stats.anchors
                << " edges=" << result.stats.edges
                << " warnings=" << result.stats.warnings
                << " errors=" << result.stats.errors
                << "\n";
        }
    }

    std::cout
        << "[summary] documents=" << stats.documents_total
        << " failed=" << stats.documents_failed
        << " workers=" << stats.workers_used
        << " time_ms=" << stats.wall_time.count()
        << " doc_per_sec=" << stats.documents_per_second
        << "\n";

    if (!all_ok) {
        std::cerr << "[error] " << error << "\n";
        return 1;
    }
    return 0;
}

int run_segment(const AppConfig& config) {
    Error error;
    const auto tokenizer = make_span_tokenizer(config.segmenter, error);
    if (!tokenizer) {
        std::cerr << "[fatal] " << error.message << "\n";
        return 1;
    }

    SegmentFileOptions options;
    options.text_path = config.text_path;
    options.chunk_path = config.chunk_path;
    options.existing_path = config.existing_path;
    options.out_path = config.output_path;
    options.element = config.element;
    options.prefix = config.prefix;

    DiagnosticSink sink(stderr_printer(config.quiet));
    std::size_t new_edges = 0;
    if (!segment_file(options, *tokenizer, sink, new_edges, error)) {
        std::cerr << "[fatal] " << error_kind_name(error.kind) << ": " << error.message << "\n";
        return 1;
    }

    std::cout << "[ok] " << config.output_path.string() << " new_edges=" << new_edges << "\n";
    return 0;
}

int run_export_xml(const AppConfig& config) {
    Error error;
    MarkupConfig markup;
    if (!build_markup_config(config.markup, markup, error)) {
        std::cerr << "[fatal] " << error.message << "\n";
        return 1;
    }

    CorpusText corpus;
    if (!read_corpus_text(config.text_path, corpus, error)) {
        std::cerr << "[fatal] " << error.message << "\n";
        return 1;
    }

    AnnotationSet annotations;
    for (const auto& name : markup.annotation_names) {
        const auto path = config.annotation_dir / name;
        if (!std::filesystem::exists(path)) {
            std::cerr << "[skip] missing annotation " << path.string() << "\n";
            continue;
        }
        if (!read_annotation(path, annotations[name], error)) {
            std::cerr << "[fatal] " << error.message << "\n";
            return 1;
        }
    }

    XmlExportOptions options;
    options.root_name = config.root_name;
    options.doc_id = config.doc_id;
    options.include_empty_attributes = config.include_empty_attributes;

    if (!write_xml_output(config.output_path, corpus, markup, annotations, options, error)) {
        std::cerr << "[fatal] " << error.message << "\n";
        return 1;
    }

    std::cout << "[ok] " << config.output_path.string() << "\n";
    return 0;
}

int run_analyze(const AppConfig& config) {
    std::string error;
    std::vector<std::filesystem::path> input_files;
    if (!collect_input_files(config.input_path, input_files, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    DiagnosticSink sink(stderr_printer(config.quiet));
    MarkupStatistics statistics;
    Error analyze_error;
    const std::string header = config.markup.header.empty() ? std::string(kDefaultHeaderElement) : config.markup.header;
    if (!analyze_files(input_files, config.input_path, header, sink, statistics, analyze_error)) {
        std::cerr << "[fatal] " << analyze_error.message << "\n";
        return 1;
    }

    print_statistics(std::cout, statistics, config.max_count);
    std::cout << "[summary] warnings=" << sink.warnings() << " errors=" << sink.errors() << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    switch (config.command) {
        case Command::Parse:
            return run_parse(config);
        case Command::Segment:
            return run_segment(config);
        case Command::ExportXml:
            return run_export_xml(config);
        case Command::Analyze:
            return run_analyze(config);
        case Command::None:
            break;
    }

    print_usage(argv[0]);
    return 1;
}
