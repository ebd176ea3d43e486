#pragma once

#include "diagnostics.hpp"
#include "error.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tei_standoff {

struct ElementUsage {
    std::size_t frequency = 0;
    std::set<std::string> attributes;
    std::string first_file;
    std::size_t first_line = 0;
};

struct MarkupStatistics {
    std::map<std::string, ElementUsage> body_elements;
    std::map<std::string, ElementUsage> header_elements;
    std::map<std::string, std::size_t> references;
    std::map<std::string, std::size_t> warnings_per_file;
    std::map<std::string, std::size_t> errors_per_file;
};

// Gathers element, attribute and reference usage over many documents without
// building any annotations.
class MarkupAnalyzer {
public:
    explicit MarkupAnalyzer(std::string header_element);

    void analyze(const std::string& file_name, std::string_view content, DiagnosticSink& sink);

    const MarkupStatistics& statistics() const { return statistics_; }

private:
    std::string header_element_;
    MarkupStatistics statistics_;
};

// Per-file statistics are keyed by the path relative to input_root, or by
// file name when a source lies outside it.
bool analyze_files(
    const std::vector<std::filesystem::path>& sources,
    const std::filesystem::path& input_root,
    const std::string& header_element,
    DiagnosticSink& sink,
    MarkupStatistics& out_statistics,
    Error& error
);

// max_count > 0 limits the element listing to elements rarer than max_count.
void print_statistics(std::ostream& out, const MarkupStatistics& statistics, std::size_t max_count);

}  // namespace tei_standoff
