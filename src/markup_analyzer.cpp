#include "markup_analyzer.hpp"
#include "markup_lexer.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <list>
#include <utility>

namespace tei_standoff {

MarkupAnalyzer::MarkupAnalyzer(std::string header_element)
    : header_element_(std::move(header_element)) {}

void MarkupAnalyzer::analyze(const std::string& file_name, std::string_view content, DiagnosticSink& sink) {
    struct OpenTag {
        std::string name;
        std::size_t line;
        std::size_t column;
    };

    std::list<OpenTag> open_tags;
    bool inside_header = false;
    std::size_t& warnings = statistics_.warnings_per_file[file_name];
    std::size_t& errors = statistics_.errors_per_file[file_name];

    auto position = [](std::size_t line, std::size_t column) {
        return "{" + std::to_string(line) + ":" + std::to_string(column) + "}";
    };

    auto close_tag = [&](const std::string& name, std::size_t line, std::size_t column) {
        if (inside_header) {
            inside_header = (name != header_element_);
        }
        const auto found = std::find_if(open_tags.begin(), open_tags.end(), [&](const OpenTag& open) {
            return open.name == name;
        });
        if (found == open_tags.end()) {
            sink.report(Severity::Error, DiagnosticKind::UnmatchedEndTag, line, column,
                "Closing element </" + name + ">, but it is not open");
            ++errors;
            return;
        }
        if (found != open_tags.begin()) {
            std::string overlaps;
            for (auto it = open_tags.begin(); it != found; ++it) {
                overlaps += (overlaps.empty() ? "<" : ", <") + it->name + "> at " + position(it->line, it->column);
            }
            sink.report(Severity::Warning, DiagnosticKind::OverlappingElements, line, column,
                "Tag <" + name + "> at " + position(found->line, found->column) + " - " + position(line, column) +
                    ", overlapping with " + overlaps);
            ++warnings;
        }
        open_tags.erase(found);
    };

    MarkupLexer lexer(content);
    MarkupToken token;
    while (lexer.next(token)) {
        switch (token.kind) {
            case MarkupTokenKind::StartTag: {
                if (token.name == header_element_) {
                    inside_header = true;
                }
                auto& usage = inside_header ? statistics_.header_elements[token.name]
                                            : statistics_.body_elements[token.name];
                if (usage.frequency++ == 0) {
                    usage.first_file = file_name;
                    usage.first_line = token.line;
                }
                for (const auto& attr : token.attributes) {
                    usage.attributes.insert(attr.name);
                }
                open_tags.push_front(OpenTag{token.name, token.line, token.column});
                if (token.self_closing) {
                    close_tag(token.name, token.line, token.column);
                }
                break;
            }
            case MarkupTokenKind::EndTag:
                close_tag(token.name, token.line, token.column);
                break;
            case MarkupTokenKind::CharRef:
                ++statistics_.references["#" + token.name];
                break;
            case MarkupTokenKind::EntityRef:
                ++statistics_.references[token.name];
                break;
            case MarkupTokenKind::Eof:
                while (!open_tags.empty()) {
                    const OpenTag open = open_tags.front();
                    sink.report(Severity::Error, DiagnosticKind::AutoClosedElement, token.line, token.column,
                        "(at EOF) Autoclosing tag </" + open.name + ">, starting at " + position(open.line, open.column));
                    ++errors;
                    close_tag(open.name, token.line, token.column);
                }
                break;
            default:
                break;
        }
    }
}

namespace {

std::string source_name(const std::filesystem::path& source, const std::filesystem::path& input_root) {
    const auto relative = source.lexically_relative(input_root);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return source.filename().string();
    }
    return relative.generic_string();
}

}  // namespace

bool analyze_files(
    const std::vector<std::filesystem::path>& sources,
    const std::filesystem::path& input_root,
    const std::string& header_element,
    DiagnosticSink& sink,
    MarkupStatistics& out_statistics,
    Error& error
) {
    MarkupAnalyzer analyzer(header_element);
    for (const auto& source : sources) {
        std::ifstream in(source, std::ios::binary);
        if (!in) {
            return fail(error, ErrorKind::Io, "Failed to open markup source: " + source.string());
        }
        const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        sink.info(source.string());
        analyzer.analyze(source_name(source, input_root), content, sink);
    }
    out_statistics = analyzer.statistics();
    return true;
}

void print_statistics(std::ostream& out, const MarkupStatistics& statistics, std::size_t max_count) {
    auto print_elements = [&](const char* title, const std::map<std::string, ElementUsage>& elements) {
        out << title << "\n";
        for (const auto& [name, usage] : elements) {
            if (max_count > 0 && usage.frequency >= max_count) {
                continue;
            }
            out << "  " << std::left << std::setw(20) << name << std::right << std::setw(8) << usage.frequency;
            std::string attrs;
            for (const auto& attr : usage.attributes) {
                attrs += attrs.empty() ? attr : " " + attr;
            }
            out << "  [" << attrs << "]  " << usage.first_file << ":" << usage.first_line << "\n";
        }
    };

    print_elements("Header elements:", statistics.header_elements);
    print_elements("Elements:", statistics.body_elements);

    out << "References:\n";
    for (const auto& [name, count] : statistics.references) {
        out << "  &" << std::left << std::setw(19) << name << std::right << std::setw(8) << count << "\n";
    }

    out << "Files:\n";
    for (const auto& [file, warnings] : statistics.warnings_per_file) {
        const auto errors = statistics.errors_per_file.find(file);
        out << "  " << file << " warnings=" << warnings
            << " errors=" << (errors == statistics.errors_per_file.end() ? 0 : errors->second) << "\n";
    }
}

}  // namespace tei_standoff
