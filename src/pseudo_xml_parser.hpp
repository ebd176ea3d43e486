#pragma once

#include "anchor_store.hpp"
#include "annotation_file.hpp"
#include "diagnostics.hpp"
#include "error.hpp"
#include "markup_config.hpp"
#include "markup_lexer.hpp"

#include <cstddef>
#include <filesystem>
#include <list>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tei_standoff {

// Turns one pseudo-XML document into anchored text plus one annotation store
// per configured annotation name. Elements may overlap: an end tag closes the
// most recently opened element of the same name, wherever it sits among the
// open elements.
class PseudoXmlParser {
public:
    PseudoXmlParser(const MarkupConfig& config, std::string prefix, std::size_t corpus_size, DiagnosticSink& sink);

    // Consumes a complete document and closes it.
    void parse(std::string_view content);

    // Auto-closes elements left open and anchors the final position.
    void close();

    const std::string& text() const { return text_; }
    const AnchorStore& anchors() const { return anchors_; }
    const std::map<std::string, AnnotationStore>& annotations() const { return annotations_; }
    // Every edge formed so far, in closing order, configured or not.
    const std::vector<std::string>& edges() const { return edges_; }
    std::size_t open_element_count() const { return open_elements_.size(); }

private:
    struct OpenElement {
        std::string name;
        std::string start;
        std::vector<MarkupAttribute> attributes;
    };

    void handle_token(const MarkupToken& token);
    void handle_start_tag(const std::string& name, const std::vector<MarkupAttribute>& attributes);
    void handle_end_tag(const std::string& name);
    void handle_text(std::string_view content);
    void handle_char_ref(const std::string& digits);
    void handle_entity_ref(const std::string& name);
    void handle_comment(const std::string& comment);
    void handle_processing_instruction(const std::string& data);

    const std::string& anchor();
    void add_token(std::string_view token);
    void warn(DiagnosticKind kind, std::string message);
    void error(DiagnosticKind kind, std::string message);

    MarkupConfig config_;
    DiagnosticSink& sink_;
    AnchorStore anchors_;
    std::set<ElementAttribute> skipped_;
    // Most recently opened first.
    std::list<OpenElement> open_elements_;
    bool inside_header_ = false;
    bool closed_ = false;
    std::size_t line_ = 1;
    std::size_t column_ = 0;
    std::string text_;
    std::map<std::string, AnnotationStore> annotations_;
    std::vector<std::string> edges_;
};

struct ParseStats {
    std::size_t text_bytes = 0;
    std::size_t anchors = 0;
    std::size_t edges = 0;
    std::size_t warnings = 0;
    std::size_t errors = 0;
};

// Parses source and writes text_path plus annotation_dir/<annotation name>
// for every configured annotation.
bool parse_file(
    const std::filesystem::path& source,
    const std::string& prefix,
    const std::filesystem::path& text_path,
    const std::filesystem::path& annotation_dir,
    const MarkupConfig& config,
    DiagnosticSink& sink,
    ParseStats& out_stats,
    Error& error
);

}  // namespace tei_standoff
