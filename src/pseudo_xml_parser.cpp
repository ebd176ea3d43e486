#include "pseudo_xml_parser.hpp"
#include "corpus_text.hpp"
#include "edge.hpp"
#include "html_entities.hpp"
#include "unicode_text.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace tei_standoff {
namespace {

constexpr std::string_view kByteOrderMark = "\xef\xbb\xbf";
constexpr const char* kCommentElement = "comment";
constexpr const char* kCommentAttribute = "value";

bool is_control_code(char32_t code) {
    return code < 0x20 || (code >= 0x80 && code < 0xa0);
}

}  // namespace

PseudoXmlParser::PseudoXmlParser(
    const MarkupConfig& config,
    std::string prefix,
    std::size_t corpus_size,
    DiagnosticSink& sink
)
    : config_(config),
      sink_(sink),
      anchors_(std::move(prefix), corpus_size),
      skipped_(config.skipped) {
    for (const auto& name : config_.annotation_names) {
        annotations_[name];
    }
}

void PseudoXmlParser::parse(std::string_view content) {
    MarkupLexer lexer(content);
    MarkupToken token;
    while (lexer.next(token)) {
        line_ = token.line;
        column_ = token.column;
        handle_token(token);
    }
    close();
}

void PseudoXmlParser::close() {
    if (closed_) {
        return;
    }

    if (inside_header_) {
        warn(DiagnosticKind::AutoClosedElement, "(at EOF) Autoclosing header </" + config_.header_element + ">");
        inside_header_ = false;
    }

    while (!open_elements_.empty()) {
        const OpenElement& open = open_elements_.front();
        warn(
            DiagnosticKind::AutoClosedElement,
            "(at EOF) Autoclosing tag </" + open.name + ">, starting at " + open.start
        );
        handle_end_tag(std::string(open.name));
    }
    anchor();
    closed_ = true;
}

void PseudoXmlParser::handle_token(const MarkupToken& token) {
    switch (token.kind) {
        case MarkupTokenKind::StartTag:
            handle_start_tag(token.name, token.attributes);
            if (token.self_closing) {
                handle_end_tag(token.name);
            }
            break;
        case MarkupTokenKind::EndTag:
            handle_end_tag(token.name);
            break;
        case MarkupTokenKind::Text:
            handle_text(token.text);
            break;
        case MarkupTokenKind::CharRef:
            handle_char_ref(token.name);
            break;
        case MarkupTokenKind::EntityRef:
            handle_entity_ref(token.name);
            break;
        case MarkupTokenKind::Comment:
            handle_comment(token.text);
            break;
        case MarkupTokenKind::ProcessingInstruction:
            handle_processing_instruction(token.text);
            break;
        case MarkupTokenKind::Declaration:
            error(DiagnosticKind::Declaration, "SGML declaration: <!" + token.text + ">");
            break;
        case MarkupTokenKind::Eof:
            break;
    }
}

void PseudoXmlParser::handle_start_tag(const std::string& name, const std::vector<MarkupAttribute>& attributes) {
    if (name == config_.header_element || inside_header_) {
        inside_header_ = true;
        return;
    }

    const bool element_skipped = config_.is_skipped(name, {});

    std::vector<MarkupAttribute> attrs = attributes;
    attrs.push_back(MarkupAttribute{});
    for (const auto& attr : attrs) {
        ElementAttribute elem{name, attr.name};
        if (config_.annotation_for(name, attr.name) != nullptr || skipped_.contains(elem)) {
            continue;
        }
        skipped_.insert(std::move(elem));
        if (element_skipped) {
            continue;
        }
        if (!attr.name.empty()) {
            warn(
                DiagnosticKind::SkippedElement,
                "Skipping XML element <" + name + " " + attr.name + "=" + attr.value + ">"
            );
        } else if (attributes.empty()) {
            warn(DiagnosticKind::SkippedElement, "Skipping XML element <" + name + ">");
        }
    }

    open_elements_.push_front(OpenElement{name, anchor(), std::move(attrs)});
}

void PseudoXmlParser::handle_end_tag(const std::string& name) {
    if (inside_header_) {
        inside_header_ = (name != config_.header_element);
        return;
    }

    const auto found = std::find_if(open_elements_.begin(), open_elements_.end(), [&](const OpenElement& open) {
        return open.name == name;
    });
    if (found == open_elements_.end()) {
        error(DiagnosticKind::UnmatchedEndTag, "Closing element </" + name + ">, but it is not open");
        return;
    }

    OpenElement closing = std::move(*found);
    const auto above_end = open_elements_.erase(found);
    const std::string end = anchor();

    std::string overlaps;
    for (auto it = open_elements_.begin(); it != above_end; ++it) {
        if (config_.overlap_permitted(closing.name, it->name)) {
            continue;
        }
        if (!overlaps.empty()) {
            overlaps += ", ";
        }
        overlaps += "<" + it->name + "> [" + it->start + ":]";
    }
    if (!overlaps.empty()) {
        warn(
            DiagnosticKind::OverlappingElements,
            "Tag <" + closing.name + "> [" + closing.start + ":" + end + "], overlapping with " + overlaps
        );
    }

    const std::string edge = make_edge(closing.name, AnchorSpan{closing.start, end});
    for (auto& attr : closing.attributes) {
        if (const std::string* annotation = config_.annotation_for(closing.name, attr.name)) {
            annotations_[*annotation].set(edge, std::move(attr.value));
        }
    }
    edges_.push_back(edge);
}

void PseudoXmlParser::handle_text(std::string_view content) {
    for (const char special : {'&', '<', '>'}) {
        if (content.find(special) != std::string_view::npos) {
            error(DiagnosticKind::SpecialCharacterInText, std::string("XML special character: ") + special);
        }
    }
    if (text_.empty() && content.starts_with(kByteOrderMark)) {
        content.remove_prefix(kByteOrderMark.size());
    }
    if (inside_header_) {
        return;
    }

    for_each_text_token(content, [this](std::string_view token) {
        add_token(token);
    });
}

void PseudoXmlParser::handle_char_ref(const std::string& digits) {
    char32_t code = 0;
    if (!char_ref_code(digits, code) || is_control_code(code)) {
        error(DiagnosticKind::ControlCharacterReference, "Control character reference: &#" + digits + ";");
        return;
    }
    if (inside_header_) {
        return;
    }

    std::string token;
    append_utf8(token, code);
    add_token(token);
}

void PseudoXmlParser::handle_entity_ref(const std::string& name) {
    char32_t code = 0;
    if (!lookup_html_entity(name, code)) {
        error(DiagnosticKind::UnknownEntity, "Unknown HTML entity: &" + name + ";");
        return;
    }
    if (inside_header_) {
        return;
    }

    std::string token;
    append_utf8(token, code);
    add_token(token);
}

void PseudoXmlParser::handle_comment(const std::string& comment) {
    if (comment.find("--") != std::string::npos || comment.ends_with('-')) {
        error(DiagnosticKind::MalformedComment, "Comment contains '--' or ends with '-'");
    }
    if (inside_header_) {
        warn(DiagnosticKind::CommentInHeader, "[SKIPPING] Comment in TEI header");
        return;
    }

    warn(DiagnosticKind::Comment, "Comment: " + std::to_string(comment.size()) + " characters wide");
    handle_start_tag(kCommentElement, {MarkupAttribute{kCommentAttribute, comment}});
    handle_end_tag(kCommentElement);
}

void PseudoXmlParser::handle_processing_instruction(const std::string& data) {
    if (data.starts_with("xml ") && data.ends_with('?')) {
        if (line_ != 1 || column_ != 0) {
            error(DiagnosticKind::MisplacedXmlDeclaration, "XML declaration not first in file");
        }
        return;
    }
    error(DiagnosticKind::ProcessingInstruction, "Unknown processing instruction: <?" + data + ">");
}

const std::string& PseudoXmlParser::anchor() {
    return anchors_.anchor_at(text_.size());
}

void PseudoXmlParser::add_token(std::string_view token) {
    if (token.empty()) {
        return;
    }
    anchor();
    text_.append(token);
    anchor();
}

void PseudoXmlParser::warn(DiagnosticKind kind, std::string message) {
    sink_.report(Severity::Warning, kind, line_, column_, std::move(message));
}

void PseudoXmlParser::error(DiagnosticKind kind, std::string message) {
    sink_.report(Severity::Error, kind, line_, column_, std::move(message));
}

bool parse_file(
    const std::filesystem::path& source,
    const std::string& prefix,
    const std::filesystem::path& text_path,
    const std::filesystem::path& annotation_dir,
    const MarkupConfig& config,
    DiagnosticSink& sink,
    ParseStats& out_stats,
    Error& error
) {
    out_stats = ParseStats{};

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return fail(error, ErrorKind::Io, "Failed to open markup source: " + source.string());
    }
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    const std::size_t warnings_before = sink.warnings();
    const std::size_t errors_before = sink.errors();

    PseudoXmlParser parser(config, prefix, content.size(), sink);
    parser.parse(content);

    if (!write_corpus_text(text_path, parser.text(), parser.anchors().position_to_anchor(), error)) {
        return false;
    }
    sink.info(
        "Wrote " + std::to_string(parser.text().size()) + " chars, " +
        std::to_string(parser.anchors().position_to_anchor().size()) + " anchors: " + text_path.string()
    );

    for (const auto& [name, store] : parser.annotations()) {
        const auto path = annotation_dir / name;
        if (!write_annotation(path, store.entries(), error)) {
            return false;
        }
        sink.info("Wrote " + std::to_string(store.size()) + " items: " + path.string());
    }

    out_stats.text_bytes = parser.text().size();
    out_stats.anchors = parser.anchors().position_to_anchor().size();
    out_stats.edges = parser.edges().size();
    out_stats.warnings = sink.warnings() - warnings_before;
    out_stats.errors = sink.errors() - errors_before;
    return true;
}

}  // namespace tei_standoff
