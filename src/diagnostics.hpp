#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace tei_standoff {

enum class Severity {
    Info,
    Warning,
    Error
};

enum class DiagnosticKind {
    Info,
    SkippedElement,
    UnmatchedEndTag,
    AutoClosedElement,
    OverlappingElements,
    ControlCharacterReference,
    UnknownEntity,
    CommentInHeader,
    Comment,
    MalformedComment,
    SpecialCharacterInText,
    MisplacedXmlDeclaration,
    ProcessingInstruction,
    Declaration
};

struct Diagnostic {
    Severity severity = Severity::Info;
    DiagnosticKind kind = DiagnosticKind::Info;
    std::size_t line = 0;
    std::size_t column = 0;
    std::string message;
};

using DiagnosticCallback = std::function<void(const Diagnostic&)>;

// Collects the events of one document. Not shared between threads.
class DiagnosticSink {
public:
    DiagnosticSink() = default;
    explicit DiagnosticSink(DiagnosticCallback callback);

    void report(Severity severity, DiagnosticKind kind, std::size_t line, std::size_t column, std::string message);
    void info(std::string message);

    const std::vector<Diagnostic>& events() const { return events_; }
    std::size_t warnings() const { return warnings_; }
    std::size_t errors() const { return errors_; }
    std::size_t count(DiagnosticKind kind) const;

    void clear();

private:
    DiagnosticCallback callback_;
    std::vector<Diagnostic> events_;
    std::size_t warnings_ = 0;
    std::size_t errors_ = 0;
};

const char* severity_name(Severity severity);
std::string format_diagnostic(const Diagnostic& diagnostic);

}  // namespace tei_standoff
