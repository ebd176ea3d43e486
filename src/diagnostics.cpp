#include "diagnostics.hpp"
#include "error.hpp"

#include <algorithm>
#include <sstream>

namespace tei_standoff {

DiagnosticSink::DiagnosticSink(DiagnosticCallback callback)
    : callback_(std::move(callback)) {}

void DiagnosticSink::report(
    Severity severity,
    DiagnosticKind kind,
    std::size_t line,
    std::size_t column,
    std::string message
) {
    Diagnostic event;
    event.severity = severity;
    event.kind = kind;
    event.line = line;
    event.column = column;
    event.message = std::move(message);

    if (severity == Severity::Warning) {
        ++warnings_;
    } else if (severity == Severity::Error) {
        ++errors_;
    }

    if (callback_) {
        callback_(event);
    }
    events_.push_back(std::move(event));
}

void DiagnosticSink::info(std::string message) {
    report(Severity::Info, DiagnosticKind::Info, 0, 0, std::move(message));
}

std::size_t DiagnosticSink::count(DiagnosticKind kind) const {
    return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(), [kind](const Diagnostic& e) {
        return e.kind == kind;
    }));
}

void DiagnosticSink::clear() {
    events_.clear();
    warnings_ = 0;
    errors_ = 0;
}

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:
            return "info";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const Diagnostic& diagnostic) {
    std::ostringstream line;
    line << "[" << severity_name(diagnostic.severity) << "] ";
    if (diagnostic.line > 0) {
        line << "{" << diagnostic.line << ":" << diagnostic.column << "} ";
    }
    line << diagnostic.message;
    return line.str();
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Io:
            return "io";
        case ErrorKind::MismatchedAnchorDelimiters:
            return "mismatched-anchor-delimiters";
        case ErrorKind::CorruptAnnotation:
            return "corrupt-annotation";
        case ErrorKind::UnknownAnchor:
            return "unknown-anchor";
        case ErrorKind::InvalidConfiguration:
            return "invalid-configuration";
        case ErrorKind::UnknownTokenizer:
            return "unknown-tokenizer";
        case ErrorKind::Export:
            return "export";
    }
    return "unknown";
}

}  // namespace tei_standoff
