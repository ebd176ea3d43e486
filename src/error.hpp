#pragma once

#include <string>
#include <utility>

namespace tei_standoff {

enum class ErrorKind {
    None,
    Io,
    MismatchedAnchorDelimiters,
    CorruptAnnotation,
    UnknownAnchor,
    InvalidConfiguration,
    UnknownTokenizer,
    Export
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

inline bool fail(Error& error, ErrorKind kind, std::string message) {
    error.kind = kind;
    error.message = std::move(message);
    return false;
}

const char* error_kind_name(ErrorKind kind);

}  // namespace tei_standoff
