#include "markup_lexer.hpp"
#include "html_entities.hpp"
#include "unicode_text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace tei_standoff {
namespace {

bool is_ascii_letter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '.' || c == '_' || c == ':';
}

bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Scans a reference starting at '&'. Returns the length consumed (0 if none).
std::size_t scan_reference(std::string_view input, std::size_t pos, bool require_semicolon, MarkupToken& out) {
    std::size_t p = pos + 1;
    if (p >= input.size()) {
        return 0;
    }

    if (input[p] == '#') {
        ++p;
        std::string digits;
        if (p < input.size() && (input[p] == 'x' || input[p] == 'X')) {
            ++p;
            digits.push_back('x');
            while (p < input.size() && std::isxdigit(static_cast<unsigned char>(input[p]))) {
                digits.push_back(input[p++]);
            }
        } else {
            while (p < input.size() && std::isdigit(static_cast<unsigned char>(input[p]))) {
                digits.push_back(input[p++]);
            }
        }
        if (digits.empty() || digits == "x") {
            return 0;
        }
        if (p < input.size() && input[p] == ';') {
            ++p;
        } else if (require_semicolon) {
            return 0;
        }
        out.kind = MarkupTokenKind::CharRef;
        out.name = std::move(digits);
        return p - pos;
    }

    if (!is_ascii_letter(input[p])) {
        return 0;
    }
    const std::size_t name_start = p;
    while (p < input.size() && (std::isalnum(static_cast<unsigned char>(input[p])) || input[p] == '.' || input[p] == '-')) {
        ++p;
    }
    const std::size_t name_end = p;
    if (p < input.size() && input[p] == ';') {
        ++p;
    } else if (require_semicolon) {
        return 0;
    }
    out.kind = MarkupTokenKind::EntityRef;
    out.name = std::string(input.substr(name_start, name_end - name_start));
    return p - pos;
}

}  // namespace

MarkupLexer::MarkupLexer(std::string_view input)
    : input_(input) {}

bool MarkupLexer::next(MarkupToken& out) {
    if (done_) {
        return false;
    }

    out = MarkupToken{};
    if (cursor_ >= input_.size()) {
        set_position(out, input_.size());
        out.kind = MarkupTokenKind::Eof;
        done_ = true;
        return true;
    }

    const char c = input_[cursor_];
    if (c == '<' && lex_markup(out)) {
        return true;
    }
    if (c == '&' && lex_reference(out)) {
        return true;
    }
    lex_text(out);
    return true;
}

void MarkupLexer::set_position(MarkupToken& token, std::size_t offset) {
    for (; counted_ < offset; ++counted_) {
        if (input_[counted_] == '\n') {
            ++line_;
            line_start_ = counted_ + 1;
        }
    }
    token.line = line_;
    token.column = offset - line_start_;
}

bool MarkupLexer::lex_markup(MarkupToken& out) {
    const std::string_view rest = input_.substr(cursor_);

    if (rest.starts_with("<!--")) {
        return lex_delimited(out, MarkupTokenKind::Comment, cursor_ + 4, "-->");
    }
    if (rest.starts_with("<![CDATA[")) {
        return lex_delimited(out, MarkupTokenKind::Text, cursor_ + 9, "]]>");
    }
    if (rest.starts_with("<!")) {
        return lex_delimited(out, MarkupTokenKind::Declaration, cursor_ + 2, ">");
    }
    if (rest.starts_with("<?")) {
        return lex_delimited(out, MarkupTokenKind::ProcessingInstruction, cursor_ + 2, ">");
    }
    if (rest.starts_with("</")) {
        return lex_end_tag(out);
    }
    if (rest.size() > 1 && is_ascii_letter(rest[1])) {
        return lex_start_tag(out);
    }
    return false;
}

bool MarkupLexer::lex_reference(MarkupToken& out) {
    const std::size_t consumed = scan_reference(input_, cursor_, false, out);
    if (consumed == 0) {
        return false;
    }
    set_position(out, cursor_);
    cursor_ += consumed;
    return true;
}

void MarkupLexer::lex_text(MarkupToken& out) {
    set_position(out, cursor_);
    out.kind = MarkupTokenKind::Text;

    // the first character is taken unconditionally: it may be a '<' or '&'
    // that did not start markup
    std::size_t end = cursor_ + 1;
    while (end < input_.size() && input_[end] != '<' && input_[end] != '&') {
        ++end;
    }
    out.text = std::string(input_.substr(cursor_, end - cursor_));
    cursor_ = end;
}

bool MarkupLexer::lex_start_tag(MarkupToken& out) {
    std::size_t p = cursor_ + 1;
    const std::size_t name_start = p;
    while (p < input_.size() && is_name_char(input_[p])) {
        ++p;
    }
    std::string name = to_lower(input_.substr(name_start, p - name_start));

    std::vector<MarkupAttribute> attributes;
    bool self_closing = false;
    while (true) {
        while (p < input_.size() && is_ws(input_[p])) {
            ++p;
        }
        if (p >= input_.size() || input_[p] == '<') {
            return false;
        }
        if (input_[p] == '>') {
            ++p;
            break;
        }
        if (input_[p] == '/') {
            if (p + 1 < input_.size() && input_[p + 1] == '>') {
                self_closing = true;
                p += 2;
                break;
            }
            ++p;
            continue;
        }

        const std::size_t attr_start = p;
        while (p < input_.size() && !is_ws(input_[p]) && input_[p] != '=' && input_[p] != '>' && input_[p] != '<' &&
               !(input_[p] == '/' && p + 1 < input_.size() && input_[p + 1] == '>')) {
            ++p;
        }
        if (p == attr_start) {
            // stray '=' without a name
            ++p;
            continue;
        }
        MarkupAttribute attribute;
        attribute.name = to_lower(input_.substr(attr_start, p - attr_start));

        std::size_t q = p;
        while (q < input_.size() && is_ws(input_[q])) {
            ++q;
        }
        if (q < input_.size() && input_[q] == '=') {
            ++q;
            while (q < input_.size() && is_ws(input_[q])) {
                ++q;
            }
            if (q >= input_.size()) {
                return false;
            }
            if (input_[q] == '"' || input_[q] == '\'') {
                const std::size_t close = input_.find(input_[q], q + 1);
                if (close == std::string_view::npos) {
                    return false;
                }
                attribute.value = decode_references(input_.substr(q + 1, close - q - 1));
                p = close + 1;
            } else {
                const std::size_t value_start = q;
                while (q < input_.size() && !is_ws(input_[q]) && input_[q] != '>' && input_[q] != '<') {
                    ++q;
                }
                attribute.value = decode_references(input_.substr(value_start, q - value_start));
                p = q;
            }
        }
        attributes.push_back(std::move(attribute));
    }

    set_position(out, cursor_);
    out.kind = MarkupTokenKind::StartTag;
    out.name = std::move(name);
    out.attributes = std::move(attributes);
    out.self_closing = self_closing;
    cursor_ = p;
    return true;
}

bool MarkupLexer::lex_end_tag(MarkupToken& out) {
    std::size_t p = cursor_ + 2;
    while (p < input_.size() && is_ws(input_[p])) {
        ++p;
    }
    if (p >= input_.size() || !is_ascii_letter(input_[p])) {
        return false;
    }
    const std::size_t name_start = p;
    while (p < input_.size() && is_name_char(input_[p])) {
        ++p;
    }
    const std::size_t name_end = p;
    const std::size_t close = input_.find('>', p);
    if (close == std::string_view::npos) {
        return false;
    }

    set_position(out, cursor_);
    out.kind = MarkupTokenKind::EndTag;
    out.name = to_lower(input_.substr(name_start, name_end - name_start));
    cursor_ = close + 1;
    return true;
}

bool MarkupLexer::lex_delimited(
    MarkupToken& out,
    MarkupTokenKind kind,
    std::size_t body_start,
    std::string_view terminator
) {
    const std::size_t end = input_.find(terminator, body_start);
    if (end == std::string_view::npos) {
        return false;
    }

    set_position(out, cursor_);
    out.kind = kind;
    out.text = std::string(input_.substr(body_start, end - body_start));
    cursor_ = end + terminator.size();
    return true;
}

bool char_ref_code(std::string_view digits, char32_t& out_code) {
    const bool hex = !digits.empty() && (digits.front() == 'x' || digits.front() == 'X');
    if (hex) {
        digits.remove_prefix(1);
    }
    if (digits.empty()) {
        return false;
    }

    std::uint32_t value = 0;
    for (char c : digits) {
        std::uint32_t digit = 0;
        if (c >= '0' && c <= '9') {
            digit = static_cast<std::uint32_t>(c - '0');
        } else if (hex && c >= 'a' && c <= 'f') {
            digit = static_cast<std::uint32_t>(c - 'a' + 10);
        } else if (hex && c >= 'A' && c <= 'F') {
            digit = static_cast<std::uint32_t>(c - 'A' + 10);
        } else {
            return false;
        }
        value = value * (hex ? 16 : 10) + digit;
        if (value > 0x10ffff) {
            return false;
        }
    }
    out_code = static_cast<char32_t>(value);
    return true;
}

std::string decode_references(std::string_view raw) {
    if (raw.find('&') == std::string_view::npos) {
        return std::string(raw);
    }

    std::string out;
    out.reserve(raw.size());
    std::size_t pos = 0;
    while (pos < raw.size()) {
        if (raw[pos] == '&') {
            MarkupToken ref;
            const std::size_t consumed = scan_reference(raw, pos, true, ref);
            char32_t code = 0;
            const bool resolved = consumed > 0 &&
                (ref.kind == MarkupTokenKind::CharRef ? char_ref_code(ref.name, code)
                                                      : lookup_html_entity(ref.name, code));
            if (resolved) {
                append_utf8(out, code);
                pos += consumed;
                continue;
            }
        }
        out.push_back(raw[pos++]);
    }
    return out;
}

}  // namespace tei_standoff
