#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tei_standoff {

enum class MarkupTokenKind {
    StartTag,
    EndTag,
    Text,
    CharRef,
    EntityRef,
    Comment,
    ProcessingInstruction,
    Declaration,
    Eof
};

struct MarkupAttribute {
    std::string name;
    std::string value;
};

struct MarkupToken {
    MarkupTokenKind kind = MarkupTokenKind::Eof;
    // Tag name (lower case), entity name, or char ref digits ("x" prefixed for hex).
    std::string name;
    // Text, comment, processing instruction or declaration body.
    std::string text;
    std::vector<MarkupAttribute> attributes;
    bool self_closing = false;
    std::size_t line = 1;
    std::size_t column = 0;
};

// Pull lexer for pseudo-XML. Tags need not nest; malformed markup falls back
// to text instead of failing.
class MarkupLexer {
public:
    explicit MarkupLexer(std::string_view input);

    // Returns false once the Eof token has been produced.
    bool next(MarkupToken& out);

private:
    void set_position(MarkupToken& token, std::size_t offset);
    bool lex_markup(MarkupToken& out);
    bool lex_reference(MarkupToken& out);
    void lex_text(MarkupToken& out);
    bool lex_start_tag(MarkupToken& out);
    bool lex_end_tag(MarkupToken& out);
    bool lex_delimited(MarkupToken& out, MarkupTokenKind kind, std::size_t body_start, std::string_view terminator);

    std::string_view input_;
    std::size_t cursor_ = 0;
    std::size_t line_ = 1;
    std::size_t line_start_ = 0;
    std::size_t counted_ = 0;
    bool done_ = false;
};

// Converts the digits of a character reference ("65", "x41"). Fails on
// malformed digits and on values beyond U+10FFFF.
bool char_ref_code(std::string_view digits, char32_t& out_code);

// Resolves entity and character references inside attribute values.
std::string decode_references(std::string_view raw);

}  // namespace tei_standoff
