#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tei_standoff {

// Decodes the code point starting at pos and advances pos past it. Invalid
// bytes decode as U+FFFD and consume a single byte.
char32_t decode_utf8(std::string_view text, std::size_t& pos);
void append_utf8(std::string& out, char32_t code);

bool is_letter(char32_t code);
bool is_decimal_digit(char32_t code);
bool is_space(char32_t code);

enum class CharClass {
    Letter,
    Digit,
    Space,
    OtherSpace,
    Other
};

CharClass classify(char32_t code);

// Splits text into maximal letter runs, maximal digit runs, runs of ' ', and
// single other characters. Returned views point into text.
template <class Callback>
void for_each_text_token(std::string_view text, Callback&& callback) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t start = pos;
        const CharClass first = classify(decode_utf8(text, pos));
        if (first == CharClass::Letter || first == CharClass::Digit || first == CharClass::Space) {
            while (pos < text.size()) {
                std::size_t lookahead = pos;
                if (classify(decode_utf8(text, lookahead)) != first) {
                    break;
                }
                pos = lookahead;
            }
        }
        callback(text.substr(start, pos - start));
    }
}

}  // namespace tei_standoff
