#include "span_tokenizer.hpp"
#include "unicode_text.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <map>
#include <unordered_set>

namespace tei_standoff {
namespace {

struct DecodedChar {
    std::size_t start;
    std::size_t end;
    char32_t code;
};

std::vector<DecodedChar> decode_all(std::string_view text) {
    std::vector<DecodedChar> chars;
    chars.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t start = pos;
        const char32_t code = decode_utf8(text, pos);
        chars.push_back(DecodedChar{start, pos, code});
    }
    return chars;
}

// Tokens are the stretches between gaps; a gap is a maximal whitespace run
// holding at least min_newlines line breaks.
std::vector<TextSpan> split_on_whitespace_gaps(std::string_view text, std::size_t min_newlines) {
    const auto chars = decode_all(text);
    std::vector<TextSpan> spans;

    std::size_t token_start = 0;
    std::size_t i = 0;
    while (i < chars.size()) {
        if (!is_space(chars[i].code)) {
            ++i;
            continue;
        }
        std::size_t j = i;
        std::size_t newlines = 0;
        while (j < chars.size() && is_space(chars[j].code)) {
            if (chars[j].code == '\n') {
                ++newlines;
            }
            ++j;
        }
        if (newlines >= min_newlines) {
            if (chars[i].start > token_start) {
                spans.push_back(TextSpan{token_start, chars[i].start});
            }
            token_start = j < chars.size() ? chars[j].start : text.size();
        }
        i = j;
    }
    if (token_start < text.size()) {
        spans.push_back(TextSpan{token_start, text.size()});
    }
    return spans;
}

class WhitespaceTokenizer final : public SpanTokenizer {
public:
    std::vector<TextSpan> span_tokenize(std::string_view text) const override {
        return split_on_whitespace_gaps(text, 0);
    }
};

class LinebreakTokenizer final : public SpanTokenizer {
public:
    std::vector<TextSpan> span_tokenize(std::string_view text) const override {
        return split_on_whitespace_gaps(text, 1);
    }
};

class BlanklineTokenizer final : public SpanTokenizer {
public:
    std::vector<TextSpan> span_tokenize(std::string_view text) const override {
        return split_on_whitespace_gaps(text, 2);
    }
};

// Sentence chunks: each chunk runs up to and including a run of .!? and the
// whitespace after it. Use only when no trained sentence splitter is available.
class PunctuationTokenizer final : public SpanTokenizer {
public:
    std::vector<TextSpan> span_tokenize(std::string_view text) const override {
        std::vector<std::size_t> starts;
        std::size_t pos = 0;
        bool after_gap = true;
        while (pos < text.size()) {
            const char c = text[pos];
            if (c == '.' || c == '!' || c == '?') {
                ++pos;
                std::size_t next = pos;
                while (next < text.size()) {
                    std::size_t probe = next;
                    if (!is_space(decode_utf8(text, probe))) {
                        break;
                    }
                    next = probe;
                }
                pos = next;
                after_gap = true;
                continue;
            }
            if (after_gap) {
                starts.push_back(pos);
                after_gap = false;
            }
            decode_utf8(text, pos);
        }

        std::vector<TextSpan> spans;
        if (starts.empty()) {
            spans.push_back(TextSpan{0, text.size()});
            return spans;
        }
        for (std::size_t i = 0; i + 1 < starts.size(); ++i) {
            spans.push_back(TextSpan{starts[i], starts[i + 1]});
        }
        spans.push_back(TextSpan{starts.back(), text.size()});
        return spans;
    }
};

// Whitespace separated words with surrounding punctuation split off. A final
// period is detached from the last word unless that word is an abbreviation.
class WordTokenizer final : public SpanTokenizer {
public:
    std::vector<TextSpan> span_tokenize(std::string_view text) const override {
        std::vector<TextSpan> spans;
        for (const TextSpan& word : split_on_whitespace_gaps(text, 0)) {
            split_word(text, word, spans);
        }
        detach_final_period(text, spans);
        return spans;
    }

private:
    static bool is_word_char(char32_t code) {
        return is_letter(code) || is_decimal_digit(code);
    }

    static void split_word(std::string_view text, const TextSpan& word, std::vector<TextSpan>& out) {
        const auto chars = decode_all(text.substr(word.start, word.end - word.start));
        std::size_t first = 0;
        std::size_t last = chars.size();
        while (first < last && !is_word_char(chars[first].code)) {
            out.push_back(TextSpan{word.start + chars[first].start, word.start + chars[first].end});
            ++first;
        }
        while (last > first && !is_word_char(chars[last - 1].code) && chars[last - 1].code != '.') {
            --last;
        }
        if (first < last) {
            out.push_back(TextSpan{word.start + chars[first].start, word.start + chars[last - 1].end});
        }
        for (std::size_t i = last; i < chars.size(); ++i) {
            out.push_back(TextSpan{word.start + chars[i].start, word.start + chars[i].end});
        }
    }

    void detach_final_period(std::string_view text, std::vector<TextSpan>& spans) const {
        // skip trailing closing punctuation, e.g. 'piper." )'
        auto it = spans.rbegin();
        while (it != spans.rend() && it->end - it->start == 1 && is_closing(text[it->start])) {
            ++it;
        }
        if (it == spans.rend()) {
            return;
        }
        const TextSpan word = *it;
        if (word.end - word.start < 2 || text[word.end - 1] != '.') {
            return;
        }
        std::string stem(text.substr(word.start, word.end - word.start - 1));
        std::transform(stem.begin(), stem.end(), stem.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (abbreviations().contains(stem)) {
            return;
        }
        const auto index = static_cast<std::size_t>(std::distance(it, spans.rend()) - 1);
        spans[index] = TextSpan{word.start, word.end - 1};
        spans.insert(spans.begin() + static_cast<std::ptrdiff_t>(index) + 1, TextSpan{word.end - 1, word.end});
    }

    static bool is_closing(char c) {
        return c == '"' || c == '\'' || c == ')' || c == ']' || c == '}';
    }

    static const std::unordered_set<std::string>& abbreviations() {
        static const std::unordered_set<std::string> words = {
            "a.a", "a.d", "agr", "a.k.a", "alt", "ang", "anm", "art", "avd", "avl", "b.b", "betr",
            "b.g", "b.h", "bif", "bl.a", "b.r.b", "b.t.w", "civ.ek", "civ.ing", "co", "dir", "div",
            "d.m", "doc", "dr", "d.s", "d.s.o", "d.v", "d.v.s", "d.y", "dåv", "d.ä", "e.a.g", "e.d", "eftr", "eg",
            "ekon", "e.kr", "dyl", "em", "e.m", "enl", "e.o", "etc", "e.u", "ev", "ex", "exkl", "f",
            "farm", "f.d", "ff", "fig", "f.kr", "f.m", "f.n", "forts", "fr", "fr.a", "fr.o.m", "f.v.b",
            "f.v.t", "f.ö", "följ", "föreg", "förf", "gr", "g.s", "h.h.k.k.h.h", "h.k.h", "h.m", "ill",
            "inkl", "i.o.m", "st.f", "jur", "kand", "kap", "kl", "lb", "leg", "lic", "lisp", "m.a.a",
            "mag", "m.a.o", "m.a.p", "m.fl", "m.h.a", "m.h.t", "milj", "m.m", "m.m.d", "mom", "m.v.h",
            "möjl", "n.b", "näml", "nästk", "o", "o.d", "odont", "o.dyl", "omkr", "o.m.s", "op", "ordf",
            "o.s.a", "o.s.v", "pers", "p.gr", "p.g.a", "pol", "prel", "prof", "rc", "ref", "resp", "r.i.p",
            "rst", "s.a.s", "sek", "sekr", "sid", "sign", "sistl", "s.k", "sk", "skålp", "s.m", "s.m.s", "sp",
            "spec", "s.st", "st", "stud", "särsk", "tab", "tekn", "tel", "teol", "t.ex", "tf", "t.h",
            "tim", "t.o.m", "tr", "trol", "t.v", "u.p.a", "urspr", "utg", "v", "w", "v.d", "å.k",
            "ä.k.s", "äv", "ö.g", "ö.h", "ök", "övers"
        };
        return words;
    }
};

using TokenizerFactory = std::unique_ptr<SpanTokenizer> (*)();

const std::map<std::string, TokenizerFactory>& tokenizer_registry() {
    static const std::map<std::string, TokenizerFactory> registry = {
        {"blanklines", []() -> std::unique_ptr<SpanTokenizer> { return std::make_unique<BlanklineTokenizer>(); }},
        {"linebreaks", []() -> std::unique_ptr<SpanTokenizer> { return std::make_unique<LinebreakTokenizer>(); }},
        {"punctuation", []() -> std::unique_ptr<SpanTokenizer> { return std::make_unique<PunctuationTokenizer>(); }},
        {"whitespace", []() -> std::unique_ptr<SpanTokenizer> { return std::make_unique<WhitespaceTokenizer>(); }},
        {"word", []() -> std::unique_ptr<SpanTokenizer> { return std::make_unique<WordTokenizer>(); }},
    };
    return registry;
}

}  // namespace

FunctionSpanTokenizer::FunctionSpanTokenizer(Function function)
    : function_(std::move(function)) {}

std::vector<TextSpan> FunctionSpanTokenizer::span_tokenize(std::string_view text) const {
    return function_(text);
}

std::unique_ptr<SpanTokenizer> make_span_tokenizer(const std::string& name, Error& error) {
    const auto& registry = tokenizer_registry();
    const auto found = registry.find(name);
    if (found == registry.end()) {
        std::string known;
        for (const auto& entry : registry) {
            known += known.empty() ? entry.first : ", " + entry.first;
        }
        fail(error, ErrorKind::UnknownTokenizer, "Unknown segmenter '" + name + "' (available: " + known + ")");
        return nullptr;
    }
    return found->second();
}

std::vector<std::string> span_tokenizer_names() {
    std::vector<std::string> names;
    for (const auto& entry : tokenizer_registry()) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace tei_standoff
