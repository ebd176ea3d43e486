#pragma once

#include "error.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tei_standoff {

// Byte offsets relative to the tokenized string, end exclusive.
struct TextSpan {
    std::size_t start = 0;
    std::size_t end = 0;

    bool operator==(const TextSpan&) const = default;
};

class SpanTokenizer {
public:
    virtual ~SpanTokenizer() = default;

    virtual std::vector<TextSpan> span_tokenize(std::string_view text) const = 0;
};

class FunctionSpanTokenizer final : public SpanTokenizer {
public:
    using Function = std::function<std::vector<TextSpan>(std::string_view)>;

    explicit FunctionSpanTokenizer(Function function);

    std::vector<TextSpan> span_tokenize(std::string_view text) const override;

private:
    Function function_;
};

// Known names: whitespace, linebreaks, blanklines, punctuation, word.
std::unique_ptr<SpanTokenizer> make_span_tokenizer(const std::string& name, Error& error);
std::vector<std::string> span_tokenizer_names();

}  // namespace tei_standoff
