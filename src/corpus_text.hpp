#pragma once

#include "anchor_store.hpp"
#include "error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace tei_standoff {

inline constexpr char kAnchorDelimiter = '#';

struct CorpusText {
    std::string text;
    PositionToAnchor position_to_anchor;
    AnchorToPosition anchor_to_position;
};

// Serialized form: text with "#anchor#" inserted at each anchored position and
// every literal '#' doubled.
std::string encode_corpus_text(std::string_view text, const PositionToAnchor& position_to_anchor);
bool decode_corpus_text(std::string_view encoded, CorpusText& out, Error& error);

bool write_corpus_text(
    const std::filesystem::path& path,
    std::string_view text,
    const PositionToAnchor& position_to_anchor,
    Error& error
);

bool read_corpus_text(const std::filesystem::path& path, CorpusText& out, Error& error);

}  // namespace tei_standoff
