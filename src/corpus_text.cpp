#include "corpus_text.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace tei_standoff {
namespace {

void append_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        out.push_back(c);
        if (c == kAnchorDelimiter) {
            out.push_back(kAnchorDelimiter);
        }
    }
}

}  // namespace

std::string encode_corpus_text(std::string_view text, const PositionToAnchor& position_to_anchor) {
    std::string out;
    out.reserve(text.size() + position_to_anchor.size() * 12);

    std::size_t pos = 0;
    for (const auto& [next_pos, anchor] : position_to_anchor) {
        const std::size_t bounded = std::min(next_pos, text.size());
        append_escaped(out, text.substr(pos, bounded - pos));
        out.push_back(kAnchorDelimiter);
        out += anchor;
        out.push_back(kAnchorDelimiter);
        pos = bounded;
    }
    append_escaped(out, text.substr(pos));
    return out;
}

bool decode_corpus_text(std::string_view encoded, CorpusText& out, Error& error) {
    out = CorpusText{};
    out.text.reserve(encoded.size());

    std::size_t cursor = 0;
    while (true) {
        const std::size_t start = encoded.find(kAnchorDelimiter, cursor);
        if (start == std::string_view::npos) {
            out.text.append(encoded.substr(cursor));
            break;
        }
        out.text.append(encoded.substr(cursor, start - cursor));

        const std::size_t end = encoded.find(kAnchorDelimiter, start + 1);
        if (end == std::string_view::npos) {
            out = CorpusText{};
            return fail(
                error,
                ErrorKind::MismatchedAnchorDelimiters,
                "Mismatched anchor delimiter at byte " + std::to_string(start)
            );
        }

        if (end == start + 1) {
            out.text.push_back(kAnchorDelimiter);
        } else {
            std::string anchor(encoded.substr(start + 1, end - start - 1));
            const std::size_t position = out.text.size();
            out.anchor_to_position[anchor] = position;
            out.position_to_anchor[position] = std::move(anchor);
        }
        cursor = end + 1;
    }

    return true;
}

bool write_corpus_text(
    const std::filesystem::path& path,
    std::string_view text,
    const PositionToAnchor& position_to_anchor,
    Error& error
) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(error, ErrorKind::Io, "Failed to create corpus text directory: " + path.parent_path().string());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(error, ErrorKind::Io, "Failed to open corpus text output: " + path.string());
    }

    out << encode_corpus_text(text, position_to_anchor);
    if (!out) {
        return fail(error, ErrorKind::Io, "Failed to write corpus text: " + path.string());
    }
    return true;
}

bool read_corpus_text(const std::filesystem::path& path, CorpusText& out, Error& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(error, ErrorKind::Io, "Failed to open corpus text: " + path.string());
    }

    const std::string encoded((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!decode_corpus_text(encoded, out, error)) {
        error.message += " in corpus text " + path.string();
        return false;
    }
    return true;
}

}  // namespace tei_standoff
