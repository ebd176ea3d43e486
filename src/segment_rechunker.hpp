#pragma once

#include "anchor_store.hpp"
#include "annotation_file.hpp"
#include "diagnostics.hpp"
#include "error.hpp"
#include "span_tokenizer.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tei_standoff {

using PositionSpan = std::pair<std::size_t, std::size_t>;

// Splits the text into intervals at every chunk boundary, carves existing
// tokens out of those intervals and tokenizes what remains. New edges are
// appended to out_edges; positions that already carry an anchor reuse it.
class SegmentRechunker {
public:
    SegmentRechunker(std::string_view text, AnchorStore& anchors);

    bool chunk_intervals(
        const std::vector<std::string>& chunk_edges,
        const std::vector<std::string>& existing_edges,
        std::vector<PositionSpan>& out_intervals,
        Error& error
    ) const;

    bool rechunk(
        const std::vector<std::string>& chunk_edges,
        const std::vector<std::string>& existing_edges,
        const SpanTokenizer& tokenizer,
        const std::string& element,
        std::vector<std::string>& out_edges,
        Error& error
    );

private:
    bool resolve(const std::string& anchor, const std::string& edge, std::size_t& out_position, Error& error) const;

    std::string_view text_;
    AnchorStore& anchors_;
};

struct SegmentFileOptions {
    std::filesystem::path text_path;
    std::filesystem::path chunk_path;
    std::optional<std::filesystem::path> existing_path;
    std::filesystem::path out_path;
    std::string element;
    std::string prefix;
};

// Reads the corpus text and annotations, writes the segmentation (existing
// entries first) and rewrites the corpus text if new anchors were created.
bool segment_file(
    const SegmentFileOptions& options,
    const SpanTokenizer& tokenizer,
    DiagnosticSink& sink,
    std::size_t& out_new_edges,
    Error& error
);

}  // namespace tei_standoff
