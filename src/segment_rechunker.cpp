#include "segment_rechunker.hpp"
#include "corpus_text.hpp"
#include "edge.hpp"
#include "unicode_text.hpp"

#include <algorithm>
#include <set>

namespace tei_standoff {
namespace {

bool is_blank(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (!is_space(decode_utf8(text, pos))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> keys_of(const std::vector<AnnotationEntry>& entries) {
    std::vector<std::string> keys;
    keys.reserve(entries.size());
    for (const auto& entry : entries) {
        keys.push_back(entry.first);
    }
    return keys;
}

}  // namespace

SegmentRechunker::SegmentRechunker(std::string_view text, AnchorStore& anchors)
    : text_(text), anchors_(anchors) {}

bool SegmentRechunker::resolve(
    const std::string& anchor,
    const std::string& edge,
    std::size_t& out_position,
    Error& error
) const {
    if (!anchors_.find_position(anchor, out_position)) {
        return fail(error, ErrorKind::UnknownAnchor, "Unknown anchor '" + anchor + "' in edge " + edge);
    }
    return true;
}

bool SegmentRechunker::chunk_intervals(
    const std::vector<std::string>& chunk_edges,
    const std::vector<std::string>& existing_edges,
    std::vector<PositionSpan>& out_intervals,
    Error& error
) const {
    out_intervals.clear();

    std::set<std::size_t> boundaries{0, text_.size()};
    for (const auto& edge : chunk_edges) {
        for (const auto& span : edge_spans(edge)) {
            std::size_t start = 0;
            std::size_t end = 0;
            if (!resolve(span.start, edge, start, error) || !resolve(span.end, edge, end, error)) {
                return false;
            }
            boundaries.insert(start);
            boundaries.insert(end);
        }
    }

    std::vector<PositionSpan> intervals;
    for (auto it = boundaries.begin(); std::next(it) != boundaries.end(); ++it) {
        intervals.emplace_back(*it, *std::next(it));
    }

    if (!existing_edges.empty()) {
        std::vector<PositionSpan> tokens;
        for (const auto& edge : existing_edges) {
            for (const auto& span : edge_spans(edge)) {
                std::size_t start = 0;
                std::size_t end = 0;
                if (!resolve(span.start, edge, start, error) || !resolve(span.end, edge, end, error)) {
                    return false;
                }
                tokens.emplace_back(start, end);
            }
        }
        std::sort(tokens.begin(), tokens.end());

        // Existing tokens are kept as they are: cut them out of the intervals,
        // so that no interval boundary falls inside one.
        const std::size_t chunk_count = intervals.size();
        for (std::size_t n = 0; n < chunk_count; ++n) {
            auto [chunk_start, chunk_end] = intervals[n];
            for (const auto& [token_start, token_end] : tokens) {
                if (token_end <= chunk_start) {
                    continue;
                }
                if (token_start >= chunk_end) {
                    break;
                }
                if (token_start > chunk_start) {
                    intervals.emplace_back(chunk_start, token_start);
                }
                chunk_start = token_end;
            }
            intervals[n] = {chunk_start, chunk_end};
        }

        intervals.erase(
            std::remove_if(intervals.begin(), intervals.end(), [](const PositionSpan& span) {
                return span.first >= span.second;
            }),
            intervals.end()
        );
        std::sort(intervals.begin(), intervals.end());
    }

    out_intervals = std::move(intervals);
    return true;
}

bool SegmentRechunker::rechunk(
    const std::vector<std::string>& chunk_edges,
    const std::vector<std::string>& existing_edges,
    const SpanTokenizer& tokenizer,
    const std::string& element,
    std::vector<std::string>& out_edges,
    Error& error
) {
    std::vector<PositionSpan> intervals;
    if (!chunk_intervals(chunk_edges, existing_edges, intervals, error)) {
        return false;
    }

    for (const auto& [start, end] : intervals) {
        const std::string_view chunk = text_.substr(start, end - start);
        for (const TextSpan& span : tokenizer.span_tokenize(chunk)) {
            if (span.start > span.end || span.end > chunk.size()) {
                continue;
            }
            if (is_blank(chunk.substr(span.start, span.end - span.start))) {
                continue;
            }
            const std::string start_anchor = anchors_.anchor_at(start + span.start);
            const std::string end_anchor = anchors_.anchor_at(start + span.end);
            out_edges.push_back(make_edge(element, AnchorSpan{start_anchor, end_anchor}));
        }
    }
    return true;
}

bool segment_file(
    const SegmentFileOptions& options,
    const SpanTokenizer& tokenizer,
    DiagnosticSink& sink,
    std::size_t& out_new_edges,
    Error& error
) {
    out_new_edges = 0;

    CorpusText corpus;
    if (!read_corpus_text(options.text_path, corpus, error)) {
        return false;
    }
    sink.info(
        "Read " + std::to_string(corpus.text.size()) + " chars, " +
        std::to_string(corpus.anchor_to_position.size()) + " anchors: " + options.text_path.string()
    );

    std::vector<AnnotationEntry> chunks;
    if (!read_annotation(options.chunk_path, chunks, error)) {
        return false;
    }

    std::vector<AnnotationEntry> existing;
    if (options.existing_path && !read_annotation(*options.existing_path, existing, error)) {
        return false;
    }

    AnchorStore anchors(options.prefix, corpus.text.size());
    const std::size_t anchors_before = corpus.position_to_anchor.size();
    anchors.adopt(std::move(corpus.position_to_anchor), std::move(corpus.anchor_to_position));

    SegmentRechunker rechunker(corpus.text, anchors);
    std::vector<std::string> new_edges;
    if (!rechunker.rechunk(keys_of(chunks), keys_of(existing), tokenizer, options.element, new_edges, error)) {
        return false;
    }

    AnnotationStore out;
    for (auto& [key, value] : existing) {
        out.set(key, std::move(value));
    }
    for (const auto& edge : new_edges) {
        if (!out.contains(edge)) {
            out.set(edge, {});
            ++out_new_edges;
        }
    }

    if (!write_annotation(options.out_path, out.entries(), error)) {
        return false;
    }
    sink.info("Wrote " + std::to_string(out.size()) + " items: " + options.out_path.string());

    if (anchors.position_to_anchor().size() != anchors_before) {
        if (!write_corpus_text(options.text_path, corpus.text, anchors.position_to_anchor(), error)) {
            return false;
        }
        sink.info(
            "Rewrote " + options.text_path.string() + " with " +
            std::to_string(anchors.position_to_anchor().size() - anchors_before) + " new anchors"
        );
    }
    return true;
}

}  // namespace tei_standoff
