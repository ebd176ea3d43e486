#include "edge.hpp"

namespace tei_standoff {
namespace {

void append_clean(std::string& out, std::string_view part) {
    for (char c : part) {
        if (c != kEdgeSeparator && c != kSpanSeparator) {
            out.push_back(c);
        }
    }
}

}  // namespace

std::string make_edge(std::string_view name, const std::vector<AnchorSpan>& spans) {
    std::string edge;
    append_clean(edge, name);
    for (const auto& span : spans) {
        edge.push_back(kEdgeSeparator);
        append_clean(edge, span.start);
        edge.push_back(kSpanSeparator);
        append_clean(edge, span.end);
    }
    return edge;
}

std::string make_edge(std::string_view name, const AnchorSpan& span) {
    return make_edge(name, std::vector<AnchorSpan>{span});
}

std::string edge_name(std::string_view edge) {
    return std::string(edge.substr(0, edge.find(kEdgeSeparator)));
}

std::vector<AnchorSpan> edge_spans(std::string_view edge) {
    std::vector<AnchorSpan> spans;
    std::size_t pos = edge.find(kEdgeSeparator);
    while (pos != std::string_view::npos) {
        const std::size_t next = edge.find(kEdgeSeparator, pos + 1);
        const std::string_view group = edge.substr(pos + 1, next == std::string_view::npos ? next : next - pos - 1);
        const std::size_t dash = group.find(kSpanSeparator);
        AnchorSpan span;
        span.start = std::string(group.substr(0, dash));
        if (dash != std::string_view::npos) {
            span.end = std::string(group.substr(dash + 1));
        }
        spans.push_back(std::move(span));
        pos = next;
    }
    return spans;
}

std::string edge_start(std::string_view edge) {
    const std::size_t colon = edge.find(kEdgeSeparator);
    if (colon == std::string_view::npos) {
        return {};
    }
    const std::string_view rest = edge.substr(colon + 1);
    return std::string(rest.substr(0, rest.find(kSpanSeparator)));
}

// Everything after the last span separator, or the whole edge without one.
std::string edge_end(std::string_view edge) {
    const std::size_t dash = edge.rfind(kSpanSeparator);
    if (dash == std::string_view::npos) {
        return std::string(edge);
    }
    return std::string(edge.substr(dash + 1));
}

}  // namespace tei_standoff
