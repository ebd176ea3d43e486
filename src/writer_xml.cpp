#include "writer_xml.hpp"
#include "edge.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>

namespace tei_standoff {
namespace {

struct SpanElement {
    std::string name;
    std::size_t start = 0;
    std::size_t end = 0;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::size_t order = 0;
    pugi::xml_node first_fragment;
    std::size_t overlap_id = 0;
};

enum class EventRank {
    Close = 0,
    Open = 1,
    Empty = 2,
    CloseOutermost = 3
};

struct SpanEvent {
    std::size_t position = 0;
    EventRank rank = EventRank::Open;
    std::size_t element = 0;
};

bool collect_elements(
    const CorpusText& corpus,
    const MarkupConfig& config,
    const AnnotationSet& annotations,
    const XmlExportOptions& options,
    std::vector<SpanElement>& out_elements,
    Error& error
) {
    std::map<std::string, std::size_t> by_edge;

    for (const auto& [elem, annotation] : config.annotations) {
        const auto found = annotations.find(annotation);
        if (found == annotations.end()) {
            continue;
        }
        for (const auto& [edge, value] : found->second) {
            if (edge_name(edge) != elem.first) {
                continue;
            }

            auto known = by_edge.find(edge);
            if (known == by_edge.end()) {
                const std::string start_anchor = edge_start(edge);
                const std::string end_anchor = edge_end(edge);
                const auto start = corpus.anchor_to_position.find(start_anchor);
                const auto end = corpus.anchor_to_position.find(end_anchor);
                if (start == corpus.anchor_to_position.end() || end == corpus.anchor_to_position.end()) {
                    return fail(error, ErrorKind::UnknownAnchor, "Edge " + edge + " refers to an unknown anchor");
                }

                SpanElement element;
                element.name = elem.first;
                element.start = start->second;
                element.end = std::max(start->second, end->second);
                element.order = out_elements.size();
                known = by_edge.emplace(edge, out_elements.size()).first;
                out_elements.push_back(std::move(element));
            }

            if (!elem.second.empty() && (!value.empty() || options.include_empty_attributes)) {
                out_elements[known->second].attributes.emplace_back(elem.second, value);
            }
        }
    }
    return true;
}

pugi::xml_node open_fragment(pugi::xml_node parent, SpanElement& element) {
    pugi::xml_node node = parent.append_child(element.name.c_str());
    for (const auto& [name, value] : element.attributes) {
        node.append_attribute(name.c_str()) = value.c_str();
    }
    if (!element.first_fragment) {
        element.first_fragment = node;
    }
    return node;
}

}  // namespace

bool build_xml_document(
    const CorpusText& corpus,
    const MarkupConfig& config,
    const AnnotationSet& annotations,
    const XmlExportOptions& options,
    pugi::xml_document& out_doc,
    Error& error
) {
    out_doc.reset();

    std::vector<SpanElement> elements;
    if (!collect_elements(corpus, config, annotations, options, elements, error)) {
        return false;
    }

    // outer elements first: by start, then longest
    std::stable_sort(elements.begin(), elements.end(), [](const SpanElement& a, const SpanElement& b) {
        return std::tie(a.start, b.end) < std::tie(b.start, a.end);
    });
    for (std::size_t i = 0; i < elements.size(); ++i) {
        elements[i].order = i;
    }

    const std::size_t text_size = corpus.text.size();
    std::vector<SpanEvent> events;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        const auto& element = elements[i];
        if (element.start == element.end) {
            events.push_back(SpanEvent{element.start, EventRank::Empty, i});
            continue;
        }
        events.push_back(SpanEvent{element.start, EventRank::Open, i});
        const bool outermost = element.start == 0 && element.end == text_size;
        events.push_back(SpanEvent{element.end, outermost ? EventRank::CloseOutermost : EventRank::Close, i});
    }
    std::stable_sort(events.begin(), events.end(), [&](const SpanEvent& a, const SpanEvent& b) {
        if (a.position != b.position) {
            return a.position < b.position;
        }
        if (a.rank != b.rank) {
            return a.rank < b.rank;
        }
        if (a.rank == EventRank::Close || a.rank == EventRank::CloseOutermost) {
            // innermost first
            return elements[a.element].order > elements[b.element].order;
        }
        return elements[a.element].order < elements[b.element].order;
    });

    const bool wrap = elements.empty() || elements.front().start != 0 || elements.front().end != text_size;
    pugi::xml_node base = out_doc;
    if (wrap) {
        base = out_doc.append_child(options.root_name.c_str());
    }

    struct OpenFragment {
        std::size_t element;
        pugi::xml_node node;
    };
    std::vector<OpenFragment> stack;
    std::size_t overlap_counter = 0;
    std::size_t cursor = 0;

    auto top = [&]() { return stack.empty() ? base : stack.back().node; };
    auto flush_text = [&](std::size_t position) {
        if (position > cursor) {
            top().append_child(pugi::node_pcdata).set_value(corpus.text.substr(cursor, position - cursor).c_str());
            cursor = position;
        }
    };

    for (const auto& event : events) {
        flush_text(event.position);
        SpanElement& element = elements[event.element];

        switch (event.rank) {
            case EventRank::Empty:
                open_fragment(top(), element);
                break;
            case EventRank::Open:
                stack.push_back(OpenFragment{event.element, open_fragment(top(), element)});
                break;
            case EventRank::Close:
            case EventRank::CloseOutermost: {
                const auto found = std::find_if(stack.rbegin(), stack.rend(), [&](const OpenFragment& open) {
                    return open.element == event.element;
                });
                if (found == stack.rend()) {
                    break;
                }
                const auto index = static_cast<std::size_t>(std::distance(found, stack.rend()) - 1);
                std::vector<std::size_t> reopen;
                for (std::size_t i = index + 1; i < stack.size(); ++i) {
                    reopen.push_back(stack[i].element);
                }
                stack.resize(index);
                for (std::size_t split : reopen) {
                    SpanElement& fragmented = elements[split];
                    if (fragmented.overlap_id == 0) {
                        fragmented.overlap_id = ++overlap_counter;
                        const std::string id = options.doc_id + "-" + std::to_string(fragmented.overlap_id);
                        fragmented.first_fragment.append_attribute(kOverlapAttribute) = id.c_str();
                    }
                    pugi::xml_node node = open_fragment(top(), fragmented);
                    const std::string id = options.doc_id + "-" + std::to_string(fragmented.overlap_id);
                    node.append_attribute(kOverlapAttribute) = id.c_str();
                    stack.push_back(OpenFragment{split, node});
                }
                break;
            }
        }
    }
    flush_text(text_size);

    if (!out_doc.first_child()) {
        return fail(error, ErrorKind::Export, "Nothing to export");
    }
    return true;
}

bool write_xml_output(
    const std::filesystem::path& out_path,
    const CorpusText& corpus,
    const MarkupConfig& config,
    const AnnotationSet& annotations,
    const XmlExportOptions& options,
    Error& error
) {
    pugi::xml_document doc;
    if (!build_xml_document(corpus, config, annotations, options, doc, error)) {
        return false;
    }

    if (out_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(out_path.parent_path(), ec);
        if (ec) {
            return fail(error, ErrorKind::Io, "Failed to create output directory: " + out_path.parent_path().string());
        }
    }

    if (!doc.save_file(out_path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8)) {
        return fail(error, ErrorKind::Export, "Failed to write XML export: " + out_path.string());
    }
    return true;
}

}  // namespace tei_standoff
