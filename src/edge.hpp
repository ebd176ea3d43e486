#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tei_standoff {

inline constexpr char kEdgeSeparator = ':';
inline constexpr char kSpanSeparator = '-';

struct AnchorSpan {
    std::string start;
    std::string end;

    bool operator==(const AnchorSpan&) const = default;
};

// Edge strings have the form name:start-end[:start-end...]
std::string make_edge(std::string_view name, const std::vector<AnchorSpan>& spans);
std::string make_edge(std::string_view name, const AnchorSpan& span);

std::string edge_name(std::string_view edge);
std::vector<AnchorSpan> edge_spans(std::string_view edge);
std::string edge_start(std::string_view edge);
std::string edge_end(std::string_view edge);

}  // namespace tei_standoff
