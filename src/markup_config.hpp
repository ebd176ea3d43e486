#pragma once

#include "error.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tei_standoff {

inline constexpr const char* kDefaultHeaderElement = "teiheader";

// (element, attribute); an empty attribute denotes the element's own edge.
using ElementAttribute = std::pair<std::string, std::string>;

struct MarkupConfig {
    std::map<ElementAttribute, std::string> annotations;
    std::set<ElementAttribute> skipped;
    std::set<std::pair<std::string, std::string>> permitted_overlaps;
    std::string header_element = kDefaultHeaderElement;

    // Annotation names in declaration order, without duplicates.
    std::vector<std::string> annotation_names;

    const std::string* annotation_for(const std::string& element, const std::string& attribute) const;
    bool is_skipped(const std::string& element, const std::string& attribute) const;
    bool overlap_permitted(const std::string& closing, const std::string& open) const;
};

struct MarkupConfigSpec {
    std::vector<std::string> elements;
    std::vector<std::string> annotations;
    std::vector<std::string> skip;
    std::vector<std::string> overlap;
    std::string header = kDefaultHeaderElement;
};

ElementAttribute split_element_attribute(const std::string& spec);
std::vector<std::string> split_list(const std::string& text, char separator);

bool build_markup_config(const MarkupConfigSpec& spec, MarkupConfig& out_config, Error& error);

}  // namespace tei_standoff
