#include "markup_config.hpp"

#include <algorithm>
#include <cctype>

namespace tei_standoff {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string describe(const ElementAttribute& elem) {
    if (elem.second.empty()) {
        return elem.first;
    }
    return elem.first + ":" + elem.second;
}

}  // namespace

const std::string* MarkupConfig::annotation_for(const std::string& element, const std::string& attribute) const {
    const auto found = annotations.find({element, attribute});
    if (found == annotations.end()) {
        return nullptr;
    }
    return &found->second;
}

bool MarkupConfig::is_skipped(const std::string& element, const std::string& attribute) const {
    return skipped.contains({element, attribute});
}

bool MarkupConfig::overlap_permitted(const std::string& closing, const std::string& open) const {
    return permitted_overlaps.contains({closing, open});
}

ElementAttribute split_element_attribute(const std::string& spec) {
    const auto colon = spec.find(':');
    if (colon == std::string::npos) {
        return {to_lower(spec), {}};
    }
    return {to_lower(spec.substr(0, colon)), to_lower(spec.substr(colon + 1))};
}

std::vector<std::string> split_list(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == separator || (separator == ' ' && std::isspace(static_cast<unsigned char>(c)))) {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

bool build_markup_config(const MarkupConfigSpec& spec, MarkupConfig& out_config, Error& error) {
    out_config = MarkupConfig{};

    if (spec.elements.size() != spec.annotations.size()) {
        return fail(
            error,
            ErrorKind::InvalidConfiguration,
            "elements and annotations must be the same length (" + std::to_string(spec.elements.size()) +
                " != " + std::to_string(spec.annotations.size()) + ")"
        );
    }

    for (std::size_t i = 0; i < spec.elements.size(); ++i) {
        const std::string& annotation = spec.annotations[i];
        if (annotation.empty()) {
            return fail(error, ErrorKind::InvalidConfiguration, "Empty annotation name for " + spec.elements[i]);
        }

        const auto group = split_list(spec.elements[i], '+');
        if (group.empty()) {
            return fail(error, ErrorKind::InvalidConfiguration, "Empty element group for annotation " + annotation);
        }

        for (const auto& elem_spec : group) {
            ElementAttribute elem = split_element_attribute(elem_spec);
            if (elem.first.empty()) {
                return fail(error, ErrorKind::InvalidConfiguration, "Missing element name in '" + elem_spec + "'");
            }
            out_config.annotations[std::move(elem)] = annotation;
        }

        if (std::find(out_config.annotation_names.begin(), out_config.annotation_names.end(), annotation) ==
            out_config.annotation_names.end()) {
            out_config.annotation_names.push_back(annotation);
        }
    }

    for (const auto& skip_spec : spec.skip) {
        ElementAttribute elem = split_element_attribute(skip_spec);
        if (elem.first.empty()) {
            return fail(error, ErrorKind::InvalidConfiguration, "Missing element name in skip '" + skip_spec + "'");
        }
        if (out_config.annotations.contains(elem)) {
            return fail(
                error,
                ErrorKind::InvalidConfiguration,
                "skip and elements must be disjoint: " + describe(elem) + " is in both"
            );
        }
        out_config.skipped.insert(std::move(elem));
    }

    for (const auto& group_spec : spec.overlap) {
        auto names = split_list(group_spec, '+');
        for (auto& name : names) {
            name = to_lower(name);
        }
        for (const auto& first : names) {
            for (const auto& second : names) {
                if (first != second) {
                    out_config.permitted_overlaps.emplace(first, second);
                }
            }
        }
    }

    out_config.header_element = to_lower(spec.header.empty() ? std::string(kDefaultHeaderElement) : spec.header);
    return true;
}

}  // namespace tei_standoff
