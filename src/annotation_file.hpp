#pragma once

#include "error.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tei_standoff {

inline constexpr char kAnnotationDelimiter = ' ';

using AnnotationEntry = std::pair<std::string, std::string>;

// Insertion-ordered key -> value mapping. Setting an existing key replaces its
// value in place.
class AnnotationStore {
public:
    void set(const std::string& key, std::string value);
    bool contains(const std::string& key) const { return index_.contains(key); }
    const std::string* find(const std::string& key) const;

    const std::vector<AnnotationEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<AnnotationEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

std::string escape_annotation_value(const std::string& value);
std::string unescape_annotation_value(const std::string& value);

bool write_annotation(
    const std::filesystem::path& path,
    const std::vector<AnnotationEntry>& entries,
    Error& error
);

bool read_annotation(
    const std::filesystem::path& path,
    std::vector<AnnotationEntry>& out_entries,
    Error& error
);

}  // namespace tei_standoff
