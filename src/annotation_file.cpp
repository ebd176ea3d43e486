#include "annotation_file.hpp"

#include <fstream>

namespace tei_standoff {

void AnnotationStore::set(const std::string& key, std::string value) {
    const auto found = index_.find(key);
    if (found != index_.end()) {
        entries_[found->second].second = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, std::move(value));
}

const std::string* AnnotationStore::find(const std::string& key) const {
    const auto found = index_.find(key);
    if (found == index_.end()) {
        return nullptr;
    }
    return &entries_[found->second].second;
}

std::string escape_annotation_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string unescape_annotation_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            if (value[i + 1] == 'n') {
                out.push_back('\n');
                ++i;
                continue;
            }
            if (value[i + 1] == '\\') {
                out.push_back('\\');
                ++i;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

bool write_annotation(
    const std::filesystem::path& path,
    const std::vector<AnnotationEntry>& entries,
    Error& error
) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(error, ErrorKind::Io, "Failed to create annotation directory: " + path.parent_path().string());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(error, ErrorKind::Io, "Failed to open annotation output: " + path.string());
    }

    for (const auto& [key, value] : entries) {
        out << key << kAnnotationDelimiter << escape_annotation_value(value) << '\n';
    }

    if (!out) {
        return fail(error, ErrorKind::Io, "Failed to write annotation: " + path.string());
    }
    return true;
}

bool read_annotation(
    const std::filesystem::path& path,
    std::vector<AnnotationEntry>& out_entries,
    Error& error
) {
    out_entries.clear();

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(error, ErrorKind::Io, "Failed to open annotation: " + path.string());
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;

        const auto delim = line.find(kAnnotationDelimiter);
        if (delim == std::string::npos) {
            return fail(
                error,
                ErrorKind::CorruptAnnotation,
                "Missing delimiter in annotation " + path.string() + " at line " + std::to_string(line_number)
            );
        }

        out_entries.emplace_back(line.substr(0, delim), unescape_annotation_value(line.substr(delim + 1)));
    }

    return true;
}

}  // namespace tei_standoff
