#pragma once

#include "markup_config.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace tei_standoff {

enum class Command {
    None,
    Parse,
    Segment,
    ExportXml,
    Analyze
};

struct AppConfig {
    Command command = Command::None;

    std::filesystem::path input_path;
    std::filesystem::path output_path;
    MarkupConfigSpec markup;
    std::size_t workers = 0;
    bool show_progress = true;
    bool quiet = false;

    // segment
    std::filesystem::path text_path;
    std::filesystem::path chunk_path;
    std::optional<std::filesystem::path> existing_path;
    std::string element = "w";
    std::string segmenter = "word";
    std::string prefix;

    // export-xml
    std::filesystem::path annotation_dir;
    std::string root_name = "text";
    std::string doc_id;
    bool include_empty_attributes = false;

    // analyze
    std::size_t max_count = 0;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

}  // namespace tei_standoff
