#include "config.hpp"
#include "span_tokenizer.hpp"

#include <exception>
#include <iostream>
#include <thread>

namespace tei_standoff {
namespace {

bool parse_size_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    try {
        out = static_cast<std::size_t>(std::stoull(value));
        return true;
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

void append_list(std::vector<std::string>& out, const std::string& value) {
    for (auto& item : split_list(value, ' ')) {
        out.push_back(std::move(item));
    }
}

bool parse_command(const std::string& arg, Command& out) {
    if (arg == "parse") {
        out = Command::Parse;
    } else if (arg == "segment") {
        out = Command::Segment;
    } else if (arg == "export-xml") {
        out = Command::ExportXml;
    } else if (arg == "analyze") {
        out = Command::Analyze;
    } else {
        return false;
    }
    return true;
}

}  // namespace

void print_usage(const char* program_name) {
    std::string segmenters;
    for (const auto& name : span_tokenizer_names()) {
        segmenters += segmenters.empty() ? name : ", " + name;
    }

    std::cout
        << "Usage:\n"
        << "  " << program_name << " parse --input <xml-file-or-dir> --output <dir> --elements <specs> --annotations <names> [options]\n"
        << "  " << program_name << " segment --text <corpus-text> --chunk <annotation> --out <annotation> [options]\n"
        << "  " << program_name << " export-xml --text <corpus-text> --annotation-dir <dir> --elements <specs> --annotations <names> --output <xml>\n"
        << "  " << program_name << " analyze --input <xml-file-or-dir> [--header <name>] [--max-count <n>]\n\n"
        << "Markup options:\n"
        << "  --elements <specs>     Space separated groups of element[:attribute], '+' joins a group\n"
        << "  --annotations <names>  One annotation name per element group\n"
        << "  --skip <specs>         element[:attribute] to ignore silently\n"
        << "  --overlap <groups>     '+' joined element names allowed to overlap\n"
        << "  --header <name>        Header element excluded from the text (default: teiheader)\n"
        << "  --workers <n>          Worker threads for parse (default: hardware concurrency)\n"
        << "  --no-progress          Disable progress bar output\n"
        << "  --quiet                Only print errors\n\n"
        << "Segment options:\n"
        << "  --existing <annotation>  Previous segmentation to keep\n"
        << "  --element <name>         Element name of the new edges (default: w)\n"
        << "  --segmenter <name>       One of: " << segmenters << " (default: word)\n"
        << "  --prefix <id>            Anchor prefix/seed (default: text file parent directory name)\n\n"
        << "Export options:\n"
        << "  --root <name>          Wrapper element when no element spans the whole text (default: text)\n"
        << "  --doc-id <id>          Identifier used in _overlap attributes\n"
        << "  --include-empty        Write attributes with empty values\n"
        << "  -h, --help             Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    const std::string first = argv[1];
    if (first == "-h" || first == "--help") {
        error = "help";
        return false;
    }
    if (!parse_command(first, config.command)) {
        error = "Unknown command: " + first;
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            config.input_path = require_value(arg);
        } else if (arg == "--output") {
            config.output_path = require_value(arg);
        } else if (arg == "--elements") {
            append_list(config.markup.elements, require_value(arg));
        } else if (arg == "--annotations") {
            append_list(config.markup.annotations, require_value(arg));
        } else if (arg == "--skip") {
            append_list(config.markup.skip, require_value(arg));
        } else if (arg == "--overlap") {
            append_list(config.markup.overlap, require_value(arg));
        } else if (arg == "--header") {
            config.markup.header = require_value(arg);
        } else if (arg == "--workers") {
            if (!parse_size_arg(arg, require_value(arg), config.workers, error)) {
                return false;
            }
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "--text") {
            config.text_path = require_value(arg);
        } else if (arg == "--chunk") {
            config.chunk_path = require_value(arg);
        } else if (arg == "--existing") {
            config.existing_path = require_value(arg);
        } else if (arg == "--out") {
            config.output_path = require_value(arg);
        } else if (arg == "--element") {
            config.element = require_value(arg);
        } else if (arg == "--segmenter") {
            config.segmenter = require_value(arg);
        } else if (arg == "--prefix") {
            config.prefix = require_value(arg);
        } else if (arg == "--annotation-dir") {
            config.annotation_dir = require_value(arg);
        } else if (arg == "--root") {
            config.root_name = require_value(arg);
        } else if (arg == "--doc-id") {
            config.doc_id = require_value(arg);
        } else if (arg == "--include-empty") {
            config.include_empty_attributes = true;
        } else if (arg == "--max-count") {
            if (!parse_size_arg(arg, require_value(arg), config.max_count, error)) {
                return false;
            }
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.workers == 0) {
        const auto hw = std::thread::hardware_concurrency();
        config.workers = hw == 0 ? 4 : static_cast<std::size_t>(hw);
    }

    switch (config.command) {
        case Command::Parse:
            if (config.input_path.empty()) {
                error = "--input is required";
                return false;
            }
            if (config.output_path.empty()) {
                error = "--output is required";
                return false;
            }
            break;
        case Command::Segment:
            if (config.text_path.empty() || config.chunk_path.empty() || config.output_path.empty()) {
                error = "--text, --chunk and --out are required";
                return false;
            }
            if (config.prefix.empty()) {
                config.prefix = config.text_path.parent_path().filename().string();
            }
            break;
        case Command::ExportXml:
            if (config.text_path.empty() || config.annotation_dir.empty() || config.output_path.empty()) {
                error = "--text, --annotation-dir and --output are required";
                return false;
            }
            if (config.doc_id.empty()) {
                config.doc_id = config.text_path.parent_path().filename().string();
            }
            if (config.doc_id.empty()) {
                config.doc_id = "doc";
            }
            break;
        case Command::Analyze:
            if (config.input_path.empty()) {
                error = "--input is required";
                return false;
            }
            break;
        case Command::None:
            error = "No command given";
            return false;
    }

    return true;
}

}  // namespace tei_standoff
