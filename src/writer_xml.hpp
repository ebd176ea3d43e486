#pragma once

#include "annotation_file.hpp"
#include "corpus_text.hpp"
#include "error.hpp"
#include "markup_config.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <pugixml.hpp>

namespace tei_standoff {

inline constexpr const char* kOverlapAttribute = "_overlap";

struct XmlExportOptions {
    std::string root_name = "text";
    std::string doc_id = "doc";
    bool include_empty_attributes = false;
};

// Annotation contents keyed by annotation name.
using AnnotationSet = std::map<std::string, std::vector<AnnotationEntry>>;

// Rebuilds a well-formed document from standoff annotations. Elements that
// overlap are split into fragments sharing an _overlap attribute.
bool build_xml_document(
    const CorpusText& corpus,
    const MarkupConfig& config,
    const AnnotationSet& annotations,
    const XmlExportOptions& options,
    pugi::xml_document& out_doc,
    Error& error
);

bool write_xml_output(
    const std::filesystem::path& out_path,
    const CorpusText& corpus,
    const MarkupConfig& config,
    const AnnotationSet& annotations,
    const XmlExportOptions& options,
    Error& error
);

}  // namespace tei_standoff
