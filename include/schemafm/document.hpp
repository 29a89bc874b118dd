#pragma once

#include "schemafm/result.hpp"
#include "schemafm/warnings.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace schemafm {

// ============================================================================
// Configuration Documents
// ============================================================================

enum class DocumentFormat {
    Json,
    Yaml
};

// .json is read as JSON, everything else as a YAML stream
DocumentFormat detect_document_format(const std::string& path);

struct Document {
    std::string id;           // source path, plus "#<n>" in multi-document files
    std::string source_path;
    std::size_t index = 0;    // position in the file
    std::string kind;
    nlohmann::ordered_json content;
};

struct DocumentOptions {
    bool skip_templated = true;            // files containing "{{" template markers
    std::vector<std::string> skip_kinds;   // kinds never translated
};

// Convert a YAML node, inferring plain scalar types (int, float, bool, null)
nlohmann::ordered_json yaml_to_json(const YAML::Node& node);

// Split a file's text into documents and apply the skip rules. Documents
// without apiVersion or kind and skipped kinds are reported as
// document_skipped; non-object documents as invalid_document. List kinds
// with an "items" array contribute each item as a document.
Result<std::vector<Document>> parse_documents(const std::string& text,
                                              DocumentFormat format,
                                              const std::string& source_path,
                                              const DocumentOptions& options,
                                              WarningCollector& warnings);

Result<std::vector<Document>> load_documents(const std::string& path,
                                             const DocumentOptions& options,
                                             WarningCollector& warnings);

} // namespace schemafm
