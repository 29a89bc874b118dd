#include "schemafm/document.hpp"
#include "schemafm/platform.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>
#include <utility>

namespace schemafm {

namespace {

const std::regex& int_pattern() {
    static const std::regex re("[-+]?[0-9]+");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re("[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?");
    return re;
}

nlohmann::ordered_json plain_scalar(const std::string& s) {
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") {
        return nullptr;
    }
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;

    if (std::regex_match(s, int_pattern())) {
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') return v;
        // out of range: fall through to floating point
    }
    if (std::regex_match(s, float_pattern())) {
        return std::strtod(s.c_str(), nullptr);
    }
    if (s == ".inf" || s == ".Inf" || s == ".INF" || s == "+.inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (s == "-.inf" || s == "-.Inf" || s == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    return s;
}

std::string document_id(const std::string& source_path, std::size_t index, std::size_t total) {
    if (total <= 1) return source_path;
    return source_path + "#" + std::to_string(index);
}

std::string get_string(const nlohmann::ordered_json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

DocumentFormat detect_document_format(const std::string& path) {
    return get_extension(path) == ".json" ? DocumentFormat::Json : DocumentFormat::Yaml;
}

nlohmann::ordered_json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            // Quoted scalars carry the non-specific "!" tag and stay strings
            if (node.Tag() == "!") return node.Scalar();
            return plain_scalar(node.Scalar());
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::ordered_json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::ordered_json::object();
            for (const auto& kv : node) {
                std::string key = kv.first.IsScalar() ? kv.first.Scalar() : YAML::Dump(kv.first);
                obj[key] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

Result<std::vector<Document>> parse_documents(const std::string& text,
                                              DocumentFormat format,
                                              const std::string& source_path,
                                              const DocumentOptions& options,
                                              WarningCollector& warnings) {
    using DocumentsResult = Result<std::vector<Document>>;

    if (options.skip_templated && text.find("{{") != std::string::npos) {
        warnings.emit(Warning::document_skipped, warnings::document_skipped("templated", source_path));
        return DocumentsResult::ok({});
    }

    std::vector<nlohmann::ordered_json> raw;
    try {
        if (format == DocumentFormat::Json) {
            raw.push_back(nlohmann::ordered_json::parse(text));
        } else {
            for (const auto& node : YAML::LoadAll(text)) {
                if (node.IsNull()) continue;  // empty "---" separators
                raw.push_back(yaml_to_json(node));
            }
        }
    } catch (const nlohmann::json::parse_error& e) {
        return DocumentsResult::err(
            Error(ErrorCode::DOCUMENT_INVALID, std::string("JSON parse error: ") + e.what()).withContext(source_path));
    } catch (const YAML::Exception& e) {
        return DocumentsResult::err(
            Error(ErrorCode::DOCUMENT_INVALID, std::string("YAML parse error: ") + e.what()).withContext(source_path));
    }

    // Expand List kinds in place
    std::vector<nlohmann::ordered_json> expanded;
    for (auto& doc : raw) {
        if (doc.is_object() && ends_with(get_string(doc, "kind"), "List")
            && doc.contains("items") && doc["items"].is_array()) {
            for (auto& item : doc["items"]) {
                expanded.push_back(std::move(item));
            }
            continue;
        }
        expanded.push_back(std::move(doc));
    }

    std::vector<Document> documents;
    for (std::size_t i = 0; i < expanded.size(); ++i) {
        std::string id = document_id(source_path, i, expanded.size());
        auto& content = expanded[i];

        if (!content.is_object()) {
            warnings.emit(Warning::invalid_document, warnings::invalid_document("document is not an object", id));
            continue;
        }
        if (get_string(content, "apiVersion").empty()) {
            warnings.emit(Warning::document_skipped, warnings::document_skipped("missing apiVersion", id));
            continue;
        }
        std::string kind = get_string(content, "kind");
        if (kind.empty()) {
            warnings.emit(Warning::document_skipped, warnings::document_skipped("missing kind", id));
            continue;
        }
        if (std::find(options.skip_kinds.begin(), options.skip_kinds.end(), kind) != options.skip_kinds.end()) {
            warnings.emit(Warning::document_skipped, warnings::document_skipped("skipped kind " + kind, id));
            continue;
        }

        Document doc;
        doc.id = std::move(id);
        doc.source_path = source_path;
        doc.index = i;
        doc.kind = std::move(kind);
        doc.content = std::move(content);
        documents.push_back(std::move(doc));
    }

    spdlog::debug("{}: {} documents", source_path, documents.size());
    return DocumentsResult::ok(std::move(documents));
}

Result<std::vector<Document>> load_documents(const std::string& path,
                                             const DocumentOptions& options,
                                             WarningCollector& warnings) {
    auto file = read_file(path);
    if (!file.ok) {
        return Result<std::vector<Document>>::err(Error(ErrorCode::FILE_NOT_FOUND, file.error));
    }
    return parse_documents(file.content, detect_document_format(path), path, options, warnings);
}

} // namespace schemafm
