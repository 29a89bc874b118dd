#pragma once

#include "schemafm/document.hpp"
#include "schemafm/key_mapping.hpp"
#include "schemafm/result.hpp"
#include "schemafm/warnings.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// Configuration Selection
// ============================================================================

struct Selection {
    std::string document_id;
    std::string kind;
    std::set<std::string> selected;                        // includes isNull/isEmpty markers
    std::map<std::string, nlohmann::ordered_json> values;  // feature id -> literal(s)
    std::vector<std::string> unmapped;                     // document-relative, in document order
    std::vector<std::string> ambiguous;

    bool is_selected(const std::string& id) const { return selected.count(id) > 0; }
};

nlohmann::ordered_json selection_to_json(const Selection& selection);

struct SelectionParseResult {
    bool ok = false;
    std::string error;
    Selection selection;
};

SelectionParseResult parse_selection(const std::string& json_text);

// ============================================================================
// Configuration Translator
// ============================================================================

struct TranslatorOptions {
    // Wall-clock budget per document; zero or negative disables it
    std::chrono::milliseconds time_budget{5000};
};

class ConfigurationTranslator {
public:
    ConfigurationTranslator(const KeyMapper& mapper, TranslatorOptions options = {});

    // Fails with DOCUMENT_INVALID for non-object documents, documents
    // without a kind or with a kind the mapping does not know, and with
    // TRANSLATION_TIMEOUT when the budget runs out.
    Result<Selection> translate(const nlohmann::ordered_json& content,
                                const std::string& document_id,
                                WarningCollector& warnings) const;

    Result<Selection> translate(const Document& document, WarningCollector& warnings) const {
        return translate(document.content, document.id, warnings);
    }

private:
    const KeyMapper& mapper_;
    TranslatorOptions options_;
};

} // namespace schemafm
