#include "schemafm/translator.hpp"
#include "schemafm/feature_model.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace schemafm {

namespace {

const char* json_type_name(const nlohmann::ordered_json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::object: return "object";
        case nlohmann::json::value_t::array: return "array";
        case nlohmann::json::value_t::string: return "string";
        case nlohmann::json::value_t::boolean: return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float: return "number";
        default: return "null";
    }
}

class TranslationRun {
public:
    TranslationRun(const KeyMapper& mapper, Selection& selection, WarningCollector& warnings,
                   std::chrono::milliseconds budget)
        : mapper_(mapper), selection_(selection), warnings_(warnings) {
        if (budget.count() > 0) {
            has_deadline_ = true;
            deadline_ = std::chrono::steady_clock::now() + budget;
        }
    }

    void visit(std::vector<std::string>& segments, const std::string& doc_path,
               const nlohmann::ordered_json& value) {
        if (expired()) return;

        LookupResult exact = mapper_.lookup(segments);
        LookupResult typed = lookup_typed(segments, value);

        if (exact.status == LookupStatus::Ambiguous || typed.status == LookupStatus::Ambiguous) {
            selection_.ambiguous.push_back(doc_path);
            std::string candidates;
            for (const auto& c : exact.status == LookupStatus::Ambiguous ? exact.candidates : typed.candidates) {
                if (!candidates.empty()) candidates += ",";
                candidates += c;
            }
            warnings_.emit(Warning::ambiguous_key_path, warnings::ambiguous_key_path(doc_path, candidates));
            // Only the branch is undecided; the feature owning the key is still used
            if (exact.status == LookupStatus::Hit) {
                activate(*exact.entry, value);
            }
            return;
        }

        bool hit = false;
        bool captured = false;
        if (exact.status == LookupStatus::Hit) {
            hit = true;
            captured = activate(*exact.entry, value) || captured;
        }
        if (typed.status == LookupStatus::Hit) {
            hit = true;
            captured = activate(*typed.entry, value) || captured;
        }
        if (captured) return;

        bool empty_container = (value.is_object() || value.is_array()) && value.empty();
        if (value.is_null() || empty_container) {
            if (exact.status == LookupStatus::Hit) {
                selection_.selected.insert(exact.entry->feature_id
                                           + (value.is_null() ? kIsNullSuffix : kIsEmptySuffix));
            } else if (!hit) {
                unmapped(doc_path);
            }
            return;
        }

        if (value.is_object()) {
            for (auto it = value.begin(); it != value.end(); ++it) {
                segments.push_back(it.key());
                visit(segments, doc_path + "." + it.key(), it.value());
                segments.pop_back();
                if (expired_) return;
            }
        } else if (value.is_array()) {
            std::string saved = segments.back();
            segments.back() += "[*]";
            for (std::size_t i = 0; i < value.size(); ++i) {
                visit(segments, doc_path + "[" + std::to_string(i) + "]", value[i]);
                if (expired_) break;
            }
            segments.back() = saved;
        } else if (!hit) {
            unmapped(doc_path);
        }
    }

    bool expired() {
        if (expired_) return true;
        if (has_deadline_ && (++visits_ & 63u) == 0 && std::chrono::steady_clock::now() > deadline_) {
            expired_ = true;
        }
        return expired_;
    }

    bool timed_out() const { return expired_; }

private:
    const KeyMapper& mapper_;
    Selection& selection_;
    WarningCollector& warnings_;
    bool has_deadline_ = false;
    bool expired_ = false;
    std::size_t visits_ = 0;
    std::chrono::steady_clock::time_point deadline_;
    std::set<std::string> accumulated_;

    LookupResult lookup_typed(std::vector<std::string>& segments, const nlohmann::ordered_json& value) {
        LookupResult result;
        if (value.is_null()) return result;

        std::string saved = segments.back();
        segments.back() = saved + "@" + json_type_name(value);
        result = mapper_.lookup(segments);
        if (result.status == LookupStatus::Miss && value.is_number_integer()) {
            segments.back() = saved + "@number";
            result = mapper_.lookup(segments);
        }
        segments.back() = saved;
        return result;
    }

    // Returns true when the value was captured whole
    bool activate(const KeyMappingEntry& entry, const nlohmann::ordered_json& value) {
        selection_.selected.insert(entry.feature_id);
        if (entry.value_kind == ValueKind::BooleanPresence || value.is_null()) {
            return false;
        }
        record_value(entry.feature_id, value);
        return true;
    }

    void record_value(const std::string& id, const nlohmann::ordered_json& value) {
        auto it = selection_.values.find(id);
        if (it == selection_.values.end()) {
            selection_.values.emplace(id, value);
            return;
        }
        if (accumulated_.insert(id).second) {
            auto first = std::move(it->second);
            it->second = nlohmann::ordered_json::array();
            it->second.push_back(std::move(first));
        }
        it->second.push_back(value);
    }

    void unmapped(const std::string& doc_path) {
        selection_.unmapped.push_back(doc_path);
        warnings_.emit(Warning::unmapped_key, warnings::unmapped_key(doc_path, selection_.document_id));
    }
};

std::vector<std::string> string_array(const nlohmann::ordered_json& j, const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& v : j[key]) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

} // namespace

nlohmann::ordered_json selection_to_json(const Selection& selection) {
    nlohmann::ordered_json j;
    j["document_id"] = selection.document_id;
    j["kind"] = selection.kind;
    j["selected"] = selection.selected;
    j["values"] = nlohmann::ordered_json::object();
    for (const auto& [id, value] : selection.values) {
        j["values"][id] = value;
    }
    j["unmapped"] = selection.unmapped;
    j["ambiguous"] = selection.ambiguous;
    return j;
}

SelectionParseResult parse_selection(const std::string& json_text) {
    SelectionParseResult result;
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }
    if (!j.is_object()) {
        result.error = "selection must be a JSON object";
        return result;
    }
    if (!j.contains("selected") || !j["selected"].is_array()) {
        result.error = "missing 'selected' array";
        return result;
    }

    result.selection.document_id = j.value("document_id", "");
    result.selection.kind = j.value("kind", "");
    for (auto& id : string_array(j, "selected")) {
        result.selection.selected.insert(std::move(id));
    }
    if (j.contains("values") && j["values"].is_object()) {
        for (auto& [id, value] : j["values"].items()) {
            result.selection.values[id] = value;
        }
    }
    result.selection.unmapped = string_array(j, "unmapped");
    result.selection.ambiguous = string_array(j, "ambiguous");
    result.ok = true;
    return result;
}

ConfigurationTranslator::ConfigurationTranslator(const KeyMapper& mapper, TranslatorOptions options)
    : mapper_(mapper), options_(options) {}

Result<Selection> ConfigurationTranslator::translate(const nlohmann::ordered_json& content,
                                                     const std::string& document_id,
                                                     WarningCollector& warnings) const {
    if (!content.is_object()) {
        return Result<Selection>::err(
            Error(ErrorCode::DOCUMENT_INVALID, "document is not an object").withContext(document_id));
    }
    auto kind_it = content.find("kind");
    if (kind_it == content.end() || !kind_it->is_string() || kind_it->get<std::string>().empty()) {
        return Result<Selection>::err(
            Error(ErrorCode::DOCUMENT_INVALID, "document has no kind").withContext(document_id));
    }

    Selection selection;
    selection.document_id = document_id;
    selection.kind = kind_it->get<std::string>();

    std::vector<std::string> segments{selection.kind};
    LookupResult root = mapper_.lookup(segments);
    if (root.status != LookupStatus::Hit) {
        return Result<Selection>::err(
            Error(ErrorCode::DOCUMENT_INVALID, "kind '" + selection.kind + "' is not mapped").withContext(document_id));
    }
    selection.selected.insert(root.entry->feature_id);

    TranslationRun run(mapper_, selection, warnings, options_.time_budget);
    for (auto it = content.begin(); it != content.end(); ++it) {
        if (it.key() == "kind") continue;
        segments.push_back(it.key());
        run.visit(segments, it.key(), it.value());
        segments.pop_back();
        if (run.timed_out()) break;
    }

    if (run.timed_out()) {
        warnings.emit(Warning::translation_timeout,
                      {{"document_id", document_id},
                       {"budget_ms", std::to_string(options_.time_budget.count())}});
        return Result<Selection>::err(Error(ErrorCode::TRANSLATION_TIMEOUT,
            "time budget of " + std::to_string(options_.time_budget.count()) + " ms exceeded").withContext(document_id));
    }

    spdlog::debug("{}: {} features selected, {} unmapped", document_id,
                  selection.selected.size(), selection.unmapped.size());
    return Result<Selection>::ok(std::move(selection));
}

} // namespace schemafm
