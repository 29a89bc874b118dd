#include "schemafm/config.hpp"
#include "schemafm/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace schemafm {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

// Positive integers only; anything else is reported and ignored
void read_count(const nlohmann::json& j, const std::string& key, std::size_t& out,
                std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    if (j[key].is_number_integer() && j[key].get<long long>() > 0) {
        out = static_cast<std::size_t>(j[key].get<long long>());
    } else {
        warnings.push_back("invalid_configuration:invalid_" + key);
    }
}

} // namespace

std::vector<std::string> all_derivation_rules() {
    return {kRuleDependentRequired, kRuleConditionalRequired, kRuleRequiredWhen,
            kRuleForbiddenWhen, kRuleMutuallyExclusive, kRuleUnionExclusive, kRuleBounds};
}

RunConfig get_default_config() {
    RunConfig config;
    config.schema = kConfigSchema;
    config.warnings["unmapped_key"] = WarningAction::Warn;
    config.warnings["document_skipped"] = WarningAction::Warn;
    return config;
}

bool rule_enabled(const RunConfig& config, const std::string& rule) {
    const auto& rules = config.derivation.rules;
    return std::find(rules.begin(), rules.end(), rule) != rules.end();
}

RunConfigParseResult parse_run_config(const std::string& json_str,
                                      const std::string& source_path) {
    RunConfigParseResult result;
    result.config = get_default_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        // "model" section
        if (j.contains("model") && j["model"].is_object()) {
            const auto& model = j["model"];
            auto& out = result.config.model;

            if (auto ns = get_string(model, "namespace")) {
                if (!trim(*ns).empty()) {
                    out.namespace_name = trim(*ns);
                } else {
                    result.warnings.push_back("invalid_configuration:empty_namespace");
                }
            }
            out.roots = get_string_array(model, "roots");
            if (auto marker = get_string(model, "kind_marker")) {
                out.kind_marker = *marker;
            }
            read_count(model, "max_depth", out.max_depth, result.warnings);
            if (auto prefix = get_string(model, "escape_prefix")) {
                if (!prefix->empty()) {
                    out.escape_prefix = *prefix;
                } else {
                    result.warnings.push_back("invalid_configuration:empty_escape_prefix");
                }
            }
            if (auto parallel = get_bool(model, "parallel_synthesis")) {
                out.parallel_synthesis = *parallel;
            }
            if (auto dedup = get_bool(model, "deduplicate")) {
                out.deduplicate = *dedup;
            }
        }

        // "derivation" section
        if (j.contains("derivation") && j["derivation"].is_object()) {
            const auto& derivation = j["derivation"];
            if (derivation.contains("description_rules")) {
                auto known = all_derivation_rules();
                std::vector<std::string> rules;
                for (const auto& rule : get_string_array(derivation, "description_rules")) {
                    std::string name = to_lower(rule);
                    if (std::find(known.begin(), known.end(), name) != known.end()) {
                        rules.push_back(name);
                    } else {
                        result.warnings.push_back("invalid_configuration:unknown_rule:" + name);
                    }
                }
                result.config.derivation.rules = rules;
            }
        }

        // "batch" section
        if (j.contains("batch") && j["batch"].is_object()) {
            const auto& batch = j["batch"];
            auto& out = result.config.batch;

            read_count(batch, "workers", out.workers, result.warnings);
            read_count(batch, "queue_capacity", out.queue_capacity, result.warnings);
            read_count(batch, "batch_size", out.batch_size, result.warnings);

            if (batch.contains("document_time_budget_ms")) {
                if (batch["document_time_budget_ms"].is_number_integer()) {
                    out.document_time_budget_ms = batch["document_time_budget_ms"].get<long>();
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_document_time_budget_ms");
                }
            }
            if (batch.contains("skip_kinds")) {
                out.skip_kinds = get_string_array(batch, "skip_kinds");
            }
            if (auto templated = get_bool(batch, "skip_templated")) {
                out.skip_templated = *templated;
            }
            if (auto source = get_string(batch, "source")) {
                out.source = *source;
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (!val.is_string()) continue;
                std::string key_str = to_lower(key);
                if (!parse_warning_key(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_warning_key:" + key_str);
                    continue;
                }
                auto action = parse_warning_action(val.get<std::string>());
                if (action) {
                    result.config.warnings[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

RunConfigParseResult load_run_config(const std::string& path) {
    auto file = read_file(path);
    if (!file.ok) {
        RunConfigParseResult result;
        result.config = get_default_config();
        result.error = file.error;
        return result;
    }
    return parse_run_config(file.content, path);
}

} // namespace schemafm
