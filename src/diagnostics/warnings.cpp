#include "schemafm/warnings.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace schemafm {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string describe_fields(const std::unordered_map<std::string, std::string>& fields) {
    // Sorted so log lines are stable between runs
    std::map<std::string, std::string> sorted(fields.begin(), fields.end());
    std::string out;
    for (const auto& [k, v] : sorted) {
        if (!out.empty()) out += ", ";
        out += k + "=" + v;
    }
    return out;
}

} // namespace

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit_with_context(Warning warning, const std::string& context) {
    std::unordered_map<std::string, std::string> fields;
    if (!context.empty()) {
        fields["context"] = context;
    }
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    std::string key = to_lower(warning_key);
    WarningAction action = get_effective_action(key);

    if (action != WarningAction::Ignore) {
        spdlog::debug("{} [{}]: {}", key, action_to_string(action), describe_fields(fields));
    }

    // Ignored warnings are still collected so counts() stays complete
    warnings_.push_back({std::move(key), std::move(fields), action});
}

void WarningCollector::merge(const WarningCollector& other) {
    for (const auto& w : other.warnings_) {
        warnings_.push_back({w.key, w.fields, get_effective_action(w.key)});
    }
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

std::map<std::string, std::size_t> WarningCollector::counts() const {
    std::map<std::string, std::size_t> result;
    for (const auto& w : warnings_) {
        ++result[w.key];
    }
    return result;
}

bool WarningCollector::has_errors() const {
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Error) {
            return true;
        }
    }
    return false;
}

bool WarningCollector::has_effective_warnings() const {
    for (const auto& w : warnings_) {
        if (w.effective_action != WarningAction::Ignore) {
            return true;
        }
    }
    return false;
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    auto policy_it = policy_.find(to_lower(key));
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    // Default: warn
    return WarningAction::Warn;
}

} // namespace schemafm
