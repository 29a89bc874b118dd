#pragma once

#include "schemafm/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <unordered_map>

namespace schemafm {

// ============================================================================
// Warning Collector
// ============================================================================

// Accumulates recoverable conditions for one unit of work (one schema build,
// one document). Not thread-safe: workers own a collector each and the
// results are merged after the join.
class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    void set_policy(const std::unordered_map<std::string, WarningAction>& policy) {
        policy_ = policy;
    }

    const std::unordered_map<std::string, WarningAction>& policy() const { return policy_; }

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning with context string (convenience)
    void emit_with_context(Warning warning, const std::string& context);

    // Emit a warning by key string
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Append everything another collector gathered, re-evaluated against this policy
    void merge(const WarningCollector& other);

    // Get all emitted warnings after policy application.
    // Warnings with action "ignore" are excluded.
    std::vector<WarningObject> get_warnings() const;

    // Per-key totals including ignored warnings
    std::map<std::string, std::size_t> counts() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    // Check if any effective warnings remain (excluding ignored)
    bool has_effective_warnings() const;

    std::size_t size() const { return warnings_.size(); }

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Field builders for specific warnings
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> unresolved_reference(
    const std::string& reference,
    const std::string& source_path) {
    return {{"reference", reference}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> unsupported_construct(
    const std::string& construct,
    const std::string& source_path) {
    return {{"construct", construct}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> name_collision(
    const std::string& name,
    const std::string& renamed_to,
    const std::string& source_path) {
    return {{"name", name}, {"renamed_to", renamed_to}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> model_inconsistency(
    const std::string& first,
    const std::string& second,
    const std::string& first_trace,
    const std::string& second_trace) {
    return {{"first", first}, {"second", second},
            {"first_trace", first_trace}, {"second_trace", second_trace}};
}

inline std::unordered_map<std::string, std::string> dangling_constraint(
    const std::string& constraint,
    const std::string& missing_id,
    const std::string& trace) {
    return {{"constraint", constraint}, {"missing", missing_id}, {"trace", trace}};
}

inline std::unordered_map<std::string, std::string> ambiguous_key_path(
    const std::string& key_path,
    const std::string& candidates) {
    return {{"key_path", key_path}, {"candidates", candidates}};
}

inline std::unordered_map<std::string, std::string> unmapped_key(
    const std::string& key_path,
    const std::string& document_id) {
    return {{"key_path", key_path}, {"document_id", document_id}};
}

inline std::unordered_map<std::string, std::string> invalid_document(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> document_skipped(
    const std::string& reason,
    const std::string& document_id) {
    return {{"reason", reason}, {"document_id", document_id}};
}

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path,
    const std::string& fields = "") {
    std::unordered_map<std::string, std::string> result = {
        {"reason", reason}, {"source_path", source_path}
    };
    if (!fields.empty()) {
        result["fields"] = fields;
    }
    return result;
}

} // namespace warnings

} // namespace schemafm
