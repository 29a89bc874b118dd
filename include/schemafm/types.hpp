#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace schemafm {

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    unresolved_reference,     // SchemaError: $ref target missing, branch dropped
    unsupported_construct,    // SchemaError: node degraded to an unknown feature
    name_collision,
    model_inconsistency,      // requires and excludes derived for the same pair
    dangling_constraint,
    ambiguous_key_path,       // MappingError
    unmapped_key,             // MappingError
    invalid_document,         // FatalError for one document
    document_skipped,
    translation_timeout,
    invalid_configuration,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::unresolved_reference: return "unresolved_reference";
        case Warning::unsupported_construct: return "unsupported_construct";
        case Warning::name_collision: return "name_collision";
        case Warning::model_inconsistency: return "model_inconsistency";
        case Warning::dangling_constraint: return "dangling_constraint";
        case Warning::ambiguous_key_path: return "ambiguous_key_path";
        case Warning::unmapped_key: return "unmapped_key";
        case Warning::invalid_document: return "invalid_document";
        case Warning::document_skipped: return "document_skipped";
        case Warning::translation_timeout: return "translation_timeout";
        case Warning::invalid_configuration: return "invalid_configuration";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

// ============================================================================
// Warning Action
// ============================================================================

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

// ============================================================================
// Warning Object
// ============================================================================

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Value kinds of the key mapping table
// ============================================================================

enum class ValueKind {
    Verbatim,
    BooleanPresence,
    Enumerated
};

inline const char* value_kind_to_string(ValueKind k) {
    switch (k) {
        case ValueKind::Verbatim: return "verbatim";
        case ValueKind::BooleanPresence: return "boolean-presence";
        case ValueKind::Enumerated: return "enumerated";
        default: return "verbatim";
    }
}

std::optional<ValueKind> parse_value_kind(const std::string& s);

} // namespace schemafm
