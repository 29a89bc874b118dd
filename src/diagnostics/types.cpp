#include "schemafm/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace schemafm {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "unresolved_reference") return Warning::unresolved_reference;
    if (lower == "unsupported_construct") return Warning::unsupported_construct;
    if (lower == "name_collision") return Warning::name_collision;
    if (lower == "model_inconsistency") return Warning::model_inconsistency;
    if (lower == "dangling_constraint") return Warning::dangling_constraint;
    if (lower == "ambiguous_key_path") return Warning::ambiguous_key_path;
    if (lower == "unmapped_key") return Warning::unmapped_key;
    if (lower == "invalid_document") return Warning::invalid_document;
    if (lower == "document_skipped") return Warning::document_skipped;
    if (lower == "translation_timeout") return Warning::translation_timeout;
    if (lower == "invalid_configuration") return Warning::invalid_configuration;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

std::optional<ValueKind> parse_value_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "verbatim") return ValueKind::Verbatim;
    if (lower == "boolean-presence" || lower == "boolean_presence" || lower == "presence") {
        return ValueKind::BooleanPresence;
    }
    if (lower == "enumerated") return ValueKind::Enumerated;
    return std::nullopt;
}

} // namespace schemafm
