#include <doctest/doctest.h>
#include <schemafm/warnings.hpp>
#include <schemafm/types.hpp>

using namespace schemafm;

TEST_CASE("warning_to_string returns correct warning key") {
    CHECK(std::string(warning_to_string(Warning::unresolved_reference)) == "unresolved_reference");
    CHECK(std::string(warning_to_string(Warning::ambiguous_key_path)) == "ambiguous_key_path");
    CHECK(std::string(warning_to_string(Warning::unmapped_key)) == "unmapped_key");
    CHECK(std::string(warning_to_string(Warning::translation_timeout)) == "translation_timeout");
}

TEST_CASE("parse_warning_key parses known warning keys") {
    CHECK(parse_warning_key("unresolved_reference") == Warning::unresolved_reference);
    CHECK(parse_warning_key("model_inconsistency") == Warning::model_inconsistency);
    CHECK(parse_warning_key("document_skipped") == Warning::document_skipped);
    CHECK(parse_warning_key("UNMAPPED_KEY") == Warning::unmapped_key);
}

TEST_CASE("parse_warning_key returns nullopt for unknown keys") {
    CHECK_FALSE(parse_warning_key("unknown_warning").has_value());
    CHECK_FALSE(parse_warning_key("").has_value());
    CHECK_FALSE(parse_warning_key("invalid_manifest").has_value());
}

TEST_CASE("parse_warning_action accepts the three actions") {
    CHECK(parse_warning_action("warn") == WarningAction::Warn);
    CHECK(parse_warning_action("ignore") == WarningAction::Ignore);
    CHECK(parse_warning_action("error") == WarningAction::Error);
    CHECK_FALSE(parse_warning_action("fatal").has_value());
}

TEST_CASE("value kinds round-trip through their names") {
    CHECK(std::string(value_kind_to_string(ValueKind::BooleanPresence)) == "boolean-presence");
    CHECK(parse_value_kind("verbatim") == ValueKind::Verbatim);
    CHECK(parse_value_kind("enumerated") == ValueKind::Enumerated);
    CHECK(parse_value_kind("presence") == ValueKind::BooleanPresence);
    CHECK_FALSE(parse_value_kind("boolean").has_value());
}

TEST_CASE("WarningCollector default policy is warn") {
    WarningCollector collector;

    collector.emit_with_context(Warning::unmapped_key, "Pod.spec.foo");

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[0].key == "unmapped_key");
    CHECK(warnings[0].fields.at("context") == "Pod.spec.foo");
}

TEST_CASE("WarningCollector applies error policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["unresolved_reference"] = WarningAction::Error;

    WarningCollector collector(policy);
    collector.emit(Warning::unresolved_reference,
                   warnings::unresolved_reference("#/definitions/Missing", "Pod/spec"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
    CHECK(warnings[0].fields.at("reference") == "#/definitions/Missing");
    CHECK(collector.has_errors());
}

TEST_CASE("WarningCollector applies ignore policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["unmapped_key"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    collector.emit(Warning::unmapped_key, warnings::unmapped_key("foo.bar", "doc.yaml"));

    CHECK(collector.get_warnings().empty());
    CHECK_FALSE(collector.has_effective_warnings());
    // Ignored warnings still count
    CHECK(collector.counts().at("unmapped_key") == 1);
}

TEST_CASE("WarningCollector emits by key string case-insensitively") {
    WarningCollector collector;
    collector.emit("Document_Skipped", {{"reason", "templated"}});

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "document_skipped");
}

TEST_CASE("WarningCollector merge re-evaluates against the receiving policy") {
    WarningCollector worker;
    worker.emit(Warning::unmapped_key);
    worker.emit(Warning::document_skipped);

    std::unordered_map<std::string, WarningAction> policy;
    policy["unmapped_key"] = WarningAction::Error;
    WarningCollector main_collector(policy);
    main_collector.merge(worker);

    CHECK(main_collector.size() == 2);
    CHECK(main_collector.has_errors());
    CHECK_FALSE(worker.has_errors());
}

TEST_CASE("WarningCollector counts and clear") {
    WarningCollector collector;
    collector.emit(Warning::name_collision);
    collector.emit(Warning::name_collision);
    collector.emit(Warning::dangling_constraint);

    auto counts = collector.counts();
    CHECK(counts.at("name_collision") == 2);
    CHECK(counts.at("dangling_constraint") == 1);

    collector.clear();
    CHECK(collector.size() == 0);
    CHECK(collector.counts().empty());
}

TEST_CASE("invalid_configuration fields omit empty field list") {
    auto fields = warnings::invalid_configuration("unknown_rule", "config.json");
    CHECK(fields.count("fields") == 0);

    auto with_fields = warnings::invalid_configuration("unknown_rule", "config.json", "derivation");
    CHECK(with_fields.at("fields") == "derivation");
}
