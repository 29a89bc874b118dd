#include <doctest/doctest.h>
#include <schemafm/config.hpp>
#include <schemafm/constraint_deriver.hpp>

#include <algorithm>

using namespace schemafm;
using nlohmann::ordered_json;

namespace {

std::vector<Constraint> derive(const char* schema, WarningCollector& warnings,
                               DerivationOptions options = default_derivation_options()) {
    auto resolved = SchemaGraph::resolve(ordered_json::parse(schema), {}, warnings);
    REQUIRE_MESSAGE(resolved.ok, resolved.error);
    auto kinds = select_kinds(resolved.graph, "esc_", warnings);
    REQUIRE_FALSE(kinds.empty());
    FeatureSynthesizer synthesizer(resolved.graph, {});
    auto synthesis = synthesizer.synthesize(kinds.front(), warnings);
    return derive_constraints(resolved.graph, synthesis, options, warnings);
}

std::vector<std::string> texts(const std::vector<Constraint>& constraints) {
    std::vector<std::string> out;
    for (const auto& c : constraints) out.push_back(c.text());
    return out;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("dependentRequired yields requires constraints") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Volume": {
        "type": "object",
        "properties": {"server": {"type": "string"}, "path": {"type": "string"}, "readOnly": {"type": "boolean"}},
        "dependentRequired": {"server": ["path", "missing"]}
    }})", warnings);

    REQUIRE(constraints.size() == 1);
    CHECK(constraints[0].kind == ConstraintKind::Requires);
    CHECK(constraints[0].text() == "Volume.server => Volume.path");
    CHECK(constraints[0].rule == kRuleDependentRequired);
    CHECK(constraints[0].trace == "Volume/dependentRequired/server");
}

TEST_CASE("if/then with a constant yields an equality implication") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Volume": {
        "type": "object",
        "properties": {"type": {"type": "string"}, "server": {"type": "string"}},
        "if": {"properties": {"type": {"const": "nfs"}}},
        "then": {"required": ["server"]}
    }})", warnings);

    REQUIRE(constraints.size() == 1);
    CHECK(constraints[0].text() == "Volume.type == 'nfs' => Volume.server");
    CHECK(constraints[0].kind == ConstraintKind::Expression);
    CHECK(constraints[0].rule == kRuleConditionalRequired);
}

TEST_CASE("description rules read required-when and forbidden-when phrases") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Service": {
        "type": "object",
        "properties": {
            "type": {"type": "string"},
            "hostNetwork": {"type": "boolean"},
            "nodePort": {"type": "integer", "description": "Required when `type` is `NodePort`."},
            "hostPort": {"type": "integer", "description": "Must be specified if hostNetwork is set."},
            "clusterIP": {"type": "string", "description": "Cannot be set when `hostNetwork` is true."},
            "externalName": {"type": "string", "description": "Must not be specified if nodePort is set."}
        }
    }})", warnings);

    auto t = texts(constraints);
    CHECK(contains(t, "Service.type == 'NodePort' => Service.nodePort"));
    CHECK(contains(t, "Service.hostNetwork => Service.hostPort"));
    CHECK(contains(t, "Service.hostNetwork == 'true' => !Service.clusterIP"));
    CHECK(contains(t, "Service.nodePort => !Service.externalName"));
    CHECK(t.size() == 4);
}

TEST_CASE("mutually exclusive descriptions yield pairwise excludes") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Probe": {
        "type": "object",
        "description": "Exactly one of `exec`, `httpGet` or `tcpSocket` must be specified.",
        "properties": {
            "exec": {"type": "object", "properties": {"command": {"type": "string"}}},
            "httpGet": {"type": "object", "properties": {"path": {"type": "string"}}},
            "tcpSocket": {"type": "object", "properties": {"port": {"type": "integer"}}},
            "secret": {"type": "string", "description": "Mutually exclusive with token."},
            "token": {"type": "string"}
        }
    }})", warnings);

    auto t = texts(constraints);
    CHECK(contains(t, "Probe.exec => !Probe.httpGet"));
    CHECK(contains(t, "Probe.exec => !Probe.tcpSocket"));
    CHECK(contains(t, "Probe.httpGet => !Probe.tcpSocket"));
    CHECK(contains(t, "Probe => Probe.exec | Probe.httpGet | Probe.tcpSocket"));
    CHECK(contains(t, "Probe.token => !Probe.secret"));
    CHECK(t.size() == 5);
}

TEST_CASE("required-only oneOf yields exclusion and coverage") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Source": {
        "type": "object",
        "properties": {"configMap": {"type": "string"}, "secret": {"type": "string"}},
        "oneOf": [{"required": ["configMap"]}, {"required": ["secret"]}]
    }})", warnings);

    auto t = texts(constraints);
    REQUIRE(t.size() == 2);
    CHECK(t[0] == "Source.configMap => !Source.secret");
    CHECK(t[1] == "Source => Source.configMap | Source.secret");
    CHECK(constraints[0].rule == kRuleUnionExclusive);
}

TEST_CASE("exclusive unions with an exclusivity phrase exclude their branches") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Holder": {
        "type": "object",
        "properties": {
            "value": {"description": "Only one of the forms may be used.",
                      "oneOf": [{"type": "string"}, {"type": "integer"}]},
            "plain": {"oneOf": [{"type": "string"}, {"type": "integer"}]}
        }
    }})", warnings);

    auto t = texts(constraints);
    REQUIRE(t.size() == 1);
    CHECK(t[0] == "Holder.value.asString => !Holder.value.asInteger");
}

TEST_CASE("numeric descriptions yield bound constraints") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Endpoint": {
        "type": "object",
        "properties": {
            "port": {"type": "integer", "description": "Number of the port to access. This must be a valid port number, 0 < x < 65536."},
            "hostPort": {"type": "integer", "description": "If specified, this must be a valid port number."},
            "periodSeconds": {"type": "integer", "description": "How often to check. Minimum value is 1."},
            "terminationGracePeriodSeconds": {"type": "integer", "description": "Value must be non-negative integer."},
            "weight": {"type": "integer", "description": "Weight associated with matching, in the range 1-100."},
            "ratio": {"type": "number", "description": "Must be greater than zero and less than or equal to 10."},
            "name": {"type": "string", "description": "Minimum value is 3."}
        }
    }})", warnings);

    auto t = texts(constraints);
    CHECK(contains(t, "Endpoint.port => Endpoint.port > 0 & Endpoint.port < 65536"));
    CHECK(contains(t, "Endpoint.hostPort => Endpoint.hostPort >= 1 & Endpoint.hostPort <= 65535"));
    CHECK(contains(t, "Endpoint.periodSeconds => Endpoint.periodSeconds >= 1"));
    CHECK(contains(t, "Endpoint.terminationGracePeriodSeconds => Endpoint.terminationGracePeriodSeconds >= 0"));
    CHECK(contains(t, "Endpoint.weight => Endpoint.weight >= 1 & Endpoint.weight <= 100"));
    CHECK(contains(t, "Endpoint.ratio => Endpoint.ratio > 0 & Endpoint.ratio <= 10"));
    // Only numeric attributes are bounded
    CHECK(t.size() == 6);
    CHECK(constraints[0].rule == kRuleBounds);
    CHECK(constraints[0].kind == ConstraintKind::Expression);
    CHECK(constraints[0].trace == "Endpoint/port");
}

TEST_CASE("disabled rules produce nothing") {
    WarningCollector warnings;
    DerivationOptions options;
    options.rules = {kRuleConditionalRequired};
    auto constraints = derive(R"({"Volume": {
        "type": "object",
        "properties": {"server": {"type": "string"}, "path": {"type": "string", "description": "Mutually exclusive with server."}},
        "dependentRequired": {"server": ["path"]}
    }})", warnings, options);

    CHECK(constraints.empty());
}

TEST_CASE("conflicting requires and excludes are both kept and flagged") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Volume": {
        "type": "object",
        "properties": {
            "server": {"type": "string"},
            "path": {"type": "string", "description": "Cannot be set when server is set."}
        },
        "dependentRequired": {"server": ["path"]}
    }})", warnings);

    auto t = texts(constraints);
    CHECK(contains(t, "Volume.server => Volume.path"));
    CHECK(contains(t, "Volume.server => !Volume.path"));

    auto conflicts = find_conflicts(constraints);
    REQUIRE(conflicts.size() == 1);

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(w[0].key == "model_inconsistency");
    CHECK(w[0].fields.at("first") == "Volume.server => Volume.path");
    CHECK(w[0].fields.at("second") == "Volume.server => !Volume.path");
    CHECK(w[0].fields.at("first_trace") == "dependent-required@Volume/dependentRequired/server");
}

TEST_CASE("an exclusion conflicts with requires in either orientation") {
    WarningCollector warnings;
    auto constraints = derive(R"({"Volume": {
        "type": "object",
        "properties": {
            "server": {"type": "string"},
            "path": {"type": "string", "description": "Cannot be set when server is set."}
        },
        "dependentRequired": {"path": ["server"]}
    }})", warnings);

    auto t = texts(constraints);
    CHECK(contains(t, "Volume.path => Volume.server"));
    CHECK(contains(t, "Volume.server => !Volume.path"));
    REQUIRE(find_conflicts(constraints).size() == 1);

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(w[0].key == "model_inconsistency");
    CHECK(w[0].fields.at("first") == "Volume.path => Volume.server");
    CHECK(w[0].fields.at("second") == "Volume.server => !Volume.path");

    SUBCASE("both requires orientations pair with one exclusion") {
        std::vector<Constraint> list;
        list.push_back(make_requires("a", "b", "dependent-required", "t1"));
        list.push_back(make_requires("b", "a", "dependent-required", "t2"));
        list.push_back(make_excludes("b", "a", "union-exclusive", "t3"));
        list.push_back(make_excludes("a", "c", "union-exclusive", "t4"));

        auto conflicts = find_conflicts(list);
        REQUIRE(conflicts.size() == 2);
        CHECK(conflicts[0] == std::make_pair(std::size_t{1}, std::size_t{2}));
        CHECK(conflicts[1] == std::make_pair(std::size_t{0}, std::size_t{2}));
    }
}

TEST_CASE("deduplicate_constraints keeps the first occurrence") {
    std::vector<Constraint> constraints;
    constraints.push_back(make_requires("a", "b", "dependent-required", "first"));
    constraints.push_back(make_requires("a", "b", "conditional-required", "second"));
    constraints.push_back(make_excludes("a", "c", "union-exclusive", "third"));

    deduplicate_constraints(constraints);
    REQUIRE(constraints.size() == 2);
    CHECK(constraints[0].trace == "first");
    CHECK(constraints[1].text() == "a => !c");
}
