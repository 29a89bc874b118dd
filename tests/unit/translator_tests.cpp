#include <doctest/doctest.h>
#include <schemafm/serializer.hpp>
#include <schemafm/translator.hpp>

#include <algorithm>

using namespace schemafm;
using nlohmann::ordered_json;

namespace {

const char* kModelText =
    "namespace Resources\n"
    "\n"
    "features\n"
    "\tResources {abstract}\n"
    "\t\tor\n"
    "\t\t\tPod\n"
    "\t\t\t\toptional\n"
    "\t\t\t\t\tString apiVersion\n"
    "\t\t\t\t\tmetadata\n"
    "\t\t\t\t\t\toptional\n"
    "\t\t\t\t\t\t\tString name\n"
    "\t\t\t\t\t\t\tlabels {map}\n"
    "\t\t\t\t\tspec\n"
    "\t\t\t\t\t\toptional\n"
    "\t\t\t\t\t\t\tcontainers {repeatable [1]}\n"
    "\t\t\t\t\t\t\t\toptional\n"
    "\t\t\t\t\t\t\t\t\tString name\n"
    "\t\t\t\t\t\t\t\t\tports {repeatable [1]}\n"
    "\t\t\t\t\t\t\t\t\t\toptional\n"
    "\t\t\t\t\t\t\t\t\t\t\tInteger containerPort\n"
    "\t\t\t\t\t\t\tString restartPolicy {enum ['Always', 'Never']}\n"
    "\t\t\t\t\t\t\tnodeSelector {map}\n"
    "\t\t\t\t\t\t\tmaxSurge\n"
    "\t\t\t\t\t\t\t\talternative\n"
    "\t\t\t\t\t\t\t\t\tString asString {branch 'string'}\n"
    "\t\t\t\t\t\t\t\t\tReal asNumber {branch 'number'}\n"
    "\t\t\t\t\t\t\tvolumes {repeatable [1]}\n"
    "\t\t\t\t\t\t\thostAliases {repeatable [1]}\n"
    "\t\t\t\t\t\t\t\toptional\n"
    "\t\t\t\t\t\t\t\t\tString ip\n";

KeyMapper pod_mapper() {
    auto parsed = parse_model(kModelText);
    REQUIRE_MESSAGE(parsed.ok, parsed.error);
    WarningCollector warnings;
    return KeyMapper::build(derive_key_mapping(parsed.model), warnings);
}

const char* kPodDocument = R"({
    "apiVersion": "v1",
    "kind": "Pod",
    "metadata": {"name": "web", "labels": {"app": "web", "tier": "front"}},
    "spec": {
        "containers": [
            {"name": "app", "ports": [{"containerPort": 80}, {"containerPort": 443}]},
            {"name": "sidecar"}
        ],
        "restartPolicy": "Never",
        "nodeSelector": null,
        "maxSurge": 3,
        "volumes": [],
        "hostAliases": [],
        "extra": {"x": 1},
        "gone": null
    }
})";

bool has(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("translate selects the features a document uses") {
    auto mapper = pod_mapper();
    ConfigurationTranslator translator(mapper);
    WarningCollector warnings;

    auto result = translator.translate(ordered_json::parse(kPodDocument), "pod.yaml", warnings);
    REQUIRE(result.isOk());
    const Selection& s = result.value();

    CHECK(s.document_id == "pod.yaml");
    CHECK(s.kind == "Pod");
    std::set<std::string> expected = {
        "Pod",
        "Pod.apiVersion",
        "Pod.metadata",
        "Pod.metadata.name",
        "Pod.metadata.labels",
        "Pod.spec",
        "Pod.spec.containers",
        "Pod.spec.containers.name",
        "Pod.spec.containers.ports",
        "Pod.spec.containers.ports.containerPort",
        "Pod.spec.restartPolicy",
        "Pod.spec.nodeSelector",
        "Pod.spec.nodeSelector.isNull",
        "Pod.spec.maxSurge",
        "Pod.spec.maxSurge.asNumber",
        "Pod.spec.volumes",
        "Pod.spec.hostAliases",
        "Pod.spec.hostAliases.isEmpty",
    };
    CHECK(s.selected == expected);

    SUBCASE("values") {
        CHECK(s.values.at("Pod.apiVersion") == "v1");
        CHECK(s.values.at("Pod.metadata.labels") == ordered_json::parse(R"({"app": "web", "tier": "front"})"));
        CHECK(s.values.at("Pod.spec.containers.name") == ordered_json::parse(R"(["app", "sidecar"])"));
        CHECK(s.values.at("Pod.spec.containers.ports.containerPort") == ordered_json::parse("[80, 443]"));
        CHECK(s.values.at("Pod.spec.restartPolicy") == "Never");
        CHECK(s.values.at("Pod.spec.maxSurge.asNumber") == 3);
        CHECK(s.values.at("Pod.spec.volumes") == ordered_json::array());
        CHECK(s.values.count("Pod.spec.nodeSelector") == 0);
        CHECK(s.values.count("Pod.metadata") == 0);
    }

    SUBCASE("unmapped keys") {
        CHECK(s.unmapped == std::vector<std::string>{"spec.extra.x", "spec.gone"});
        CHECK(s.ambiguous.empty());
        auto w = warnings.get_warnings();
        REQUIRE(w.size() == 2);
        CHECK(w[0].key == "unmapped_key");
    }
}

TEST_CASE("typed lookups pick union branches") {
    auto mapper = pod_mapper();
    ConfigurationTranslator translator(mapper);
    WarningCollector warnings;

    auto text = translator.translate(ordered_json::parse(R"({"kind": "Pod", "spec": {"maxSurge": "25%"}})"),
                                     "a", warnings);
    REQUIRE(text.isOk());
    CHECK(text.value().is_selected("Pod.spec.maxSurge.asString"));
    CHECK_FALSE(text.value().is_selected("Pod.spec.maxSurge.asNumber"));
    CHECK(text.value().values.at("Pod.spec.maxSurge.asString") == "25%");

    auto real = translator.translate(ordered_json::parse(R"({"kind": "Pod", "spec": {"maxSurge": 0.5}})"),
                                     "b", warnings);
    REQUIRE(real.isOk());
    CHECK(real.value().is_selected("Pod.spec.maxSurge.asNumber"));

    // No branch for booleans: the union itself is still selected
    auto flag = translator.translate(ordered_json::parse(R"({"kind": "Pod", "spec": {"maxSurge": true}})"),
                                     "c", warnings);
    REQUIRE(flag.isOk());
    CHECK(flag.value().is_selected("Pod.spec.maxSurge"));
    CHECK(flag.value().unmapped.empty());
}

TEST_CASE("ambiguous paths are recorded and their subtree skipped") {
    WarningCollector build_warnings;
    auto mapper = KeyMapper::build({
        {"Pod", "Pod", ValueKind::BooleanPresence},
        {"Pod.spec", "Pod.spec", ValueKind::BooleanPresence},
        {"Pod.spec.a", "Pod.spec.a", ValueKind::BooleanPresence},
        {"Pod.spec.a", "Pod.spec.a_2", ValueKind::BooleanPresence},
    }, build_warnings);
    ConfigurationTranslator translator(mapper);

    WarningCollector warnings;
    auto result = translator.translate(ordered_json::parse(R"({"kind": "Pod", "spec": {"a": {"b": 1}}})"),
                                       "doc", warnings);
    REQUIRE(result.isOk());
    CHECK(result.value().ambiguous == std::vector<std::string>{"spec.a"});
    CHECK(result.value().unmapped.empty());
    CHECK(result.value().selected == std::set<std::string>{"Pod", "Pod.spec"});

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(w[0].key == "ambiguous_key_path");
    CHECK(w[0].fields.at("key_path") == "spec.a");
}

TEST_CASE("an ambiguous branch still selects the union feature") {
    WarningCollector build_warnings;
    auto mapper = KeyMapper::build({
        {"Pod", "Pod", ValueKind::BooleanPresence},
        {"Pod.spec", "Pod.spec", ValueKind::BooleanPresence},
        {"Pod.spec.handler", "Pod.spec.handler", ValueKind::BooleanPresence},
        {"Pod.spec.handler@object", "Pod.spec.handler.exec", ValueKind::BooleanPresence},
        {"Pod.spec.handler@object", "Pod.spec.handler.httpGet", ValueKind::BooleanPresence},
    }, build_warnings);
    ConfigurationTranslator translator(mapper);

    WarningCollector warnings;
    auto result = translator.translate(
        ordered_json::parse(R"({"kind": "Pod", "spec": {"handler": {"command": ["true"]}}})"),
        "doc", warnings);
    REQUIRE(result.isOk());
    CHECK(result.value().ambiguous == std::vector<std::string>{"spec.handler"});
    CHECK(result.value().selected == std::set<std::string>{"Pod", "Pod.spec", "Pod.spec.handler"});
    CHECK(result.value().unmapped.empty());

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(w[0].key == "ambiguous_key_path");
}

TEST_CASE("translate rejects documents it cannot place") {
    auto mapper = pod_mapper();
    ConfigurationTranslator translator(mapper);
    WarningCollector warnings;

    auto array = translator.translate(ordered_json::parse("[1, 2]"), "list.json", warnings);
    REQUIRE(array.isErr());
    CHECK(array.error().code() == ErrorCode::DOCUMENT_INVALID);
    CHECK(array.error().message() == "list.json: document is not an object");

    auto no_kind = translator.translate(ordered_json::parse(R"({"kind": ""})"), "a.yaml", warnings);
    REQUIRE(no_kind.isErr());
    CHECK(no_kind.error().message() == "a.yaml: document has no kind");

    auto unknown = translator.translate(ordered_json::parse(R"({"kind": "Service"})"), "b.yaml", warnings);
    REQUIRE(unknown.isErr());
    CHECK(unknown.error().code() == ErrorCode::DOCUMENT_INVALID);
    CHECK(unknown.error().message() == "b.yaml: kind 'Service' is not mapped");
}

TEST_CASE("translate gives up when the time budget runs out") {
    CHECK(TranslatorOptions{}.time_budget.count() == 5000);

    WarningCollector build_warnings;
    auto mapper = KeyMapper::build({
        {"Pod", "Pod", ValueKind::BooleanPresence},
        {"Pod.spec", "Pod.spec", ValueKind::BooleanPresence},
        {"Pod.spec.items[*]", "Pod.spec.items", ValueKind::BooleanPresence},
    }, build_warnings);

    ordered_json doc = {{"kind", "Pod"}, {"spec", {{"items", ordered_json::array()}}}};
    for (int i = 0; i < 500000; ++i) {
        doc["spec"]["items"].push_back(i);
    }

    ConfigurationTranslator translator(mapper, TranslatorOptions{std::chrono::milliseconds(1)});
    WarningCollector warnings;
    auto result = translator.translate(doc, "big.json", warnings);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::TRANSLATION_TIMEOUT);

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(w[0].key == "translation_timeout");
    CHECK(w[0].fields.at("budget_ms") == "1");

    // Without a budget the same document completes
    ConfigurationTranslator unbounded(mapper, TranslatorOptions{std::chrono::milliseconds(0)});
    WarningCollector quiet;
    auto full = unbounded.translate(doc, "big.json", quiet);
    REQUIRE(full.isOk());
    CHECK(full.value().is_selected("Pod.spec.items"));
}

TEST_CASE("selections serialize to JSON and back") {
    auto mapper = pod_mapper();
    ConfigurationTranslator translator(mapper);
    WarningCollector warnings;
    auto result = translator.translate(ordered_json::parse(kPodDocument), "pod.yaml", warnings);
    REQUIRE(result.isOk());

    auto j = selection_to_json(result.value());
    CHECK(j["document_id"] == "pod.yaml");
    CHECK(j["selected"].is_array());
    CHECK(j["unmapped"] == ordered_json::parse(R"(["spec.extra.x", "spec.gone"])"));

    auto parsed = parse_selection(j.dump());
    REQUIRE_MESSAGE(parsed.ok, parsed.error);
    CHECK(parsed.selection.selected == result.value().selected);
    CHECK(parsed.selection.values == result.value().values);
    CHECK(parsed.selection.unmapped == result.value().unmapped);
    CHECK(parsed.selection.kind == "Pod");
}

TEST_CASE("parse_selection rejects malformed records") {
    CHECK(parse_selection("[1]").error == "selection must be a JSON object");
    CHECK(parse_selection("{}").error == "missing 'selected' array");
    auto broken = parse_selection("{");
    CHECK_FALSE(broken.ok);
    CHECK(broken.error.rfind("JSON parse error", 0) == 0);

    auto minimal = parse_selection(R"({"selected": ["Pod"]})");
    REQUIRE(minimal.ok);
    CHECK(minimal.selection.is_selected("Pod"));
    CHECK(minimal.selection.document_id.empty());
}
