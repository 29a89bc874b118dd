#include <doctest/doctest.h>
#include <schemafm/document.hpp>
#include <schemafm/platform.hpp>

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <filesystem>
#include <random>

using namespace schemafm;
using nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace {

std::vector<Document> parse_yaml(const std::string& text, WarningCollector& warnings,
                                 const DocumentOptions& options = {}) {
    auto result = parse_documents(text, DocumentFormat::Yaml, "deploy.yaml", options, warnings);
    REQUIRE(result.isOk());
    return result.value();
}

std::string reason(const WarningObject& w) { return w.fields.at("reason"); }

} // namespace

TEST_CASE("detect_document_format goes by extension") {
    CHECK(detect_document_format("a/pod.json") == DocumentFormat::Json);
    CHECK(detect_document_format("a/pod.JSON") == DocumentFormat::Json);
    CHECK(detect_document_format("a/pod.yaml") == DocumentFormat::Yaml);
    CHECK(detect_document_format("a/pod.yml") == DocumentFormat::Yaml);
    CHECK(detect_document_format("a/pod") == DocumentFormat::Yaml);
}

TEST_CASE("yaml_to_json infers plain scalar types") {
    auto j = yaml_to_json(YAML::Load(
        "count: 3\n"
        "negative: -12\n"
        "ratio: 0.5\n"
        "exp: 1e3\n"
        "enabled: true\n"
        "disabled: False\n"
        "nothing: ~\n"
        "empty:\n"
        "word: hello\n"
        "quoted: \"3\"\n"
        "single: 'true'\n"
        "version: 1.2.3\n"
        "big: 99999999999999999999\n"
        "infinite: .inf\n"
        "list: [1, two, null]\n"));

    CHECK(j["count"] == 3);
    CHECK(j["count"].is_number_integer());
    CHECK(j["negative"] == -12);
    CHECK(j["ratio"] == 0.5);
    CHECK(j["exp"].is_number_float());
    CHECK(j["exp"] == 1000.0);
    CHECK(j["enabled"] == true);
    CHECK(j["disabled"] == false);
    CHECK(j["nothing"].is_null());
    CHECK(j["empty"].is_null());
    CHECK(j["word"] == "hello");
    CHECK(j["quoted"] == "3");
    CHECK(j["single"] == "true");
    CHECK(j["version"] == "1.2.3");
    CHECK(j["big"].is_number_float());
    CHECK(std::isinf(j["infinite"].get<double>()));
    CHECK(j["list"] == ordered_json::parse(R"([1, "two", null])"));
}

TEST_CASE("yaml_to_json keeps mapping order") {
    auto j = yaml_to_json(YAML::Load("zeta: 1\nalpha: 2\nmid: 3\n"));
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    CHECK(keys == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("a single document uses the file path as id") {
    WarningCollector warnings;
    auto docs = parse_yaml("apiVersion: v1\nkind: Pod\nmetadata:\n  name: web\n", warnings);
    REQUIRE(docs.size() == 1);
    CHECK(docs[0].id == "deploy.yaml");
    CHECK(docs[0].kind == "Pod");
    CHECK(docs[0].source_path == "deploy.yaml");
    CHECK(docs[0].content["metadata"]["name"] == "web");
    CHECK(warnings.get_warnings().empty());
}

TEST_CASE("multi-document streams get indexed ids") {
    WarningCollector warnings;
    auto docs = parse_yaml(
        "---\n"
        "apiVersion: v1\nkind: Service\n"
        "---\n"
        "---\n"
        "apiVersion: apps/v1\nkind: Deployment\n", warnings);
    REQUIRE(docs.size() == 2);
    CHECK(docs[0].id == "deploy.yaml#0");
    CHECK(docs[1].id == "deploy.yaml#1");
    CHECK(docs[1].index == 1);
    CHECK(docs[1].kind == "Deployment");
}

TEST_CASE("List documents contribute their items") {
    WarningCollector warnings;
    auto docs = parse_yaml(
        "apiVersion: v1\n"
        "kind: List\n"
        "items:\n"
        "- apiVersion: v1\n  kind: ConfigMap\n"
        "- apiVersion: v1\n  kind: Secret\n", warnings);
    REQUIRE(docs.size() == 2);
    CHECK(docs[0].kind == "ConfigMap");
    CHECK(docs[0].id == "deploy.yaml#0");
    CHECK(docs[1].kind == "Secret");
}

TEST_CASE("documents without identity or of skipped kinds are reported") {
    WarningCollector warnings;
    DocumentOptions options;
    options.skip_kinds = {"CustomResourceDefinition"};
    auto docs = parse_yaml(
        "kind: Pod\n"
        "---\n"
        "apiVersion: v1\n"
        "---\n"
        "- just\n- a list\n"
        "---\n"
        "apiVersion: apiextensions.k8s.io/v1\nkind: CustomResourceDefinition\n"
        "---\n"
        "apiVersion: v1\nkind: Namespace\n", warnings, options);

    REQUIRE(docs.size() == 1);
    CHECK(docs[0].kind == "Namespace");
    CHECK(docs[0].id == "deploy.yaml#4");

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 4);
    CHECK(w[0].key == "document_skipped");
    CHECK(reason(w[0]) == "missing apiVersion");
    CHECK(w[0].fields.at("document_id") == "deploy.yaml#0");
    CHECK(reason(w[1]) == "missing kind");
    CHECK(w[2].key == "invalid_document");
    CHECK(reason(w[2]) == "document is not an object");
    CHECK(reason(w[3]) == "skipped kind CustomResourceDefinition");
}

TEST_CASE("templated files are skipped whole") {
    WarningCollector warnings;
    auto docs = parse_yaml("apiVersion: v1\nkind: Pod\nmetadata:\n  name: {{ .Values.name }}\n", warnings);
    CHECK(docs.empty());
    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(reason(w[0]) == "templated");

    DocumentOptions keep;
    keep.skip_templated = false;
    WarningCollector quiet;
    auto kept = parse_yaml("apiVersion: v1\nkind: Pod\nmetadata:\n  name: \"{{ name }}\"\n", quiet, keep);
    REQUIRE(kept.size() == 1);
    CHECK(kept[0].content["metadata"]["name"] == "{{ name }}");
}

TEST_CASE("JSON documents parse as one document") {
    WarningCollector warnings;
    auto result = parse_documents(R"({"apiVersion": "v1", "kind": "Pod", "spec": {"replicas": 2}})",
                                  DocumentFormat::Json, "pod.json", {}, warnings);
    REQUIRE(result.isOk());
    REQUIRE(result.value().size() == 1);
    CHECK(result.value()[0].id == "pod.json");
    CHECK(result.value()[0].content["spec"]["replicas"] == 2);
}

TEST_CASE("syntax errors fail the file") {
    WarningCollector warnings;

    auto json = parse_documents("{\"kind\": ", DocumentFormat::Json, "pod.json", {}, warnings);
    REQUIRE(json.isErr());
    CHECK(json.error().code() == ErrorCode::DOCUMENT_INVALID);
    CHECK(json.error().message().rfind("pod.json: JSON parse error", 0) == 0);

    auto yaml = parse_documents("kind: [Pod\n", DocumentFormat::Yaml, "pod.yaml", {}, warnings);
    REQUIRE(yaml.isErr());
    CHECK(yaml.error().code() == ErrorCode::DOCUMENT_INVALID);
    CHECK(yaml.error().message().rfind("pod.yaml: YAML parse error", 0) == 0);
}

TEST_CASE("load_documents reads from disk") {
    std::random_device rd;
    fs::path dir = fs::temp_directory_path() / ("schemafm_documents_" + std::to_string(rd()));
    fs::create_directories(dir);
    std::string path = (dir / "pod.yml").string();
    REQUIRE(atomic_write_file(path, "apiVersion: v1\nkind: Pod\n").ok);

    WarningCollector warnings;
    auto docs = load_documents(path, {}, warnings);
    REQUIRE(docs.isOk());
    REQUIRE(docs.value().size() == 1);
    CHECK(docs.value()[0].id == path);

    auto missing = load_documents((dir / "absent.yaml").string(), {}, warnings);
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::FILE_NOT_FOUND);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
