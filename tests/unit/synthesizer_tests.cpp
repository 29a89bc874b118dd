#include <doctest/doctest.h>
#include <schemafm/synthesizer.hpp>

using namespace schemafm;
using nlohmann::ordered_json;

namespace {

struct Synthesized {
    SchemaGraph graph;
    std::vector<KindRoot> kinds;
    KindSynthesis first;
};

Synthesized synthesize(const char* schema, WarningCollector& warnings, SynthesisOptions options = {}) {
    Synthesized out;
    auto resolved = SchemaGraph::resolve(ordered_json::parse(schema), {}, warnings);
    REQUIRE_MESSAGE(resolved.ok, resolved.error);
    out.graph = std::move(resolved.graph);
    out.kinds = select_kinds(out.graph, options.escape_prefix, warnings);
    REQUIRE_FALSE(out.kinds.empty());
    FeatureSynthesizer synthesizer(out.graph, options);
    out.first = synthesizer.synthesize(out.kinds.front(), warnings);
    return out;
}

const FeatureNode* child(const FeatureNode& node, const std::string& name) {
    for (const auto& c : node.children) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

} // namespace

TEST_CASE("sanitize_feature_name escapes reserved words and odd characters") {
    CHECK(sanitize_feature_name("containerPort", "esc_") == "containerPort");
    CHECK(sanitize_feature_name("x-kubernetes-list", "esc_") == "x_kubernetes_list");
    CHECK(sanitize_feature_name("namespace", "esc_") == "esc_namespace");
    CHECK(sanitize_feature_name("features", "k_") == "k_features");
    CHECK(sanitize_feature_name("3d", "esc_") == "esc_3d");
    CHECK(sanitize_feature_name("", "esc_") == "esc_empty");
    CHECK(is_reserved_word("isNull"));
    CHECK_FALSE(is_reserved_word("spec"));
}

TEST_CASE("enum values are read from the description marker") {
    std::string description =
        "Restart policy for all containers.\n\n"
        "Possible enum values:\n"
        " - `\"Always\"`\n"
        " - `\"Never\"` means never restart\n"
        " - `\"OnFailure\"`\n"
        " - `\"Never\"`";
    CHECK(enum_values_from_description(description) ==
          std::vector<std::string>{"Always", "Never", "OnFailure"});
    CHECK(enum_values_from_description("Plain text.").empty());
}

TEST_CASE("required and deprecated description markers") {
    CHECK(description_marks_required("Name of the container. Required."));
    CHECK(description_marks_required("Required.  "));
    CHECK_FALSE(description_marks_required("Required if the type is nfs."));

    CHECK(description_marks_deprecated("DEPRECATED: use spec.foo"));
    CHECK(description_marks_deprecated("Deprecated. Use foo instead."));
    CHECK(description_marks_deprecated("Field is deprecated: do not use"));
    CHECK_FALSE(description_marks_deprecated("The deprecation window."));
}

TEST_CASE("objects become and-groups with cardinality from required") {
    WarningCollector warnings;
    auto s = synthesize(R"({"definitions": {
        "io.k8s.api.core.v1.Pod": {
            "type": "object",
            "description": "Pod is a collection of containers.",
            "required": ["spec"],
            "properties": {
                "spec": {"$ref": "#/definitions/io.k8s.api.core.v1.PodSpec"},
                "hostname": {"type": "string", "description": "Hostname. Required."},
                "old": {"type": "string", "description": "DEPRECATED: unused."},
                "priority": {"type": "integer"},
                "weight": {"type": "number"},
                "enabled": {"type": "boolean"}
            }
        },
        "io.k8s.api.core.v1.PodSpec": {"type": "object", "properties": {"nodeName": {"type": "string"}}}
    }})", warnings);

    CHECK(s.kinds.front().name == "Pod");
    CHECK(s.kinds.front().key == "Pod");

    const FeatureNode& pod = s.first.tree;
    CHECK(pod.id == "Pod");
    CHECK(pod.key == "Pod");
    CHECK(pod.group == GroupType::And);
    CHECK(pod.provenance == "io.k8s.api.core.v1.Pod");
    REQUIRE(pod.children.size() == 6);

    const FeatureNode* spec = child(pod, "spec");
    REQUIRE(spec != nullptr);
    CHECK(spec->id == "Pod.spec");
    CHECK(spec->is_mandatory());
    CHECK(spec->provenance == "io.k8s.api.core.v1.PodSpec");
    REQUIRE(child(*spec, "nodeName") != nullptr);
    CHECK(child(*spec, "nodeName")->id == "Pod.spec.nodeName");

    CHECK(child(pod, "hostname")->is_mandatory());
    CHECK(child(pod, "hostname")->type == AttributeType::String);
    CHECK(child(pod, "old")->deprecated);
    CHECK_FALSE(child(pod, "old")->is_mandatory());
    CHECK(child(pod, "priority")->type == AttributeType::Integer);
    CHECK(child(pod, "weight")->type == AttributeType::Real);
    CHECK(child(pod, "enabled")->type == AttributeType::None);

    CHECK(s.first.descriptions.at("Pod") == "Pod is a collection of containers.");
    CHECK(s.first.descriptions.at("Pod.hostname") == "Hostname. Required.");

    // Instances are recorded once their subtree is complete
    REQUIRE(s.first.objects.size() == 2);
    CHECK(s.first.objects[0].feature_id == "Pod.spec");
    CHECK(s.first.objects[1].feature_id == "Pod");
    CHECK(s.first.objects[1].kind_id == "Pod");
    CHECK(s.first.objects[1].properties.at("spec") == "Pod.spec");
}

TEST_CASE("arrays add repeat depth and maps are marked") {
    WarningCollector warnings;
    auto s = synthesize(R"({"Pod": {
        "type": "object",
        "properties": {
            "containers": {"type": "array", "items": {"$ref": "#/definitions/Container"}},
            "matrix": {"type": "array", "items": {"type": "array", "items": {"type": "integer"}}},
            "labels": {"type": "object", "additionalProperties": {"type": "string"}},
            "volumes": {"type": "object", "additionalProperties": {"$ref": "#/definitions/Volume"}},
            "raw": {"type": "object"}
        }
    },
    "Container": {"type": "object", "required": ["name"], "properties": {"name": {"type": "string"}}},
    "Volume": {"type": "object", "properties": {"path": {"type": "string"}}}})", warnings);

    const FeatureNode& pod = s.first.tree;

    const FeatureNode* containers = child(pod, "containers");
    REQUIRE(containers != nullptr);
    CHECK(containers->repeat_depth == 1);
    REQUIRE(child(*containers, "name") != nullptr);
    CHECK(child(*containers, "name")->is_mandatory());

    const FeatureNode* matrix = child(pod, "matrix");
    CHECK(matrix->repeat_depth == 2);
    CHECK(matrix->type == AttributeType::Integer);

    const FeatureNode* labels = child(pod, "labels");
    CHECK(labels->is_map);
    CHECK(labels->children.empty());

    const FeatureNode* volumes = child(pod, "volumes");
    CHECK(volumes->is_map);
    REQUIRE(child(*volumes, "path") != nullptr);
    CHECK(child(*volumes, "path")->id == "Pod.volumes.path");

    CHECK(child(pod, "raw")->is_map);
}

TEST_CASE("self references become cycle markers") {
    WarningCollector warnings;
    auto s = synthesize(R"({"Props": {
        "type": "object",
        "properties": {
            "items": {"$ref": "#/definitions/Props"},
            "allOf": {"type": "array", "items": {"$ref": "#/definitions/Props"}}
        }
    }})", warnings);

    const FeatureNode& props = s.first.tree;
    const FeatureNode* items = child(props, "items");
    REQUIRE(items != nullptr);
    CHECK(items->cycle_of == "Props");
    CHECK(items->children.empty());

    const FeatureNode* all_of = child(props, "allOf");
    REQUIRE(all_of != nullptr);
    CHECK(all_of->repeat_depth == 1);
    CHECK(all_of->cycle_of == "Props");
}

TEST_CASE("exclusive unions become alternative groups with typed branches") {
    WarningCollector warnings;
    auto s = synthesize(R"({"Strategy": {
        "type": "object",
        "properties": {
            "maxSurge": {"oneOf": [{"type": "string"}, {"type": "integer"}]},
            "source": {"anyOf": [{"$ref": "#/definitions/io.k8s.Secret"}, {"$ref": "#/definitions/io.k8s.ConfigMap"}]}
        }
    },
    "io.k8s.Secret": {"type": "object", "properties": {"secretName": {"type": "string"}}},
    "io.k8s.ConfigMap": {"type": "object", "properties": {"name": {"type": "string"}}}})", warnings);

    const FeatureNode& root = s.first.tree;
    const FeatureNode* surge = child(root, "maxSurge");
    REQUIRE(surge != nullptr);
    CHECK(surge->group == GroupType::Alternative);
    REQUIRE(surge->children.size() == 2);
    CHECK(surge->children[0].name == "asString");
    CHECK(surge->children[0].branch_type == "string");
    CHECK(surge->children[0].key.empty());
    CHECK(surge->children[0].type == AttributeType::String);
    CHECK(surge->children[1].name == "asInteger");
    CHECK(surge->children[1].id == "Strategy.maxSurge.asInteger");

    const FeatureNode* source = child(root, "source");
    CHECK(source->group == GroupType::Or);
    REQUIRE(source->children.size() == 2);
    CHECK(source->children[0].name == "asSecret");
    CHECK(source->children[0].branch_type == "object");
    CHECK(child(source->children[0], "secretName") != nullptr);

    REQUIRE(s.first.unions.size() == 2);
    CHECK(s.first.unions[0].exclusive);
    CHECK_FALSE(s.first.unions[1].exclusive);
}

TEST_CASE("allOf branches fold into one and-group") {
    WarningCollector warnings;
    auto s = synthesize(R"({
        "Child": {"allOf": [{"$ref": "#/definitions/Base"}], "required": ["extra"],
                  "properties": {"extra": {"type": "string"}, "name": {"type": "integer"}}},
        "Base": {"type": "object", "properties": {"name": {"type": "string"}, "uid": {"type": "string"}}}
    })", warnings);

    const FeatureNode& node = s.first.tree;
    CHECK(node.group == GroupType::And);
    REQUIRE(node.children.size() == 3);
    CHECK(node.children[0].name == "extra");
    CHECK(node.children[0].is_mandatory());
    CHECK(node.children[1].name == "name");
    // First declaration wins
    CHECK(node.children[1].type == AttributeType::Integer);
    CHECK(node.children[2].name == "uid");
    CHECK(s.first.aliases.at("Base/name") == "Child.name");
}

TEST_CASE("enum attributes come from the schema or the description") {
    WarningCollector warnings;
    auto s = synthesize(R"({"Pod": {
        "type": "object",
        "properties": {
            "policy": {"type": "string", "enum": ["Always", "Never"]},
            "dnsPolicy": {"type": "string", "description": "DNS.\n\nPossible enum values:\n - `\"ClusterFirst\"`\n - `\"None\"`"}
        }
    }})", warnings);

    CHECK(child(s.first.tree, "policy")->enum_values == std::vector<std::string>{"Always", "Never"});
    CHECK(child(s.first.tree, "dnsPolicy")->enum_values == std::vector<std::string>{"ClusterFirst", "None"});
}

TEST_CASE("default_from_description reads the documented value") {
    CHECK(default_from_description("Number of replicas. Defaults to 1.") == "1");
    CHECK(default_from_description("Protocol for port. Defaults to \"TCP\".") == "TCP");
    CHECK(default_from_description("Default is RollingUpdate.") == "RollingUpdate");
    CHECK(default_from_description("The default value is 0.5 seconds.") == "0.5");
    CHECK(default_from_description("The default is to use the node IP.").empty());
    CHECK(default_from_description("No default here.").empty());
}

TEST_CASE("attribute defaults come from the schema before the description") {
    WarningCollector warnings;
    auto s = synthesize(R"({"Service": {
        "type": "object",
        "properties": {
            "port": {"type": "integer", "default": 8080, "description": "Defaults to 80."},
            "protocol": {"type": "string", "description": "Defaults to \"TCP\"."},
            "policy": {"type": "string", "enum": ["Always", "Never"], "description": "Defaults to OnFailure."},
            "name": {"type": "string"}
        }
    }})", warnings);

    CHECK(child(s.first.tree, "port")->default_value == "8080");
    CHECK(child(s.first.tree, "protocol")->default_value == "TCP");
    // Not one of the enumerated values
    CHECK(child(s.first.tree, "policy")->default_value.empty());
    CHECK(child(s.first.tree, "name")->default_value.empty());
}

TEST_CASE("opaque nodes become unknown features") {
    WarningCollector warnings;
    auto s = synthesize(R"({"Pod": {
        "type": "object",
        "properties": {"odd": {"not": {"type": "string"}}}
    }})", warnings);

    const FeatureNode* odd = child(s.first.tree, "odd");
    REQUIRE(odd != nullptr);
    CHECK(odd->unknown);
}

TEST_CASE("missing references leave unknown features in place") {
    WarningCollector warnings;
    auto s = synthesize(R"({"Pod": {
        "type": "object",
        "required": ["containers"],
        "properties": {
            "containers": {"type": "array", "items": {"$ref": "#/definitions/Container"}},
            "quantity": {"$ref": "#/definitions/Quantity"},
            "overhead": {"$ref": "#/definitions/Gone"}
        }
    }, "Quantity": {"$ref": "#/definitions/Missing"}})", warnings);

    const FeatureNode* containers = child(s.first.tree, "containers");
    REQUIRE(containers != nullptr);
    CHECK(containers->is_mandatory());
    CHECK(containers->is_repeatable());
    CHECK(containers->unknown);
    CHECK(containers->children.empty());

    const FeatureNode* quantity = child(s.first.tree, "quantity");
    REQUIRE(quantity != nullptr);
    CHECK(quantity->unknown);

    const FeatureNode* overhead = child(s.first.tree, "overhead");
    REQUIRE(overhead != nullptr);
    CHECK(overhead->unknown);

    CHECK(warnings.counts().at("unresolved_reference") == 3);
}

TEST_CASE("max depth cuts expansion with a warning") {
    WarningCollector warnings;
    SynthesisOptions options;
    options.max_depth = 1;
    auto s = synthesize(R"({"Pod": {
        "type": "object",
        "properties": {"a": {"type": "object", "properties": {"b": {"type": "object", "properties": {"c": {"type": "string"}}}}}}
    }})", warnings, options);

    const FeatureNode* a = child(s.first.tree, "a");
    REQUIRE(a != nullptr);
    const FeatureNode* b = child(*a, "b");
    REQUIRE(b != nullptr);
    CHECK(b->unknown);
    CHECK(b->children.empty());
    CHECK(warnings.counts().at("unsupported_construct") == 1);
}

TEST_CASE("reserved property names are escaped but keep their key") {
    WarningCollector warnings;
    auto s = synthesize(R"({"Pod": {
        "type": "object",
        "properties": {"namespace": {"type": "string"}}
    }})", warnings);

    const FeatureNode& ns = s.first.tree.children.at(0);
    CHECK(ns.name == "esc_namespace");
    CHECK(ns.key == "namespace");
    CHECK(ns.id == "Pod.esc_namespace");
}

TEST_CASE("kind name collisions fall back to the qualified name") {
    WarningCollector warnings;
    auto resolved = SchemaGraph::resolve(ordered_json::parse(R"({"definitions": {
        "io.k8s.api.v1.Event": {"type": "object", "x-kubernetes-group-version-kind": [], "properties": {"a": {"type": "string"}}},
        "io.k8s.events.v1.Event": {"type": "object", "x-kubernetes-group-version-kind": [], "properties": {"b": {"type": "string"}}}
    }})"), {}, warnings);
    REQUIRE(resolved.ok);

    auto kinds = select_kinds(resolved.graph, "esc_", warnings);
    REQUIRE(kinds.size() == 2);
    CHECK(kinds[0].name == "Event");
    CHECK(kinds[0].key == "Event");
    CHECK(kinds[1].name == "io_k8s_events_v1_Event");
    CHECK(kinds[1].key == "io.k8s.events.v1.Event");
    CHECK(warnings.counts().at("name_collision") == 1);
}
