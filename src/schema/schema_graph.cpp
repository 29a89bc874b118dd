#include "schemafm/schema_graph.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <utility>

namespace schemafm {

using ordered_json = nlohmann::ordered_json;

namespace {

// Keywords outside the supported operator subset
const char* const kUnsupportedKeywords[] = {
    "not", "patternProperties", "const", "contains", "prefixItems", "$dynamicRef",
};

const char* const kScalarTypes[] = {"string", "integer", "number", "boolean", "null"};

std::string unescape_pointer(const std::string& token) {
    std::string out;
    for (size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '~' && i + 1 < token.size()) {
            if (token[i + 1] == '1') { out += '/'; ++i; continue; }
            if (token[i + 1] == '0') { out += '~'; ++i; continue; }
        }
        out += token[i];
    }
    return out;
}

std::string get_description(const ordered_json& node) {
    if (node.is_object() && node.contains("description") && node["description"].is_string()) {
        return node["description"].get<std::string>();
    }
    return "";
}

std::vector<std::string> get_string_array(const ordered_json& node, const std::string& key) {
    std::vector<std::string> result;
    if (node.contains(key) && node[key].is_array()) {
        for (const auto& elem : node[key]) {
            if (elem.is_string()) result.push_back(elem.get<std::string>());
        }
    }
    return result;
}

bool get_flag(const ordered_json& node, const std::string& key) {
    return node.contains(key) && node[key].is_boolean() && node[key].get<bool>();
}

std::string literal_text(const ordered_json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

// Primary type of a node; "type": ["string", "null"] yields "string"
std::string node_type(const ordered_json& node) {
    if (!node.contains("type")) return "";
    const auto& t = node["type"];
    if (t.is_string()) return t.get<std::string>();
    if (t.is_array()) {
        for (const auto& elem : t) {
            if (elem.is_string() && elem.get<std::string>() != "null") return elem.get<std::string>();
        }
        if (!t.empty() && t[0].is_string()) return t[0].get<std::string>();
    }
    return "";
}

bool is_scalar_type(const std::string& type) {
    for (const char* t : kScalarTypes) {
        if (type == t) return true;
    }
    return false;
}

// A oneOf/anyOf branch that only lists required members
bool is_required_only(const ordered_json& branch) {
    if (!branch.is_object() || !branch.contains("required")) return false;
    for (auto it = branch.begin(); it != branch.end(); ++it) {
        if (it.key() != "required" && it.key() != "description") return false;
    }
    return true;
}

void collect_references(const ordered_json& node, std::set<std::string>& out) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (it.key() == "$ref" && it.value().is_string()) {
                out.insert(SchemaGraph::reference_name(it.value().get<std::string>()));
            } else {
                collect_references(it.value(), out);
            }
        }
    } else if (node.is_array()) {
        for (const auto& elem : node) collect_references(elem, out);
    }
}

} // namespace

// ============================================================================
// Resolver
// ============================================================================

class SchemaResolver {
public:
    SchemaResolver(SchemaGraph& graph, const ordered_json& source, WarningCollector& warnings)
        : graph_(graph), source_(source), warnings_(warnings) {}

    // Named definition lookup; creates a placeholder queued for expansion
    std::optional<DefinitionId> intern(const std::string& name) {
        auto it = graph_.name_index_.find(name);
        if (it != graph_.name_index_.end()) {
            return it->second;
        }
        if (!source_.contains(name)) {
            return std::nullopt;
        }
        DefinitionId id = create(name, false);
        worklist_.push_back({id, &source_[name]});
        return id;
    }

    void run() {
        while (!worklist_.empty()) {
            auto [id, node] = worklist_.front();
            worklist_.pop_front();
            expand(id, *node);
        }
    }

private:
    struct WorkItem {
        DefinitionId id;
        const ordered_json* node;
    };

    SchemaGraph& graph_;
    const ordered_json& source_;
    WarningCollector& warnings_;
    std::deque<WorkItem> worklist_;
    // Synthesized nodes (allOf siblings) that the worklist points into
    std::deque<ordered_json> owned_nodes_;

    DefinitionId create(const std::string& name, bool anonymous) {
        DefinitionId id = graph_.definitions_.size();
        Definition def;
        def.id = id;
        def.name = name;
        def.anonymous = anonymous;
        graph_.definitions_.push_back(std::move(def));
        if (!anonymous) {
            graph_.name_index_[name] = id;
        }
        return id;
    }

    Definition& def(DefinitionId id) { return graph_.definitions_[id]; }

    // Resolve an inline node: references intern the target, anything else
    // becomes an anonymous definition named after its position.
    std::optional<DefinitionId> resolve_node(const ordered_json& node, const std::string& path) {
        if (node.is_object() && node.contains("$ref")) {
            std::string ref = node["$ref"].is_string() ? node["$ref"].get<std::string>() : "";
            std::string name = SchemaGraph::reference_name(ref);
            auto target = name.empty() ? std::nullopt : intern(name);
            if (!target) {
                warnings_.emit(Warning::unresolved_reference,
                               warnings::unresolved_reference(ref, path));
                return std::nullopt;
            }
            return target;
        }

        DefinitionId id = create(path, true);
        if (!node.is_object()) {
            owned_nodes_.push_back(ordered_json::object());
            if (node.is_boolean() && node.get<bool>()) {
                owned_nodes_.back()["x-kubernetes-preserve-unknown-fields"] = true;
            }
            worklist_.push_back({id, &owned_nodes_.back()});
        } else {
            worklist_.push_back({id, &node});
        }
        return id;
    }

    // Stands in for a reference target that does not exist
    DefinitionId unresolved_placeholder(const std::string& path) {
        DefinitionId id = create(path, true);
        def(id).state = DefinitionState::Resolved;
        def(id).shape = OpaqueShape{"unresolved reference"};
        return id;
    }

    void mark_opaque(DefinitionId id, const std::string& construct) {
        warnings_.emit(Warning::unsupported_construct,
                       warnings::unsupported_construct(construct, def(id).name));
        def(id).shape = OpaqueShape{construct};
    }

    void expand(DefinitionId id, const ordered_json& node) {
        def(id).description = get_description(node);
        def(id).state = DefinitionState::Resolved;

        if (!node.is_object()) {
            mark_opaque(id, "non-object node");
            return;
        }

        if (!def(id).anonymous && !graph_.kind_marker_.empty() && node.contains(graph_.kind_marker_)) {
            def(id).kind_marker = true;
        }

        for (const char* keyword : kUnsupportedKeywords) {
            if (node.contains(keyword)) {
                mark_opaque(id, keyword);
                return;
            }
        }

        read_conditions(id, node);

        // Named definition that is only an alias of another one
        if (node.contains("$ref")) {
            auto target = resolve_node(node, def(id).name);
            if (!target) {
                def(id).state = DefinitionState::Broken;
                return;
            }
            def(id).shape = IntersectionShape{{*target}};
            return;
        }

        if (node.contains("allOf") && node["allOf"].is_array()) {
            expand_intersection(id, node);
            return;
        }

        for (const char* keyword : {"oneOf", "anyOf"}) {
            if (node.contains(keyword) && node[keyword].is_array()) {
                expand_union(id, node, keyword);
                return;
            }
        }

        std::string type = node_type(node);

        if (type == "array" || (type.empty() && node.contains("items"))) {
            ArrayShape shape;
            if (node.contains("items")) {
                std::string path = def(id).name + "/items";
                auto items = resolve_node(node["items"], path);
                shape.items = items ? *items : unresolved_placeholder(path);
            }
            def(id).shape = shape;
            return;
        }

        if (type == "object" || node.contains("properties") || node.contains("additionalProperties")) {
            expand_object(id, node);
            return;
        }

        if (is_scalar_type(type) || node.contains("enum")) {
            ScalarShape shape;
            shape.type = type.empty() ? "string" : type;
            if (node.contains("enum") && node["enum"].is_array()) {
                for (const auto& value : node["enum"]) {
                    if (!value.is_null()) shape.enum_values.push_back(literal_text(value));
                }
            }
            if (node.contains("format") && node["format"].is_string()) {
                shape.format = node["format"].get<std::string>();
            }
            if (node.contains("default") && node["default"].is_primitive() && !node["default"].is_null()) {
                shape.default_value = literal_text(node["default"]);
            }
            def(id).shape = shape;
            return;
        }

        if (get_flag(node, "x-kubernetes-int-or-string")) {
            def(id).shape = ScalarShape{"string", {}, "int-or-string"};
            return;
        }

        if (get_flag(node, "x-kubernetes-preserve-unknown-fields")) {
            ObjectShape shape;
            shape.free_form = true;
            def(id).shape = shape;
            return;
        }

        mark_opaque(id, "untyped node");
    }

    void expand_object(DefinitionId id, const ordered_json& node) {
        ObjectShape shape;
        std::string name = def(id).name;

        if (node.contains("properties") && node["properties"].is_object()) {
            for (auto it = node["properties"].begin(); it != node["properties"].end(); ++it) {
                std::string path = name + "/" + it.key();
                auto target = resolve_node(it.value(), path);
                if (!target) {
                    spdlog::debug("property {} of {} kept as opaque", it.key(), name);
                }
                shape.properties.push_back({it.key(), target ? *target : unresolved_placeholder(path),
                                            get_description(it.value())});
            }
        }

        for (const auto& req : get_string_array(node, "required")) {
            shape.required.insert(req);
        }

        if (node.contains("additionalProperties")) {
            const auto& extra = node["additionalProperties"];
            if (extra.is_boolean()) {
                shape.free_form = extra.get<bool>();
            } else if (extra.is_object() && extra.empty()) {
                shape.free_form = true;
            } else if (extra.is_object()) {
                auto values = resolve_node(extra, name + "/additionalProperties");
                if (values) {
                    shape.map_values = *values;
                }
            }
        } else if (shape.properties.empty()) {
            shape.free_form = true;
        }

        def(id).shape = std::move(shape);
    }

    void expand_union(DefinitionId id, const ordered_json& node, const std::string& keyword) {
        const auto& branches = node[keyword];
        bool exclusive = keyword == "oneOf";

        // oneOf: [{required: [a]}, {required: [b]}] beside properties is a
        // requirement group on the object, not a type union.
        bool required_only = !branches.empty();
        for (const auto& branch : branches) {
            if (!is_required_only(branch)) required_only = false;
        }
        if (required_only) {
            RequiredGroup group;
            group.exclusive = exclusive;
            group.source_path = def(id).name + "/" + keyword;
            for (const auto& branch : branches) {
                for (const auto& member : get_string_array(branch, "required")) {
                    group.members.push_back(member);
                }
            }
            def(id).required_groups.push_back(std::move(group));
            expand_object(id, node);
            return;
        }

        UnionShape shape;
        shape.exclusive = exclusive;
        for (size_t i = 0; i < branches.size(); ++i) {
            auto branch = resolve_node(branches[i], def(id).name + "/" + keyword + "/" + std::to_string(i));
            if (branch) {
                shape.branches.push_back(*branch);
            }
        }
        if (shape.branches.empty()) {
            def(id).state = DefinitionState::Broken;
        }
        def(id).shape = std::move(shape);
    }

    void expand_intersection(DefinitionId id, const ordered_json& node) {
        IntersectionShape shape;
        std::string name = def(id).name;

        // Properties written beside allOf form the first branch
        if (node.contains("properties") || node.contains("required")) {
            owned_nodes_.push_back(node);
            owned_nodes_.back().erase("allOf");
            owned_nodes_.back().erase("description");
            owned_nodes_.back()["type"] = "object";
            DefinitionId self = create(name + "/self", true);
            worklist_.push_back({self, &owned_nodes_.back()});
            shape.branches.push_back(self);
        }

        const auto& branches = node["allOf"];
        for (size_t i = 0; i < branches.size(); ++i) {
            auto branch = resolve_node(branches[i], name + "/allOf/" + std::to_string(i));
            if (branch) {
                shape.branches.push_back(*branch);
            }
        }
        def(id).shape = std::move(shape);
    }

    void read_conditions(DefinitionId id, const ordered_json& node) {
        std::string name = def(id).name;

        for (const char* keyword : {"dependentRequired", "dependencies"}) {
            if (!node.contains(keyword) || !node[keyword].is_object()) continue;
            for (auto it = node[keyword].begin(); it != node[keyword].end(); ++it) {
                if (!it.value().is_array()) {
                    warnings_.emit(Warning::unsupported_construct,
                                   warnings::unsupported_construct(
                                       std::string(keyword) + " schema form", name));
                    continue;
                }
                ConditionalRequirement cond;
                cond.rule = "dependent-required";
                cond.trigger = it.key();
                cond.source_path = name + "/" + keyword + "/" + it.key();
                for (const auto& req : it.value()) {
                    if (req.is_string()) cond.required.push_back(req.get<std::string>());
                }
                def(id).conditions.push_back(std::move(cond));
            }
        }

        if (node.contains("if")) {
            if (!read_if_then(id, node)) {
                warnings_.emit(Warning::unsupported_construct,
                               warnings::unsupported_construct("if", name));
            } else if (node.contains("else")) {
                warnings_.emit(Warning::unsupported_construct,
                               warnings::unsupported_construct("else", name));
            }
        } else if (node.contains("else")) {
            warnings_.emit(Warning::unsupported_construct,
                           warnings::unsupported_construct("else", name));
        }
    }

    // if: {properties: {p: {const: v}}} (or a single-value enum, or
    // required: [p]) then: {required: [...]}
    bool read_if_then(DefinitionId id, const ordered_json& node) {
        const auto& cond_node = node["if"];
        if (!node.contains("then") || !cond_node.is_object()) return false;

        ConditionalRequirement cond;
        cond.rule = "conditional-required";
        cond.source_path = def(id).name + "/if";
        cond.required = get_string_array(node["then"], "required");
        if (cond.required.empty()) return false;

        if (cond_node.contains("properties") && cond_node["properties"].is_object()
            && cond_node["properties"].size() == 1) {
            auto it = cond_node["properties"].begin();
            const auto& test = it.value();
            cond.trigger = it.key();
            if (test.contains("const")) {
                cond.trigger_value = literal_text(test["const"]);
            } else if (test.contains("enum") && test["enum"].is_array() && test["enum"].size() == 1) {
                cond.trigger_value = literal_text(test["enum"][0]);
            } else {
                return false;
            }
        } else {
            auto required = get_string_array(cond_node, "required");
            if (required.size() != 1) return false;
            cond.trigger = required[0];
        }

        def(id).conditions.push_back(std::move(cond));
        return true;
    }
};

// ============================================================================
// SchemaGraph
// ============================================================================

std::optional<DefinitionId> SchemaGraph::find(const std::string& name) const {
    auto it = name_index_.find(name);
    if (it == name_index_.end()) return std::nullopt;
    return it->second;
}

std::string SchemaGraph::short_name(const std::string& qualified_name) {
    auto pos = qualified_name.rfind('.');
    if (pos == std::string::npos) return qualified_name;
    return qualified_name.substr(pos + 1);
}

std::string SchemaGraph::reference_name(const std::string& ref) {
    auto pos = ref.rfind('/');
    std::string name = pos == std::string::npos ? ref : ref.substr(pos + 1);
    return unescape_pointer(name);
}

SchemaGraphResult SchemaGraph::resolve(const ordered_json& document,
                                       const SchemaGraphOptions& options,
                                       WarningCollector& warnings) {
    SchemaGraphResult result;

    if (!document.is_object()) {
        result.error = "schema document must be an object";
        return result;
    }

    const ordered_json* source = &document;
    if (document.contains("definitions") && document["definitions"].is_object()) {
        source = &document["definitions"];
    } else if (document.contains("$defs") && document["$defs"].is_object()) {
        source = &document["$defs"];
    }

    if (source->empty()) {
        result.error = "schema document has no definitions";
        return result;
    }

    SchemaGraph& graph = result.graph;
    graph.kind_marker_ = options.kind_marker;
    graph.source_definition_count_ = source->size();
    SchemaResolver resolver(graph, *source, warnings);

    std::vector<std::string> root_names = options.roots;

    if (root_names.empty() && !options.kind_marker.empty()) {
        for (auto it = source->begin(); it != source->end(); ++it) {
            if (it.value().is_object() && it.value().contains(options.kind_marker)) {
                root_names.push_back(it.key());
            }
        }
    }

    if (root_names.empty()) {
        std::set<std::string> referenced;
        collect_references(*source, referenced);
        for (auto it = source->begin(); it != source->end(); ++it) {
            if (!referenced.count(it.key())) {
                root_names.push_back(it.key());
            }
        }
        // Everything is referenced: the document is one big cycle
        if (root_names.empty()) {
            root_names.push_back(source->begin().key());
        }
    }

    for (const auto& name : root_names) {
        auto id = resolver.intern(name);
        if (!id) {
            warnings.emit(Warning::unresolved_reference,
                          warnings::unresolved_reference(name, "roots"));
            continue;
        }
        if (std::find(graph.roots_.begin(), graph.roots_.end(), *id) == graph.roots_.end()) {
            graph.roots_.push_back(*id);
        }
    }

    if (graph.roots_.empty()) {
        result.error = "no root definition could be resolved";
        return result;
    }

    resolver.run();

    spdlog::debug("schema graph: {} of {} definitions reachable from {} roots",
                  graph.name_index_.size(), graph.source_definition_count_, graph.roots_.size());

    result.ok = true;
    return result;
}

SchemaGraphResult load_schema_graph(const std::string& json_text,
                                    const SchemaGraphOptions& options,
                                    WarningCollector& warnings,
                                    const std::string& source_path) {
    ordered_json document;
    try {
        document = ordered_json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        SchemaGraphResult result;
        result.error = std::string("parse error: ") + e.what();
        if (!source_path.empty()) result.error = source_path + ": " + result.error;
        return result;
    }

    auto result = SchemaGraph::resolve(document, options, warnings);
    if (!result.ok && !source_path.empty()) {
        result.error = source_path + ": " + result.error;
    }
    return result;
}

} // namespace schemafm
