#include "schemafm/synthesizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>
#include <utility>

namespace schemafm {

namespace {

const char* const kReservedWords[] = {
    "namespace", "features", "constraints", "constraint", "mandatory", "optional",
    "or", "alternative", "imports", "include", "true", "false", "String",
    "Integer", "Real", "Boolean", "isNull", "isEmpty", "abstract", "cardinality",
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string capitalize(const std::string& s) {
    if (s.empty()) return s;
    std::string out = s;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

AttributeType attribute_for(const std::string& json_type) {
    if (json_type == "string") return AttributeType::String;
    if (json_type == "integer") return AttributeType::Integer;
    if (json_type == "number") return AttributeType::Real;
    return AttributeType::None;
}

// ============================================================================
// Walker
// ============================================================================

// Expansion state for one kind. The path stack holds every definition being
// expanded above the current node; meeting one again closes a cycle.
class Walker {
public:
    Walker(const SchemaGraph& graph, const SynthesisOptions& options,
           WarningCollector& warnings, KindSynthesis& out, std::string kind_id)
        : graph_(graph), options_(options), warnings_(warnings), out_(out),
          kind_id_(std::move(kind_id)) {}

    void expand(FeatureNode& node, DefinitionId id, std::size_t depth) {
        const Definition& def = graph_.get(id);

        if (depth > options_.max_depth) {
            node.unknown = true;
            warnings_.emit(Warning::unsupported_construct,
                           warnings::unsupported_construct("max depth exceeded", def.name));
            return;
        }

        // Whatever the missing reference held is unknown, the feature itself stays
        if (def.state == DefinitionState::Broken) {
            node.unknown = true;
            return;
        }

        for (const auto& frame : path_) {
            if (frame.definition == id) {
                node.cycle_of = frame.feature_id;
                spdlog::debug("cycle at {} back to {}", node.id, frame.feature_id);
                return;
            }
        }

        path_.push_back({id, node.id});

        if (!def.anonymous || node.provenance.empty()) {
            node.provenance = def.name;
        }
        if (!def.description.empty() && !out_.descriptions.count(node.id)) {
            out_.descriptions[node.id] = def.description;
        }

        if (const auto* object = std::get_if<ObjectShape>(&def.shape)) {
            expand_object(node, def, *object, depth);
        } else if (const auto* array = std::get_if<ArrayShape>(&def.shape)) {
            expand_array(node, *array, depth);
        } else if (const auto* scalar = std::get_if<ScalarShape>(&def.shape)) {
            expand_scalar(node, *scalar);
        } else if (const auto* alternatives = std::get_if<UnionShape>(&def.shape)) {
            expand_union(node, def, *alternatives, depth);
        } else if (const auto* intersection = std::get_if<IntersectionShape>(&def.shape)) {
            expand_intersection(node, *intersection, depth);
        } else {
            node.unknown = true;
        }

        path_.pop_back();
    }

private:
    struct Frame {
        DefinitionId definition;
        std::string feature_id;
    };

    const SchemaGraph& graph_;
    const SynthesisOptions& options_;
    WarningCollector& warnings_;
    KindSynthesis& out_;
    std::string kind_id_;
    std::vector<Frame> path_;

    bool on_path(DefinitionId id) const {
        for (const auto& frame : path_) {
            if (frame.definition == id) return true;
        }
        return false;
    }

    static const FeatureNode* child_with_key(const FeatureNode& node, const std::string& key) {
        for (const auto& child : node.children) {
            if (!child.key.empty() && child.key == key) return &child;
        }
        return nullptr;
    }

    std::string unique_child_name(const FeatureNode& node, const std::string& candidate,
                                  const std::string& source_path) {
        auto taken = [&node](const std::string& name) {
            for (const auto& child : node.children) {
                if (child.name == name) return true;
            }
            return false;
        };
        if (!taken(candidate)) return candidate;

        std::string renamed;
        for (int i = 2;; ++i) {
            renamed = candidate + "_" + std::to_string(i);
            if (!taken(renamed)) break;
        }
        warnings_.emit(Warning::name_collision,
                       warnings::name_collision(candidate, renamed, source_path));
        return renamed;
    }

    void expand_object(FeatureNode& node, const Definition& def, const ObjectShape& shape,
                       std::size_t depth) {
        if (shape.properties.empty()) {
            expand_map(node, shape, depth);
            return;
        }

        node.group = GroupType::And;
        ObjectInstance instance;
        instance.feature_id = node.id;
        instance.kind_id = kind_id_;
        instance.definition = def.id;

        for (const auto& prop : shape.properties) {
            // allOf branches may declare the same property; first expansion wins
            if (const FeatureNode* existing = child_with_key(node, prop.name)) {
                out_.aliases[def.name + "/" + prop.name] = existing->id;
                instance.properties[prop.name] = existing->id;
                continue;
            }

            FeatureNode child;
            child.key = prop.name;
            child.name = unique_child_name(node, sanitize_feature_name(prop.name, options_.escape_prefix),
                                           def.name + "/" + prop.name);
            child.id = node.id + "." + child.name;

            bool required = shape.required.count(prop.name) > 0
                         || description_marks_required(prop.description);
            child.cardinality = required ? Cardinality::Mandatory : Cardinality::Optional;
            child.deprecated = description_marks_deprecated(prop.description);
            if (!prop.description.empty()) {
                out_.descriptions[child.id] = prop.description;
            }

            expand(child, prop.target, depth + 1);

            instance.properties[prop.name] = child.id;
            node.children.push_back(std::move(child));
        }

        out_.objects.push_back(std::move(instance));
    }

    void expand_map(FeatureNode& node, const ObjectShape& shape, std::size_t depth) {
        // Maps of maps are captured whole
        if (node.is_map) return;
        node.is_map = true;

        if (shape.map_values == kNoDefinition) return;
        const Definition& values = graph_.get(shape.map_values);
        if (values.state == DefinitionState::Broken) return;

        bool structured = std::holds_alternative<IntersectionShape>(values.shape);
        if (const auto* object = std::get_if<ObjectShape>(&values.shape)) {
            structured = !object->properties.empty();
        }
        if (structured) {
            expand(node, shape.map_values, depth + 1);
        }
    }

    void expand_array(FeatureNode& node, const ArrayShape& shape, std::size_t depth) {
        ++node.repeat_depth;
        // Arrays under a map wildcard are captured whole
        if (node.is_map || shape.items == kNoDefinition) return;
        expand(node, shape.items, depth + 1);
    }

    void expand_scalar(FeatureNode& node, const ScalarShape& shape) {
        node.type = attribute_for(shape.type);
        node.enum_values = shape.enum_values;
        node.default_value = shape.default_value;

        auto it = out_.descriptions.find(node.id);
        if (it != out_.descriptions.end()) {
            if (node.enum_values.empty()) {
                node.enum_values = enum_values_from_description(it->second);
            }
            if (node.default_value.empty()) {
                node.default_value = default_from_description(it->second);
            }
        }

        // A default outside the enumeration is a misread description
        if (!node.enum_values.empty()
            && std::find(node.enum_values.begin(), node.enum_values.end(), node.default_value)
                   == node.enum_values.end()) {
            node.default_value.clear();
        }
    }

    void expand_union(FeatureNode& node, const Definition& def, const UnionShape& shape,
                      std::size_t depth) {
        node.group = shape.exclusive ? GroupType::Alternative : GroupType::Or;

        UnionInstance instance;
        instance.feature_id = node.id;
        instance.definition = def.id;
        instance.exclusive = shape.exclusive;

        for (DefinitionId branch_id : shape.branches) {
            const Definition& branch = graph_.get(branch_id);
            if (branch.state == DefinitionState::Broken) continue;

            FeatureNode child;
            child.name = unique_child_name(
                node, sanitize_feature_name("as" + branch_label(branch), options_.escape_prefix),
                branch.name);
            child.id = node.id + "." + child.name;
            child.branch_type = json_type(branch_id);
            child.cardinality = Cardinality::Optional;

            expand(child, branch_id, depth + 1);

            instance.branches.push_back(child.id);
            node.children.push_back(std::move(child));
        }

        out_.unions.push_back(std::move(instance));
    }

    void expand_intersection(FeatureNode& node, const IntersectionShape& shape, std::size_t depth) {
        // A named definition that only aliases another one
        if (shape.branches.size() == 1) {
            expand(node, shape.branches.front(), depth + 1);
            return;
        }

        node.group = GroupType::And;
        for (DefinitionId branch : shape.branches) {
            fold(node, branch, depth + 1);
        }
    }

    // Merge an allOf branch into the enclosing and-group
    void fold(FeatureNode& node, DefinitionId id, std::size_t depth) {
        const Definition& def = graph_.get(id);
        if (def.state == DefinitionState::Broken) return;

        if (on_path(id)) {
            warnings_.emit(Warning::unsupported_construct,
                           warnings::unsupported_construct("recursive allOf", def.name));
            return;
        }

        path_.push_back({id, node.id});
        if (const auto* object = std::get_if<ObjectShape>(&def.shape)) {
            if (!object->properties.empty()) {
                expand_object(node, def, *object, depth);
            }
        } else if (const auto* nested = std::get_if<IntersectionShape>(&def.shape)) {
            for (DefinitionId branch : nested->branches) {
                fold(node, branch, depth + 1);
            }
        } else {
            warnings_.emit(Warning::unsupported_construct,
                           warnings::unsupported_construct("allOf with non-object branch", def.name));
        }
        path_.pop_back();
    }

    std::string json_type(DefinitionId id) const {
        // Follow single-branch alias chains a bounded number of steps
        for (int step = 0; step < 16; ++step) {
            const Definition& def = graph_.get(id);
            if (std::holds_alternative<ObjectShape>(def.shape)) return "object";
            if (std::holds_alternative<ArrayShape>(def.shape)) return "array";
            if (const auto* scalar = std::get_if<ScalarShape>(&def.shape)) return scalar->type;
            const auto* intersection = std::get_if<IntersectionShape>(&def.shape);
            if (!intersection || intersection->branches.empty()) return "";
            id = intersection->branches.front();
        }
        return "";
    }

    std::string branch_label(const Definition& branch) const {
        if (!branch.anonymous) {
            return SchemaGraph::short_name(branch.name);
        }
        std::string type = json_type(branch.id);
        return type.empty() ? "Branch" : capitalize(type);
    }
};

} // namespace

// ============================================================================
// Naming helpers
// ============================================================================

bool is_reserved_word(const std::string& name) {
    for (const char* word : kReservedWords) {
        if (name == word) return true;
    }
    return false;
}

std::string sanitize_feature_name(const std::string& raw, const std::string& escape_prefix) {
    std::string name;
    name.reserve(raw.size());
    for (char c : raw) {
        name += (std::isalnum(static_cast<unsigned char>(c)) || c == '_') ? c : '_';
    }
    if (name.empty()) {
        return escape_prefix + "empty";
    }
    if (is_reserved_word(name) || std::isdigit(static_cast<unsigned char>(name[0]))) {
        return escape_prefix + name;
    }
    return name;
}

std::vector<std::string> enum_values_from_description(const std::string& description) {
    std::vector<std::string> values;
    auto marker = description.find("Possible enum values:");
    if (marker == std::string::npos) return values;

    std::istringstream lines(description.substr(marker));
    std::string line;
    std::getline(lines, line);  // marker line
    while (std::getline(lines, line)) {
        std::string item = trim(line);
        if (!starts_with(item, "- ")) continue;
        auto open = item.find('"');
        if (open == std::string::npos) continue;
        auto close = item.find('"', open + 1);
        if (close == std::string::npos) continue;
        std::string value = item.substr(open + 1, close - open - 1);
        if (std::find(values.begin(), values.end(), value) == values.end()) {
            values.push_back(value);
        }
    }
    return values;
}

std::string default_from_description(const std::string& description) {
    static const std::regex kDefault(
        R"((?:defaults to|default is|default value is)\s+["'`\\]*([A-Za-z0-9_/:*+-]+(?:\.[0-9]+)?))",
        std::regex::ECMAScript | std::regex::icase);
    std::smatch match;
    if (!std::regex_search(description, match, kDefault)) return "";
    std::string value = match[1].str();
    std::string lower = to_lower(value);
    // "The default is to ..." describes behaviour, not a value
    if (lower == "to" || lower == "the" || lower == "a" || lower == "an") return "";
    return value.size() <= 50 ? value : "";
}

bool description_marks_required(const std::string& description) {
    std::string text = trim(description);
    const std::string suffix = "Required.";
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool description_marks_deprecated(const std::string& description) {
    if (description.find("DEPRECATED") != std::string::npos) return true;
    std::string lower = to_lower(trim(description));
    return starts_with(lower, "deprecated") || lower.find("deprecated:") != std::string::npos;
}

// ============================================================================
// Kind selection
// ============================================================================

std::vector<KindRoot> select_kinds(const SchemaGraph& graph,
                                   const std::string& escape_prefix,
                                   WarningCollector& warnings) {
    std::vector<KindRoot> kinds;
    std::set<std::string> names;
    std::set<std::string> keys;

    for (DefinitionId id : graph.roots()) {
        const Definition& def = graph.get(id);
        if (def.state == DefinitionState::Broken) continue;

        KindRoot kind;
        kind.definition = id;
        kind.key = SchemaGraph::short_name(def.name);
        kind.name = sanitize_feature_name(kind.key, escape_prefix);

        if (names.count(kind.name) || keys.count(kind.key)) {
            std::string qualified = sanitize_feature_name(def.name, escape_prefix);
            warnings.emit(Warning::name_collision,
                          warnings::name_collision(kind.name, qualified, def.name));
            kind.name = qualified;
            kind.key = def.name;
        }
        std::string base = kind.name;
        for (int i = 2; names.count(kind.name); ++i) {
            kind.name = base + "_" + std::to_string(i);
        }

        names.insert(kind.name);
        keys.insert(kind.key);
        kinds.push_back(std::move(kind));
    }
    return kinds;
}

// ============================================================================
// FeatureSynthesizer
// ============================================================================

FeatureSynthesizer::FeatureSynthesizer(const SchemaGraph& graph, SynthesisOptions options)
    : graph_(graph), options_(std::move(options)) {}

KindSynthesis FeatureSynthesizer::synthesize(const KindRoot& kind, WarningCollector& warnings) const {
    KindSynthesis out;

    FeatureNode tree;
    tree.name = kind.name;
    tree.id = kind.name;
    tree.key = kind.key;
    tree.cardinality = Cardinality::Mandatory;

    Walker walker(graph_, options_, warnings, out, kind.name);
    walker.expand(tree, kind.definition, 0);

    out.tree = std::move(tree);
    return out;
}

} // namespace schemafm
