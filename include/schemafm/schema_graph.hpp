#pragma once

#include "schemafm/warnings.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace schemafm {

// ============================================================================
// Schema Graph
// ============================================================================
//
// Arena of schema definitions for one schema version. Definitions refer to
// each other by index, so self-referencing and mutually recursive types are
// plain cycles in the index graph. The graph is read-only once resolve()
// returns and may be shared by synthesis workers.

using DefinitionId = std::size_t;

inline constexpr DefinitionId kNoDefinition = static_cast<DefinitionId>(-1);

struct PropertyRef {
    std::string name;
    DefinitionId target = kNoDefinition;
    std::string description;  // description written beside the reference
};

struct ObjectShape {
    std::vector<PropertyRef> properties;  // declaration order
    std::set<std::string> required;
    // Value schema of additionalProperties; kNoDefinition when absent
    DefinitionId map_values = kNoDefinition;
    // Free-form keys with arbitrary values (additionalProperties: true,
    // an object without properties, x-kubernetes-preserve-unknown-fields)
    bool free_form = false;

    bool is_map() const { return map_values != kNoDefinition || (free_form && properties.empty()); }
};

struct ArrayShape {
    DefinitionId items = kNoDefinition;  // kNoDefinition: untyped elements
};

struct ScalarShape {
    std::string type;  // "string" | "integer" | "number" | "boolean" | "null"
    std::vector<std::string> enum_values;
    std::string format;
    std::string default_value;  // schema "default", empty when absent
};

struct UnionShape {
    std::vector<DefinitionId> branches;
    bool exclusive = true;  // oneOf; anyOf is non-exclusive
};

struct IntersectionShape {
    std::vector<DefinitionId> branches;
};

struct OpaqueShape {
    std::string reason;
};

using Shape = std::variant<ObjectShape, ArrayShape, ScalarShape, UnionShape,
                           IntersectionShape, OpaqueShape>;

enum class DefinitionState {
    Pending,
    Resolved,
    Broken  // a reference it depends on is missing; properties keep it as opaque
};

// "if p == v then required [...]" style requirement attached to an object.
// An empty trigger_value means presence of the trigger property.
struct ConditionalRequirement {
    std::string rule;           // derivation rule name
    std::string trigger;
    std::string trigger_value;
    std::vector<std::string> required;
    std::string source_path;
};

// oneOf/anyOf branches consisting only of "required" lists
struct RequiredGroup {
    std::vector<std::string> members;
    bool exclusive = true;
    std::string source_path;
};

struct Definition {
    DefinitionId id = kNoDefinition;
    std::string name;  // qualified name; inline nodes get "Parent/prop"
    std::string description;
    Shape shape = OpaqueShape{"pending"};
    DefinitionState state = DefinitionState::Pending;
    bool anonymous = false;
    bool kind_marker = false;
    std::vector<ConditionalRequirement> conditions;
    std::vector<RequiredGroup> required_groups;

    bool is_object() const { return std::holds_alternative<ObjectShape>(shape); }
    bool is_scalar() const { return std::holds_alternative<ScalarShape>(shape); }
    bool is_opaque() const { return std::holds_alternative<OpaqueShape>(shape); }
};

struct SchemaGraphOptions {
    std::vector<std::string> roots;  // empty: kind marker, else unreferenced definitions
    std::string kind_marker = "x-kubernetes-group-version-kind";
};

struct SchemaGraphResult;

class SchemaGraph {
public:
    SchemaGraph() = default;

    // Build the graph from a definitions document. Accepts either a bare
    // name -> node object or one wrapped in {"definitions": {...}}. Only
    // definitions reachable from the root set are materialized.
    static SchemaGraphResult resolve(const nlohmann::ordered_json& document,
                                     const SchemaGraphOptions& options,
                                     WarningCollector& warnings);

    const Definition& get(DefinitionId id) const { return definitions_.at(id); }
    std::optional<DefinitionId> find(const std::string& name) const;

    const std::vector<Definition>& definitions() const { return definitions_; }
    const std::vector<DefinitionId>& roots() const { return roots_; }

    std::size_t size() const { return definitions_.size(); }

    // Number of named definitions in the source document
    std::size_t source_definition_count() const { return source_definition_count_; }

    // Last dotted segment of a qualified name ("io.k8s.api.core.v1.Pod" -> "Pod")
    static std::string short_name(const std::string& qualified_name);

    // Definition name from a reference ("#/definitions/Foo" -> "Foo")
    static std::string reference_name(const std::string& ref);

private:
    friend class SchemaResolver;

    std::vector<Definition> definitions_;
    std::unordered_map<std::string, DefinitionId> name_index_;
    std::vector<DefinitionId> roots_;
    std::string kind_marker_;
    std::size_t source_definition_count_ = 0;
};

struct SchemaGraphResult {
    bool ok = false;
    std::string error;
    SchemaGraph graph;
};

// Parse schema text into an order-preserving JSON document
SchemaGraphResult load_schema_graph(const std::string& json_text,
                                    const SchemaGraphOptions& options,
                                    WarningCollector& warnings,
                                    const std::string& source_path = "");

} // namespace schemafm
