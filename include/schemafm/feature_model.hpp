#pragma once

#include "schemafm/expression.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace schemafm {

// ============================================================================
// Feature Tree
// ============================================================================

enum class Cardinality {
    Mandatory,
    Optional
};

enum class GroupType {
    And,
    Or,
    Alternative
};

// None marks a plain (boolean) feature
enum class AttributeType {
    None,
    String,
    Integer,
    Real
};

const char* group_type_to_string(GroupType g);
const char* attribute_type_to_string(AttributeType t);
std::optional<AttributeType> parse_attribute_type(const std::string& s);

// Synthetic activation markers appended to a feature id by the translator
inline constexpr const char* kIsNullSuffix = ".isNull";
inline constexpr const char* kIsEmptySuffix = ".isEmpty";

struct FeatureNode {
    std::string name;        // sanitized local name
    std::string id;          // dotted path from the kind ("Pod.spec.containers")
    std::string key;         // raw configuration key; empty for synthetic nodes
    Cardinality cardinality = Cardinality::Optional;
    GroupType group = GroupType::And;
    std::vector<FeatureNode> children;

    AttributeType type = AttributeType::None;
    std::vector<std::string> enum_values;

    std::size_t repeat_depth = 0;  // array nesting; > 0 means repeatable
    bool is_map = false;           // free-form keys
    bool abstract = false;
    bool unknown = false;          // opaque schema node
    bool deprecated = false;
    std::string alias_of;          // deduplicated subtree, canonical id
    std::string cycle_of;          // back-reference cutting a schema cycle
    std::string branch_type;       // JSON type of a union branch
    std::string default_value;     // documented default of an attribute

    std::string provenance;        // originating schema path

    bool is_terminal() const { return children.empty(); }
    bool is_repeatable() const { return repeat_depth > 0; }
    bool is_mandatory() const { return cardinality == Cardinality::Mandatory; }
};

// ============================================================================
// Constraints
// ============================================================================

enum class ConstraintKind {
    Requires,   // a => b
    Excludes,   // a => !b
    Expression
};

const char* constraint_kind_to_string(ConstraintKind k);

struct Constraint {
    ConstraintKind kind = ConstraintKind::Expression;
    ExprPtr expr;
    std::string rule;   // derivation rule; empty when read back from text
    std::string trace;  // schema path the rule fired on

    std::string text() const { return expr ? render_expression(*expr) : ""; }
};

Constraint make_requires(const std::string& a, const std::string& b,
                         const std::string& rule, const std::string& trace);
Constraint make_excludes(const std::string& a, const std::string& b,
                         const std::string& rule, const std::string& trace);
Constraint make_expression_constraint(ExprPtr expr, const std::string& rule,
                                      const std::string& trace);

// Requires/Excludes when the expression has that exact shape
ConstraintKind classify_constraint(const Expr& expr);

// ============================================================================
// Feature Model
// ============================================================================

class FeatureModel {
public:
    FeatureModel() = default;
    FeatureModel(const FeatureModel& other);
    FeatureModel(FeatureModel&& other) noexcept;
    FeatureModel& operator=(const FeatureModel& other);
    FeatureModel& operator=(FeatureModel&& other) noexcept;

    std::string namespace_name;
    FeatureNode root;
    std::vector<Constraint> constraints;
    std::map<std::string, std::string> descriptions;  // feature id -> text
    std::map<std::string, std::string> aliases;       // schema path -> canonical id

    // Rebuild the id index; call after mutating the tree
    void reindex();

    // Exact lookup of a node present in the tree
    const FeatureNode* find(const std::string& id) const;

    // Lookup that follows alias_of redirections, so ids under a
    // deduplicated subtree resolve to the canonical node
    const FeatureNode* resolve(const std::string& id) const;

    // Canonical id of a (possibly aliased) id
    std::optional<std::string> canonical_id(const std::string& id) const;

    bool contains(const std::string& id) const { return resolve(id) != nullptr; }

    // Textual parent; kinds hang off the root
    std::string parent_id(const std::string& id) const;

    // Whether the node or an ancestor (through aliases) is repeatable
    bool inside_repeatable(const std::string& id) const;

    // All ids present in the tree, depth-first in declaration order
    std::vector<std::string> feature_ids() const;

    std::size_t feature_count() const { return index_.size(); }

    const std::vector<FeatureNode>& kinds() const { return root.children; }

private:
    std::unordered_map<std::string, const FeatureNode*> index_;
};

// Visit every node depth-first in declaration order
template<typename Fn>
void walk_tree(const FeatureNode& node, Fn&& fn) {
    fn(node);
    for (const auto& child : node.children) {
        walk_tree(child, fn);
    }
}

} // namespace schemafm
