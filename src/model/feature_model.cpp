#include "schemafm/feature_model.hpp"

#include <utility>

namespace schemafm {

const char* group_type_to_string(GroupType g) {
    switch (g) {
        case GroupType::And: return "and";
        case GroupType::Or: return "or";
        case GroupType::Alternative: return "alternative";
        default: return "and";
    }
}

const char* attribute_type_to_string(AttributeType t) {
    switch (t) {
        case AttributeType::None: return "Boolean";
        case AttributeType::String: return "String";
        case AttributeType::Integer: return "Integer";
        case AttributeType::Real: return "Real";
        default: return "Boolean";
    }
}

std::optional<AttributeType> parse_attribute_type(const std::string& s) {
    if (s == "Boolean") return AttributeType::None;
    if (s == "String") return AttributeType::String;
    if (s == "Integer") return AttributeType::Integer;
    if (s == "Real") return AttributeType::Real;
    return std::nullopt;
}

const char* constraint_kind_to_string(ConstraintKind k) {
    switch (k) {
        case ConstraintKind::Requires: return "requires";
        case ConstraintKind::Excludes: return "excludes";
        case ConstraintKind::Expression: return "expression";
        default: return "expression";
    }
}

Constraint make_requires(const std::string& a, const std::string& b,
                         const std::string& rule, const std::string& trace) {
    return {ConstraintKind::Requires, make_implies(make_feature(a), make_feature(b)), rule, trace};
}

Constraint make_excludes(const std::string& a, const std::string& b,
                         const std::string& rule, const std::string& trace) {
    return {ConstraintKind::Excludes,
            make_implies(make_feature(a), make_not(make_feature(b))), rule, trace};
}

Constraint make_expression_constraint(ExprPtr expr, const std::string& rule,
                                      const std::string& trace) {
    ConstraintKind kind = classify_constraint(*expr);
    return {kind, std::move(expr), rule, trace};
}

ConstraintKind classify_constraint(const Expr& expr) {
    if (expr.op != ExprOp::Implies) return ConstraintKind::Expression;
    const Expr& lhs = *expr.operands[0];
    const Expr& rhs = *expr.operands[1];
    if (lhs.op != ExprOp::Feature) return ConstraintKind::Expression;
    if (rhs.op == ExprOp::Feature) return ConstraintKind::Requires;
    if (rhs.op == ExprOp::Not && rhs.operands[0]->op == ExprOp::Feature) {
        return ConstraintKind::Excludes;
    }
    return ConstraintKind::Expression;
}

// ============================================================================
// FeatureModel
// ============================================================================

// The index points into the tree, so every copy or move rebuilds it
FeatureModel::FeatureModel(const FeatureModel& other)
    : namespace_name(other.namespace_name),
      root(other.root),
      constraints(other.constraints),
      descriptions(other.descriptions),
      aliases(other.aliases) {
    reindex();
}

FeatureModel::FeatureModel(FeatureModel&& other) noexcept
    : namespace_name(std::move(other.namespace_name)),
      root(std::move(other.root)),
      constraints(std::move(other.constraints)),
      descriptions(std::move(other.descriptions)),
      aliases(std::move(other.aliases)) {
    reindex();
    other.index_.clear();
}

FeatureModel& FeatureModel::operator=(const FeatureModel& other) {
    if (this != &other) {
        namespace_name = other.namespace_name;
        root = other.root;
        constraints = other.constraints;
        descriptions = other.descriptions;
        aliases = other.aliases;
        reindex();
    }
    return *this;
}

FeatureModel& FeatureModel::operator=(FeatureModel&& other) noexcept {
    if (this != &other) {
        namespace_name = std::move(other.namespace_name);
        root = std::move(other.root);
        constraints = std::move(other.constraints);
        descriptions = std::move(other.descriptions);
        aliases = std::move(other.aliases);
        reindex();
        other.index_.clear();
    }
    return *this;
}

void FeatureModel::reindex() {
    index_.clear();
    walk_tree(root, [this](const FeatureNode& node) {
        index_[node.id] = &node;
    });
}

const FeatureNode* FeatureModel::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
}

std::optional<std::string> FeatureModel::canonical_id(const std::string& id) const {
    std::string current = id;

    // Each hop strictly leaves an alias subtree, so the tree depth bounds it
    for (std::size_t hops = 0; hops <= index_.size(); ++hops) {
        if (const FeatureNode* node = find(current)) {
            return node->id;
        }

        // Longest existing prefix that is an alias node
        std::size_t pos = current.rfind('.');
        const FeatureNode* prefix_node = nullptr;
        while (pos != std::string::npos && pos > 0) {
            prefix_node = find(current.substr(0, pos));
            if (prefix_node) break;
            pos = current.rfind('.', pos - 1);
        }
        if (!prefix_node || prefix_node->alias_of.empty()) {
            return std::nullopt;
        }
        current = prefix_node->alias_of + current.substr(pos);
    }
    return std::nullopt;
}

const FeatureNode* FeatureModel::resolve(const std::string& id) const {
    auto canonical = canonical_id(id);
    if (!canonical) return nullptr;
    const FeatureNode* node = find(*canonical);
    // An alias node itself stands in for its canonical subtree
    if (node && !node->alias_of.empty()) {
        if (const FeatureNode* target = find(node->alias_of)) {
            return target;
        }
    }
    return node;
}

std::string FeatureModel::parent_id(const std::string& id) const {
    if (id == root.id) return "";
    auto pos = id.rfind('.');
    if (pos == std::string::npos) return root.id;
    return id.substr(0, pos);
}

bool FeatureModel::inside_repeatable(const std::string& id) const {
    std::string current = id;
    while (!current.empty()) {
        const FeatureNode* node = resolve(current);
        if (node && node->is_repeatable()) return true;
        if (const FeatureNode* exact = find(current); exact && exact->is_repeatable()) return true;
        current = parent_id(current);
    }
    return false;
}

std::vector<std::string> FeatureModel::feature_ids() const {
    std::vector<std::string> ids;
    walk_tree(root, [&ids](const FeatureNode& node) {
        ids.push_back(node.id);
    });
    return ids;
}

} // namespace schemafm
