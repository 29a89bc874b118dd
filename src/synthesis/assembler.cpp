#include "schemafm/assembler.hpp"
#include "schemafm/constraint_deriver.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <map>
#include <set>
#include <unordered_map>
#include <utility>

namespace schemafm {

namespace {

std::size_t segment_count(const std::string& id) {
    std::size_t n = 1;
    for (char c : id) {
        if (c == '.') ++n;
    }
    return n;
}

void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

// Hash of what a subtree contains, independent of where it is placed:
// the node's own name, key and cardinality are left out and cycle targets
// are encoded as a distance up the tree instead of an absolute id. The memo
// holds the content hash of every node with children.
std::size_t structural_hash(const FeatureNode& node,
                            std::unordered_map<const FeatureNode*, std::size_t>& memo) {
    std::hash<std::string> hs;
    std::size_t content = hs(node.provenance);
    hash_combine(content, static_cast<std::size_t>(node.group));
    hash_combine(content, static_cast<std::size_t>(node.type));
    hash_combine(content, (node.is_map ? 1u : 0u) | (node.unknown ? 2u : 0u));
    for (const auto& value : node.enum_values) {
        hash_combine(content, hs(value));
    }
    hash_combine(content, hs(node.default_value));
    if (!node.cycle_of.empty()) {
        hash_combine(content, segment_count(node.id) - segment_count(node.cycle_of));
    }
    for (const auto& child : node.children) {
        hash_combine(content, structural_hash(child, memo));
    }
    if (!node.children.empty()) {
        memo[&node] = content;
    }

    std::size_t full = content;
    hash_combine(full, hs(node.name));
    hash_combine(full, hs(node.key));
    hash_combine(full, static_cast<std::size_t>(node.cardinality));
    hash_combine(full, node.repeat_depth);
    hash_combine(full, hs(node.branch_type));
    hash_combine(full, node.deprecated ? 1u : 0u);
    return full;
}

struct CanonicalEntry {
    const FeatureNode* node;
    std::size_t hash;
};

class Deduplicator {
public:
    explicit Deduplicator(FeatureModel& model) : model_(model) {}

    void run() {
        for (auto& kind : model_.root.children) {
            std::unordered_map<const FeatureNode*, std::size_t> memo;
            structural_hash(kind, memo);

            replace(kind, memo);

            // Register after replacement so a kind never aliases itself
            register_subtrees(kind, memo);
        }
    }

    std::size_t replaced() const { return replaced_; }

private:
    FeatureModel& model_;
    std::multimap<std::string, CanonicalEntry> canonical_;  // provenance -> entry
    std::unordered_map<std::string, const FeatureNode*> registered_;  // id -> subtree
    std::size_t replaced_ = 0;

    // Registered subtrees may already hold aliases; compare against the target
    const FeatureNode& expand_alias(const FeatureNode& node) const {
        if (node.alias_of.empty()) return node;
        auto it = registered_.find(node.alias_of);
        return it == registered_.end() ? node : *it->second;
    }

    // The exact comparison behind structural_hash
    bool same_content(const FeatureNode& a, const FeatureNode& b) const {
        if (a.provenance != b.provenance || a.group != b.group || a.type != b.type
            || a.is_map != b.is_map || a.unknown != b.unknown
            || a.enum_values != b.enum_values || a.default_value != b.default_value
            || a.cycle_of.empty() != b.cycle_of.empty()) {
            return false;
        }
        if (!a.cycle_of.empty()
            && segment_count(a.id) - segment_count(a.cycle_of)
                   != segment_count(b.id) - segment_count(b.cycle_of)) {
            return false;
        }
        const auto& left = expand_alias(a).children;
        const auto& right = expand_alias(b).children;
        if (left.size() != right.size()) return false;
        for (std::size_t i = 0; i < left.size(); ++i) {
            if (!same_node(left[i], right[i])) return false;
        }
        return true;
    }

    bool same_node(const FeatureNode& a, const FeatureNode& b) const {
        return a.name == b.name && a.key == b.key && a.cardinality == b.cardinality
            && a.repeat_depth == b.repeat_depth && a.branch_type == b.branch_type
            && a.deprecated == b.deprecated && same_content(a, b);
    }

    void replace(FeatureNode& node, const std::unordered_map<const FeatureNode*, std::size_t>& memo) {
        for (auto& child : node.children) {
            if (!child.children.empty() && !child.provenance.empty()) {
                auto hash = memo.at(&child);
                auto range = canonical_.equal_range(child.provenance);
                const CanonicalEntry* match = nullptr;
                for (auto it = range.first; it != range.second; ++it) {
                    if (it->second.hash == hash && same_content(child, *it->second.node)) {
                        match = &it->second;
                        break;
                    }
                }
                if (match) {
                    model_.aliases[child.id] = match->node->id;
                    child.alias_of = match->node->id;
                    child.children.clear();
                    ++replaced_;
                    continue;
                }
            }
            replace(child, memo);
        }
    }

    void register_subtrees(const FeatureNode& node,
                           const std::unordered_map<const FeatureNode*, std::size_t>& memo) {
        for (const auto& child : node.children) {
            if (!child.children.empty() && !child.provenance.empty()) {
                auto it = memo.find(&child);
                if (it != memo.end()) {
                    canonical_.insert({child.provenance, {&child, it->second}});
                    registered_.emplace(child.id, &child);
                }
            }
            register_subtrees(child, memo);
        }
    }
};

} // namespace

FeatureModel assemble_model(std::vector<KindOutput> kinds,
                            const AssemblyOptions& options,
                            WarningCollector& warnings) {
    FeatureModel model;
    model.namespace_name = options.namespace_name;

    model.root.name = options.namespace_name;
    model.root.id = options.namespace_name;
    model.root.abstract = true;
    model.root.group = GroupType::Or;
    model.root.cardinality = Cardinality::Mandatory;

    std::vector<Constraint> constraints;
    for (auto& kind : kinds) {
        kind.synthesis.tree.cardinality = Cardinality::Mandatory;
        model.root.children.push_back(std::move(kind.synthesis.tree));
        for (auto& [id, text] : kind.synthesis.descriptions) {
            model.descriptions.emplace(id, std::move(text));
        }
        for (auto& [path, id] : kind.synthesis.aliases) {
            model.aliases.emplace(path, std::move(id));
        }
        for (auto& c : kind.constraints) {
            constraints.push_back(std::move(c));
        }
    }

    if (options.deduplicate) {
        Deduplicator dedup(model);
        dedup.run();
        spdlog::debug("assembler: {} subtrees replaced by aliases", dedup.replaced());
    }

    model.reindex();

    // Descriptions of ids folded into an alias stay reachable via the canonical id
    for (auto it = model.descriptions.begin(); it != model.descriptions.end();) {
        if (!model.find(it->first)) {
            it = model.descriptions.erase(it);
        } else {
            ++it;
        }
    }

    deduplicate_constraints(constraints);
    for (auto& c : constraints) {
        std::set<std::string> ids;
        collect_features(*c.expr, ids);
        std::string missing;
        for (const auto& id : ids) {
            if (!model.contains(id)) {
                missing = id;
                break;
            }
        }
        if (!missing.empty()) {
            warnings.emit(Warning::dangling_constraint,
                          warnings::dangling_constraint(c.text(), missing, c.rule + "@" + c.trace));
            continue;
        }
        model.constraints.push_back(std::move(c));
    }

    spdlog::info("assembled model '{}': {} kinds, {} features, {} constraints",
                 model.namespace_name, model.kinds().size(), model.feature_count(),
                 model.constraints.size());
    return model;
}

LintReport lint_model(const FeatureModel& model) {
    LintReport report;
    std::set<std::string> seen;

    std::function<void(const FeatureNode&, const std::string&, std::vector<std::string>&)> visit =
        [&](const FeatureNode& node, const std::string& parent_id, std::vector<std::string>& ancestors) {
            if (!seen.insert(node.id).second) {
                report.issues.push_back("duplicate feature id: " + node.id);
            }

            std::string expected = parent_id.empty() || parent_id == model.root.id
                ? node.name
                : parent_id + "." + node.name;
            if (&node != &model.root && node.id != expected) {
                report.issues.push_back("feature id does not match tree path: " + node.id);
            }

            if (!node.alias_of.empty()) {
                if (!node.children.empty()) {
                    report.issues.push_back("alias node has children: " + node.id);
                }
                if (!model.find(node.alias_of)) {
                    report.issues.push_back("alias target missing: " + node.id + " -> " + node.alias_of);
                }
            }

            if (!node.cycle_of.empty()) {
                bool is_ancestor = node.cycle_of == node.id;
                for (const auto& a : ancestors) {
                    if (a == node.cycle_of) is_ancestor = true;
                }
                if (!is_ancestor) {
                    report.issues.push_back("cycle target is not an ancestor: " + node.id + " -> " + node.cycle_of);
                }
            }

            if (node.group != GroupType::And && node.children.empty() && node.alias_of.empty()) {
                report.issues.push_back(std::string("empty ") + group_type_to_string(node.group)
                                        + " group: " + node.id);
            }

            ancestors.push_back(node.id);
            for (const auto& child : node.children) {
                visit(child, &node == &model.root ? "" : node.id, ancestors);
            }
            ancestors.pop_back();
        };

    std::vector<std::string> ancestors;
    visit(model.root, "", ancestors);

    for (const auto& c : model.constraints) {
        if (!c.expr) {
            report.issues.push_back("empty constraint");
            continue;
        }
        std::set<std::string> ids;
        collect_features(*c.expr, ids);
        for (const auto& id : ids) {
            if (!model.contains(id)) {
                report.issues.push_back("constraint references unknown feature " + id + ": " + c.text());
            }
        }
    }

    for (const auto& [req, exc] : find_conflicts(model.constraints)) {
        report.issues.push_back("conflicting constraints: " + model.constraints[req].text()
                                + " / " + model.constraints[exc].text());
    }

    report.ok = report.issues.empty();
    return report;
}

} // namespace schemafm
