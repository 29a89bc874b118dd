#include "schemafm/constraint_deriver.hpp"
#include "schemafm/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <sstream>

namespace schemafm {

namespace {

const std::regex kRequiredWhen(
    R"((?:required|must be (?:set|specified|provided))\s+(?:only\s+)?(?:when|if)\s+`?([A-Za-z_][A-Za-z0-9_.]*)`?\s+(?:is|==|=)\s+(?:set to\s+)?["'`]?([A-Za-z0-9_/-]+))",
    std::regex::ECMAScript | std::regex::icase);

const std::regex kForbiddenWhen(
    R"((?:cannot|can not|must not|may not)\s+be\s+(?:set|specified|used)\s+(?:when|if)\s+`?([A-Za-z_][A-Za-z0-9_.]*)`?\s+is\s+["'`]?([A-Za-z0-9_/-]+))",
    std::regex::ECMAScript | std::regex::icase);

const std::regex kExclusivePhrase(
    R"(mutually exclusive|only one of|at most one of|exactly one of|at least one of)",
    std::regex::ECMAScript | std::regex::icase);

const std::regex kCoveringPhrase(
    R"(exactly one of|at least one of)",
    std::regex::ECMAScript | std::regex::icase);

// Numeric limits written in descriptions, checked in this order
const std::regex kOpenRange(R"((-?\d+)\s*<\s*\w+\s*<\s*(-?\d+))");
const std::regex kInclusiveRange(R"((-?\d+)\s*-\s*(\d+)\s*\(?inclusive\)?)",
                                 std::regex::ECMAScript | std::regex::icase);
const std::regex kRangeTo(R"(in the range\s+(-?\d+)\s+to\s+(-?\d+))",
                          std::regex::ECMAScript | std::regex::icase);
const std::regex kBetween(R"(must\s+be\s+between\s+(-?\d+)\s+and\s+(-?\d+))",
                          std::regex::ECMAScript | std::regex::icase);
const std::regex kRangeDash(R"(in the range\s+(-?\d+)\s*-\s*(\d+))",
                            std::regex::ECMAScript | std::regex::icase);
const std::regex kGreaterThan(R"(must be greater than( or equal to)?\s+(-?\d+))",
                              std::regex::ECMAScript | std::regex::icase);
const std::regex kLessThan(R"((must be less than|less than or equal to)\s+(-?\d+))",
                           std::regex::ECMAScript | std::regex::icase);
const std::regex kMinimum(R"((?:minimum value is|minimum valid value for \w+ is)\s+(-?\d+))",
                          std::regex::ECMAScript | std::regex::icase);
const std::regex kNumberWord(R"(\b(zero|one)\b)", std::regex::ECMAScript | std::regex::icase);

struct Bound {
    std::string value;
    bool inclusive = true;
};

struct Bounds {
    std::optional<Bound> lower;
    std::optional<Bound> upper;

    bool empty() const { return !lower && !upper; }
};

// Limits of a numeric property read from its description
Bounds bounds_from_description(const std::string& description) {
    // Number words only ever name small limits
    std::string text;
    std::sregex_iterator words(description.begin(), description.end(), kNumberWord), end;
    std::size_t last = 0;
    for (; words != end; ++words) {
        text += description.substr(last, words->position() - last);
        std::string word = words->str();
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        text += word == "zero" ? "0" : "1";
        last = words->position() + words->length();
    }
    text += description.substr(last);

    Bounds bounds;
    std::smatch m;
    auto both = [&bounds, &m](bool inclusive) {
        bounds.lower = Bound{m[1].str(), inclusive};
        bounds.upper = Bound{m[2].str(), inclusive};
        return bounds;
    };
    if (std::regex_search(text, m, kOpenRange)) return both(false);
    if (std::regex_search(text, m, kInclusiveRange)) return both(true);
    if (std::regex_search(text, m, kRangeTo)) return both(true);
    if (std::regex_search(text, m, kBetween)) return both(true);

    if (std::regex_search(text, m, kGreaterThan)) {
        bounds.lower = Bound{m[2].str(), m[1].matched};
    }
    if (std::regex_search(text, m, kLessThan)) {
        bounds.upper = Bound{m[2].str(), m[1].str().find("equal") != std::string::npos};
    }
    if (!bounds.empty()) return bounds;

    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (std::regex_search(text, m, kMinimum)) {
        bounds.lower = Bound{m[1].str(), true};
    } else if (lower.find("value must be non-negative") != std::string::npos) {
        bounds.lower = Bound{"0", true};
    } else if (std::regex_search(text, m, kRangeDash)) {
        return both(true);
    } else if (lower.find("valid port number") != std::string::npos) {
        bounds.lower = Bound{"1", true};
        bounds.upper = Bound{"65535", true};
    }
    return bounds;
}

// "set" / "specified" as a value means presence of the trigger
bool is_presence_word(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "set" || lower == "specified" || lower == "present" || lower == "provided";
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        if (!current.empty()) parts.push_back(current);
    }
    return parts;
}

// Sentences of a description; exclusivity is judged per sentence
std::vector<std::string> sentences(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        current += text[i];
        bool boundary = (text[i] == '.' && (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1]))))
                     || text[i] == '\n';
        if (boundary) {
            out.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

std::vector<std::string> identifier_tokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            current += c;
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

// Descend from the kind node by raw configuration keys
std::optional<std::string> find_by_key_path(const FeatureNode& kind,
                                            const std::vector<std::string>& keys) {
    const FeatureNode* node = &kind;
    for (const auto& key : keys) {
        const FeatureNode* next = nullptr;
        for (const auto& child : node->children) {
            if (child.key == key) {
                next = &child;
                break;
            }
        }
        if (!next) return std::nullopt;
        node = next;
    }
    return node->id;
}

class RuleRunner {
public:
    RuleRunner(const SchemaGraph& graph, const KindSynthesis& synthesis,
               std::vector<Constraint>& out)
        : graph_(graph), synthesis_(synthesis), out_(out) {}

    void dependent_required(const ObjectInstance& inst) {
        const Definition& def = graph_.get(inst.definition);
        for (const auto& cond : def.conditions) {
            if (cond.rule != kRuleDependentRequired) continue;
            auto trigger = property(inst, cond.trigger);
            if (!trigger) continue;
            for (const auto& req : cond.required) {
                if (auto target = property(inst, req)) {
                    out_.push_back(make_requires(*trigger, *target, kRuleDependentRequired,
                                                 cond.source_path));
                }
            }
        }
    }

    void conditional_required(const ObjectInstance& inst) {
        const Definition& def = graph_.get(inst.definition);
        for (const auto& cond : def.conditions) {
            if (cond.rule != kRuleConditionalRequired) continue;
            auto trigger = property(inst, cond.trigger);
            if (!trigger) continue;
            for (const auto& req : cond.required) {
                auto target = property(inst, req);
                if (!target) continue;
                if (cond.trigger_value.empty()) {
                    out_.push_back(make_requires(*trigger, *target, kRuleConditionalRequired,
                                                 cond.source_path));
                } else {
                    out_.push_back(make_expression_constraint(
                        make_implies(make_equals(*trigger, cond.trigger_value), make_feature(*target)),
                        kRuleConditionalRequired, cond.source_path));
                }
            }
        }
    }

    void required_when(const ObjectInstance& inst) {
        for_each_property(inst, [&](const PropertyRef& prop, const std::string& self) {
            for (std::sregex_iterator it(prop.description.begin(), prop.description.end(), kRequiredWhen), end;
                 it != end; ++it) {
                auto trigger = trigger_feature(inst, (*it)[1].str());
                if (!trigger || *trigger == self) continue;
                std::string value = (*it)[2].str();
                std::string trace = graph_.get(inst.definition).name + "/" + prop.name;
                if (is_presence_word(value)) {
                    out_.push_back(make_requires(*trigger, self, kRuleRequiredWhen, trace));
                } else {
                    out_.push_back(make_expression_constraint(
                        make_implies(make_equals(*trigger, value), make_feature(self)),
                        kRuleRequiredWhen, trace));
                }
            }
        });
    }

    void forbidden_when(const ObjectInstance& inst) {
        for_each_property(inst, [&](const PropertyRef& prop, const std::string& self) {
            for (std::sregex_iterator it(prop.description.begin(), prop.description.end(), kForbiddenWhen), end;
                 it != end; ++it) {
                auto trigger = trigger_feature(inst, (*it)[1].str());
                if (!trigger || *trigger == self) continue;
                std::string value = (*it)[2].str();
                std::string trace = graph_.get(inst.definition).name + "/" + prop.name;
                if (is_presence_word(value)) {
                    out_.push_back(make_excludes(*trigger, self, kRuleForbiddenWhen, trace));
                } else {
                    out_.push_back(make_expression_constraint(
                        make_implies(make_equals(*trigger, value), make_not(make_feature(self))),
                        kRuleForbiddenWhen, trace));
                }
            }
        });
    }

    void bounds(const ObjectInstance& inst) {
        for_each_property(inst, [&](const PropertyRef& prop, const std::string& self) {
            const auto* scalar = std::get_if<ScalarShape>(&graph_.get(prop.target).shape);
            if (!scalar || (scalar->type != "integer" && scalar->type != "number")) return;

            Bounds limits = bounds_from_description(prop.description);
            if (limits.empty()) return;

            std::vector<ExprPtr> checks;
            if (limits.lower) {
                checks.push_back(make_comparison(
                    limits.lower->inclusive ? ExprOp::GreaterEqual : ExprOp::Greater, self, limits.lower->value));
            }
            if (limits.upper) {
                checks.push_back(make_comparison(
                    limits.upper->inclusive ? ExprOp::LessEqual : ExprOp::Less, self, limits.upper->value));
            }
            out_.push_back(make_expression_constraint(make_implies(make_feature(self), make_and(std::move(checks))),
                                                      kRuleBounds,
                                                      graph_.get(inst.definition).name + "/" + prop.name));
        });
    }

    void mutually_exclusive(const ObjectInstance& inst) {
        const Definition& def = graph_.get(inst.definition);
        std::string trace = def.name;

        // Object-level description: members are the siblings it names
        exclusive_sentences(inst, def.description, "", trace);

        for_each_property(inst, [&](const PropertyRef& prop, const std::string&) {
            exclusive_sentences(inst, prop.description, prop.name, trace + "/" + prop.name);
        });
    }

    void union_exclusive(const UnionInstance& inst) {
        if (!inst.exclusive || inst.branches.size() < 2) return;
        const Definition& def = graph_.get(inst.definition);

        std::string text = def.description;
        auto it = synthesis_.descriptions.find(inst.feature_id);
        if (it != synthesis_.descriptions.end()) text += "\n" + it->second;
        if (!std::regex_search(text, kExclusivePhrase)) return;

        pairwise_excludes(inst.branches, kRuleUnionExclusive, def.name);
    }

    void required_groups(const ObjectInstance& inst) {
        const Definition& def = graph_.get(inst.definition);
        for (const auto& group : def.required_groups) {
            std::vector<std::string> members;
            for (const auto& name : group.members) {
                if (auto id = property(inst, name)) {
                    if (std::find(members.begin(), members.end(), *id) == members.end()) {
                        members.push_back(*id);
                    }
                }
            }
            if (members.size() < 2) continue;
            if (group.exclusive) {
                pairwise_excludes(members, kRuleUnionExclusive, group.source_path);
            }
            covering(inst.feature_id, members, kRuleUnionExclusive, group.source_path);
        }
    }

private:
    const SchemaGraph& graph_;
    const KindSynthesis& synthesis_;
    std::vector<Constraint>& out_;

    static std::optional<std::string> property(const ObjectInstance& inst, const std::string& name) {
        auto it = inst.properties.find(name);
        if (it == inst.properties.end()) return std::nullopt;
        return it->second;
    }

    // Bare names are siblings; dotted paths are relative to the kind
    std::optional<std::string> trigger_feature(const ObjectInstance& inst, const std::string& trigger) {
        if (trigger.find('.') == std::string::npos) {
            return property(inst, trigger);
        }
        auto id = find_by_key_path(synthesis_.tree, split(trigger, '.'));
        if (!id) {
            spdlog::debug("description path {} not found under {}", trigger, inst.kind_id);
        }
        return id;
    }

    template<typename Fn>
    void for_each_property(const ObjectInstance& inst, Fn&& fn) {
        const auto* shape = std::get_if<ObjectShape>(&graph_.get(inst.definition).shape);
        if (!shape) return;
        for (const auto& prop : shape->properties) {
            if (prop.description.empty()) continue;
            if (auto self = property(inst, prop.name)) {
                fn(prop, *self);
            }
        }
    }

    void exclusive_sentences(const ObjectInstance& inst, const std::string& text,
                             const std::string& self_name, const std::string& trace) {
        if (text.empty()) return;
        for (const auto& sentence : sentences(text)) {
            if (!std::regex_search(sentence, kExclusivePhrase)) continue;

            std::vector<std::string> members;
            auto add = [&](const std::string& name) {
                auto id = property(inst, name);
                if (id && std::find(members.begin(), members.end(), *id) == members.end()) {
                    members.push_back(*id);
                }
            };
            for (const auto& token : identifier_tokens(sentence)) {
                add(token);
            }
            if (!self_name.empty() && !members.empty()) {
                add(self_name);
            }
            if (members.size() < 2) continue;

            pairwise_excludes(members, kRuleMutuallyExclusive, trace);
            if (std::regex_search(sentence, kCoveringPhrase)) {
                covering(inst.feature_id, members, kRuleMutuallyExclusive, trace);
            }
        }
    }

    void pairwise_excludes(const std::vector<std::string>& members, const std::string& rule,
                           const std::string& trace) {
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                out_.push_back(make_excludes(members[i], members[j], rule, trace));
            }
        }
    }

    void covering(const std::string& parent, const std::vector<std::string>& members,
                  const std::string& rule, const std::string& trace) {
        std::vector<ExprPtr> alternatives;
        for (const auto& member : members) {
            alternatives.push_back(make_feature(member));
        }
        out_.push_back(make_expression_constraint(
            make_implies(make_feature(parent), make_or(std::move(alternatives))), rule, trace));
    }
};

// Feature pair of a requires/excludes constraint
std::pair<std::string, std::string> constraint_pair(const Constraint& c) {
    const Expr& lhs = *c.expr->operands[0];
    const Expr& rhs = *c.expr->operands[1];
    if (c.kind == ConstraintKind::Excludes) {
        return {lhs.feature, rhs.operands[0]->feature};
    }
    return {lhs.feature, rhs.feature};
}

} // namespace

DerivationOptions default_derivation_options() {
    return {all_derivation_rules()};
}

std::vector<Constraint> derive_constraints(const SchemaGraph& graph,
                                           const KindSynthesis& synthesis,
                                           const DerivationOptions& options,
                                           WarningCollector& warnings) {
    std::vector<Constraint> constraints;
    RuleRunner runner(graph, synthesis, constraints);

    auto enabled = [&options](const char* rule) {
        return std::find(options.rules.begin(), options.rules.end(), rule) != options.rules.end();
    };

    for (const auto& inst : synthesis.objects) {
        if (enabled(kRuleDependentRequired)) runner.dependent_required(inst);
        if (enabled(kRuleConditionalRequired)) runner.conditional_required(inst);
        if (enabled(kRuleRequiredWhen)) runner.required_when(inst);
        if (enabled(kRuleForbiddenWhen)) runner.forbidden_when(inst);
        if (enabled(kRuleMutuallyExclusive)) runner.mutually_exclusive(inst);
        if (enabled(kRuleUnionExclusive)) runner.required_groups(inst);
        if (enabled(kRuleBounds)) runner.bounds(inst);
    }
    if (enabled(kRuleUnionExclusive)) {
        for (const auto& inst : synthesis.unions) {
            runner.union_exclusive(inst);
        }
    }

    deduplicate_constraints(constraints);
    flag_conflicts(constraints, warnings);

    spdlog::debug("{}: derived {} constraints", synthesis.tree.id, constraints.size());
    return constraints;
}

std::vector<std::pair<std::size_t, std::size_t>> find_conflicts(
    const std::vector<Constraint>& constraints) {
    std::map<std::pair<std::string, std::string>, std::size_t> requires_index;
    for (std::size_t i = 0; i < constraints.size(); ++i) {
        if (constraints[i].kind == ConstraintKind::Requires) {
            requires_index.emplace(constraint_pair(constraints[i]), i);
        }
    }

    // a => !b and b => !a exclude the same pair, so both orientations of a
    // requires constraint clash with it
    std::vector<std::pair<std::size_t, std::size_t>> conflicts;
    for (std::size_t i = 0; i < constraints.size(); ++i) {
        if (constraints[i].kind != ConstraintKind::Excludes) continue;
        auto [a, b] = constraint_pair(constraints[i]);
        std::set<std::size_t> matched;
        for (const auto& key : {std::make_pair(a, b), std::make_pair(b, a)}) {
            auto it = requires_index.find(key);
            if (it != requires_index.end() && matched.insert(it->second).second) {
                conflicts.emplace_back(it->second, i);
            }
        }
    }
    return conflicts;
}

void flag_conflicts(const std::vector<Constraint>& constraints, WarningCollector& warnings) {
    for (const auto& [req, exc] : find_conflicts(constraints)) {
        const Constraint& a = constraints[req];
        const Constraint& b = constraints[exc];
        warnings.emit(Warning::model_inconsistency,
                      warnings::model_inconsistency(a.text(), b.text(),
                                                    a.rule + "@" + a.trace,
                                                    b.rule + "@" + b.trace));
    }
}

void deduplicate_constraints(std::vector<Constraint>& constraints) {
    std::set<std::string> seen;
    std::vector<Constraint> unique;
    unique.reserve(constraints.size());
    for (auto& c : constraints) {
        if (seen.insert(c.text()).second) {
            unique.push_back(std::move(c));
        }
    }
    constraints = std::move(unique);
}

} // namespace schemafm
