#include "schemafm/model_diff.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <sstream>

namespace schemafm {

namespace {

std::string signature(const FeatureNode& node) {
    std::string sig = group_type_to_string(node.group);
    sig += node.is_mandatory() ? "/mandatory/" : "/optional/";
    sig += node.type == AttributeType::None ? "Boolean" : attribute_type_to_string(node.type);
    sig += "/" + std::to_string(node.repeat_depth);
    return sig;
}

std::map<std::string, std::string> feature_signatures(const FeatureModel& model) {
    std::map<std::string, std::string> out;
    walk_tree(model.root, [&out](const FeatureNode& node) {
        out[node.id] = signature(node);
    });
    return out;
}

std::set<std::string> constraint_set(const FeatureModel& model) {
    std::set<std::string> out;
    for (const auto& c : model.constraints) {
        if (c.expr) out.insert(normalize_expression(*c.expr));
    }
    return out;
}

template<typename Set>
std::vector<std::string> difference(const Set& a, const Set& b) {
    std::vector<std::string> out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

void render_list(std::ostringstream& out, const char* title, const std::vector<std::string>& items) {
    if (items.empty()) return;
    out << "\n### " << title << " (" << items.size() << ")\n\n";
    for (const auto& item : items) {
        out << "- `" << item << "`\n";
    }
}

} // namespace

ModelDiff diff_models(const FeatureModel& before, const FeatureModel& after) {
    ModelDiff diff;

    auto old_features = feature_signatures(before);
    auto new_features = feature_signatures(after);

    std::set<std::string> old_ids;
    std::set<std::string> new_ids;
    for (const auto& [id, sig] : old_features) old_ids.insert(id);
    for (const auto& [id, sig] : new_features) new_ids.insert(id);

    diff.added_features = difference(new_ids, old_ids);
    diff.removed_features = difference(old_ids, new_ids);
    for (const auto& [id, sig] : old_features) {
        auto it = new_features.find(id);
        if (it != new_features.end() && it->second != sig) {
            diff.changed_features.push_back(id);
        }
    }

    auto old_constraints = constraint_set(before);
    auto new_constraints = constraint_set(after);
    diff.added_constraints = difference(new_constraints, old_constraints);
    diff.removed_constraints = difference(old_constraints, new_constraints);
    return diff;
}

std::string render_diff_markdown(const ModelDiff& diff,
                                 const std::string& before_label,
                                 const std::string& after_label) {
    std::ostringstream out;
    out << "## Model changes: " << before_label << " -> " << after_label << "\n";
    if (diff.empty()) {
        out << "\nNo differences.\n";
        return out.str();
    }

    out << "\n| | features | constraints |\n|---|---|---|\n";
    out << "| added | " << diff.added_features.size() << " | " << diff.added_constraints.size() << " |\n";
    out << "| removed | " << diff.removed_features.size() << " | " << diff.removed_constraints.size() << " |\n";
    out << "| changed | " << diff.changed_features.size() << " | - |\n";

    render_list(out, "Added features", diff.added_features);
    render_list(out, "Removed features", diff.removed_features);
    render_list(out, "Changed features", diff.changed_features);
    render_list(out, "Added constraints", diff.added_constraints);
    render_list(out, "Removed constraints", diff.removed_constraints);
    return out.str();
}

} // namespace schemafm
