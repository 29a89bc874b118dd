#pragma once

#include "schemafm/feature_model.hpp"

#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// Model Comparison
// ============================================================================

struct ModelDiff {
    std::vector<std::string> added_features;
    std::vector<std::string> removed_features;
    std::vector<std::string> changed_features;  // same id, different group, cardinality or type
    std::vector<std::string> added_constraints;    // normalized text
    std::vector<std::string> removed_constraints;

    bool empty() const {
        return added_features.empty() && removed_features.empty() && changed_features.empty()
            && added_constraints.empty() && removed_constraints.empty();
    }
};

// Constraints are compared in normalized form, so operand order does not count
ModelDiff diff_models(const FeatureModel& before, const FeatureModel& after);

std::string render_diff_markdown(const ModelDiff& diff,
                                 const std::string& before_label,
                                 const std::string& after_label);

} // namespace schemafm
