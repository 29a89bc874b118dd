#pragma once

#include "schemafm/feature_model.hpp"
#include "schemafm/translator.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// Model Validator
// ============================================================================
//
// Violation ids, reported in this order:
//   unknown:<id>            selected id is not a feature of the model
//   parent:<id>             selected while its parent is not
//   mandatory:<id>          mandatory child of a selected and-group parent missing
//   group-or:<id>           or-group with no member selected
//   group-alternative:<id>  alternative group without exactly one member
//                           (at least one inside repeatable features)
//   enum:<id>               value outside the enumerated value set
//   constraint:<expr>       cross-tree constraint evaluates false

struct ValidationReport {
    std::string document_id;
    bool valid = true;
    std::vector<std::string> violations;
    double elapsed_ms = 0.0;
};

nlohmann::ordered_json report_to_json(const ValidationReport& report);

class ModelValidator {
public:
    explicit ModelValidator(const FeatureModel& model) : model_(model) {}

    ValidationReport validate(const Selection& selection) const;

private:
    const FeatureModel& model_;
};

} // namespace schemafm
