#pragma once

#include "schemafm/feature_model.hpp"
#include "schemafm/result.hpp"

#include <string>

namespace schemafm {

// ============================================================================
// Model Text Format
// ============================================================================
//
//   namespace Resources
//
//   features
//   	Resources {abstract}
//   		or
//   			Pod
//   				mandatory
//   					spec
//   						mandatory
//   							containers {repeatable [1]}
//   		...
//
//   constraints
//   	Pod.spec.a => Pod.spec.b
//
// Indentation is one tab per level. Feature lines are
// "[Type ]name[ {attr, attr}]"; see serialize_model for the attributes.

// Deterministic rendering: depth-first in declaration order
std::string serialize_model(const FeatureModel& model);

struct ModelParseResult {
    bool ok = false;
    std::string error;
    FeatureModel model;
};

ModelParseResult parse_model(const std::string& text);

// ============================================================================
// Metadata Sidecar
// ============================================================================

// JSON: {"namespace", "descriptions": {id: text}, "aliases": {path: id},
//        "constraints": [{"text", "rule", "trace"}]}
std::string serialize_metadata(const FeatureModel& model);

// Merge descriptions, aliases and constraint traces into a parsed model
Result<void> apply_metadata(FeatureModel& model, const std::string& json_text);

// "model.uvl" -> "model.meta.json"
std::string metadata_path_for(const std::string& model_path);

// Write the model text and its metadata sidecar atomically
Result<void> save_model(const FeatureModel& model, const std::string& path);

// Read a model file, plus its sidecar when one exists
Result<FeatureModel> load_model(const std::string& path);

} // namespace schemafm
