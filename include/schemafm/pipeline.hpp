#pragma once

#include "schemafm/assembler.hpp"
#include "schemafm/config.hpp"
#include "schemafm/constraint_deriver.hpp"
#include "schemafm/feature_model.hpp"
#include "schemafm/result.hpp"
#include "schemafm/schema_graph.hpp"
#include "schemafm/synthesizer.hpp"
#include "schemafm/warnings.hpp"

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace schemafm {

// ============================================================================
// Schema -> Model Pipeline
// ============================================================================

struct PipelineOptions {
    SchemaGraphOptions graph;
    SynthesisOptions synthesis;
    DerivationOptions derivation = default_derivation_options();
    AssemblyOptions assembly;
    bool parallel = true;
    std::size_t workers = 4;
};

PipelineOptions pipeline_options_from_config(const RunConfig& config);

// Resolve, synthesize (kinds in parallel when enabled), derive and
// assemble. Fails on a malformed schema or when a warning's policy is
// "error".
Result<FeatureModel> build_model(const nlohmann::ordered_json& schema,
                                 const PipelineOptions& options,
                                 WarningCollector& warnings);

Result<FeatureModel> build_model_from_file(const std::string& path,
                                           const PipelineOptions& options,
                                           WarningCollector& warnings);

} // namespace schemafm
