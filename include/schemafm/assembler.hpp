#pragma once

#include "schemafm/feature_model.hpp"
#include "schemafm/synthesizer.hpp"
#include "schemafm/warnings.hpp"

#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// Model Assembly
// ============================================================================

struct AssemblyOptions {
    std::string namespace_name = "Resources";
    bool deduplicate = true;
};

struct KindOutput {
    KindSynthesis synthesis;
    std::vector<Constraint> constraints;
};

// Merge per-kind trees under an abstract or-group root, replace subtrees
// already placed under an earlier kind by alias nodes and drop constraints
// that reference features absent from the result.
FeatureModel assemble_model(std::vector<KindOutput> kinds,
                            const AssemblyOptions& options,
                            WarningCollector& warnings);

// ============================================================================
// Model Lint
// ============================================================================

struct LintReport {
    bool ok = true;
    std::vector<std::string> issues;
};

// Re-check model invariants: unique ids, ids matching tree paths,
// resolvable alias, cycle and constraint targets, conflicting pairs.
LintReport lint_model(const FeatureModel& model);

} // namespace schemafm
