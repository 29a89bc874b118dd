#pragma once

#include "schemafm/feature_model.hpp"
#include "schemafm/schema_graph.hpp"
#include "schemafm/synthesizer.hpp"
#include "schemafm/warnings.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace schemafm {

// ============================================================================
// Constraint Derivation
// ============================================================================

struct DerivationOptions {
    std::vector<std::string> rules;  // enabled rule names, evaluation order fixed
};

DerivationOptions default_derivation_options();

// Run every enabled rule over the object and union instances of one kind.
// Rule outputs are unioned; textual duplicates keep the first occurrence.
std::vector<Constraint> derive_constraints(const SchemaGraph& graph,
                                           const KindSynthesis& synthesis,
                                           const DerivationOptions& options,
                                           WarningCollector& warnings);

// Index pairs (requires, excludes) over the same unordered feature pair
std::vector<std::pair<std::size_t, std::size_t>> find_conflicts(
    const std::vector<Constraint>& constraints);

// Emit model_inconsistency for every conflicting pair; both stay in the list
void flag_conflicts(const std::vector<Constraint>& constraints, WarningCollector& warnings);

// Drop textual duplicates, keeping the first occurrence
void deduplicate_constraints(std::vector<Constraint>& constraints);

} // namespace schemafm
