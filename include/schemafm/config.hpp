#pragma once

#include "schemafm/types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace schemafm {

// ============================================================================
// Run Configuration
// ============================================================================

inline constexpr const char* kConfigSchema = "schemafm.config.v1";

// Names of the constraint derivation rules, in evaluation order
inline constexpr const char* kRuleDependentRequired = "dependent-required";
inline constexpr const char* kRuleConditionalRequired = "conditional-required";
inline constexpr const char* kRuleRequiredWhen = "description-required-when";
inline constexpr const char* kRuleForbiddenWhen = "description-forbidden-when";
inline constexpr const char* kRuleMutuallyExclusive = "description-mutually-exclusive";
inline constexpr const char* kRuleUnionExclusive = "union-exclusive";
inline constexpr const char* kRuleBounds = "description-bounds";

std::vector<std::string> all_derivation_rules();

struct RunConfig {
    std::string schema;  // "schemafm.config.v1"

    // "model" section
    struct {
        std::string namespace_name = "Resources";
        std::vector<std::string> roots;  // empty: kind marker, then unreferenced definitions
        std::string kind_marker = "x-kubernetes-group-version-kind";
        std::size_t max_depth = 64;
        std::string escape_prefix = "esc_";
        bool parallel_synthesis = true;
        bool deduplicate = true;
    } model;

    // "derivation" section
    struct {
        std::vector<std::string> rules = all_derivation_rules();
    } derivation;

    // "batch" section
    struct {
        std::size_t workers = 4;
        std::size_t queue_capacity = 64;
        std::size_t batch_size = 50;
        long document_time_budget_ms = 5000;  // <= 0 disables the deadline
        std::vector<std::string> skip_kinds = {"CustomResourceDefinition"};
        bool skip_templated = true;
        std::string source = "schemafm";  // "source" column of the summary CSV
    } batch;

    // "warnings" section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for trace
    std::string source_path;
};

RunConfig get_default_config();

bool rule_enabled(const RunConfig& config, const std::string& rule);

// ============================================================================
// Run Configuration Parsing Result
// ============================================================================

struct RunConfigParseResult {
    bool ok = false;
    std::string error;
    RunConfig config;
    std::vector<std::string> warnings;  // "invalid_configuration:<reason>"
};

// Parse a run configuration from JSON string. Sections and keys that are
// absent keep their defaults.
RunConfigParseResult parse_run_config(const std::string& json_str,
                                      const std::string& source_path = "");

// Read and parse a configuration file
RunConfigParseResult load_run_config(const std::string& path);

} // namespace schemafm
