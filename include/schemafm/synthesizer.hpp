#pragma once

#include "schemafm/feature_model.hpp"
#include "schemafm/schema_graph.hpp"
#include "schemafm/warnings.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// Feature Synthesis
// ============================================================================

struct SynthesisOptions {
    std::size_t max_depth = 64;
    std::string escape_prefix = "esc_";
};

// A top-level resource kind and the feature name it is synthesized under
struct KindRoot {
    DefinitionId definition = kNoDefinition;
    std::string name;  // sanitized feature name, unique among kinds
    std::string key;   // value of the document's "kind" field
};

// One object definition expanded at one place in the tree. Several
// instances share a feature id when allOf branches are folded together.
struct ObjectInstance {
    std::string feature_id;
    std::string kind_id;
    DefinitionId definition = kNoDefinition;
    std::map<std::string, std::string> properties;  // raw property name -> feature id
};

struct UnionInstance {
    std::string feature_id;
    DefinitionId definition = kNoDefinition;
    std::vector<std::string> branches;  // branch feature ids
    bool exclusive = true;
};

struct KindSynthesis {
    FeatureNode tree;
    std::map<std::string, std::string> descriptions;
    std::map<std::string, std::string> aliases;
    std::vector<ObjectInstance> objects;
    std::vector<UnionInstance> unions;
};

// Pick kind feature names for the graph roots. Short names are used where
// unique; later kinds that collide fall back to their qualified name.
std::vector<KindRoot> select_kinds(const SchemaGraph& graph,
                                   const std::string& escape_prefix,
                                   WarningCollector& warnings);

// Characters outside [A-Za-z0-9_] become '_'; reserved words and names
// starting with a digit get the escape prefix.
std::string sanitize_feature_name(const std::string& raw, const std::string& escape_prefix);

bool is_reserved_word(const std::string& name);

// Items listed under "Possible enum values:" in a description
std::vector<std::string> enum_values_from_description(const std::string& description);

// Value after "Defaults to", "Default is" or "Default value is"; empty when
// the description names none
std::string default_from_description(const std::string& description);

bool description_marks_required(const std::string& description);
bool description_marks_deprecated(const std::string& description);

class FeatureSynthesizer {
public:
    FeatureSynthesizer(const SchemaGraph& graph, SynthesisOptions options);

    // Expand one kind. Reads the graph only, so distinct kinds may be
    // synthesized concurrently with one collector each.
    KindSynthesis synthesize(const KindRoot& kind, WarningCollector& warnings) const;

private:
    const SchemaGraph& graph_;
    SynthesisOptions options_;
};

} // namespace schemafm
