#pragma once

#include "schemafm/feature_model.hpp"
#include "schemafm/result.hpp"
#include "schemafm/types.hpp"
#include "schemafm/warnings.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// Key Mapping Table
// ============================================================================
//
// A key path is a dot-separated list of segments starting at the document
// kind. Array levels append "[*]" to the segment that holds the array
// ("Pod.spec.containers[*].name"), "*" stands for any map key
// ("Pod.metadata.labels.*") and "@<type>" on the last segment selects a
// union branch by JSON type ("Deployment.spec.strategy.maxSurge@string").

struct KeyMappingEntry {
    std::string key_path;
    std::string feature_id;
    ValueKind value_kind = ValueKind::BooleanPresence;
};

// Split a key path on '.' (segments never contain dots)
std::vector<std::string> split_key_path(const std::string& key_path);
std::string join_key_path(const std::vector<std::string>& segments);

// Derive one entry per feature from the model tree. Aliased subtrees are
// walked through their canonical target so the entries carry alias ids.
std::vector<KeyMappingEntry> derive_key_mapping(const FeatureModel& model);

// ============================================================================
// TSV Persistence
// ============================================================================
//
//   # key_path	feature_id	value_kind
//   Pod	Pod	boolean-presence
//   Pod.spec.containers[*].name	Pod.spec.containers.name	verbatim

std::string serialize_key_mapping(const std::vector<KeyMappingEntry>& entries);

struct KeyMappingParseResult {
    bool ok = false;
    std::string error;
    std::vector<KeyMappingEntry> entries;
};

KeyMappingParseResult parse_key_mapping(const std::string& text);

Result<void> save_key_mapping(const std::vector<KeyMappingEntry>& entries, const std::string& path);

Result<std::vector<KeyMappingEntry>> load_key_mapping_file(const std::string& path);

// ============================================================================
// Lookup
// ============================================================================

enum class LookupStatus {
    Miss,
    Hit,
    Ambiguous
};

struct LookupResult {
    LookupStatus status = LookupStatus::Miss;
    const KeyMappingEntry* entry = nullptr;  // set on Hit
    std::vector<std::string> candidates;     // patterns, set on Ambiguous
};

class KeyMapper {
public:
    KeyMapper();
    ~KeyMapper();
    KeyMapper(KeyMapper&& other) noexcept;
    KeyMapper& operator=(KeyMapper&& other) noexcept;
    KeyMapper(const KeyMapper&) = delete;
    KeyMapper& operator=(const KeyMapper&) = delete;

    // Index the entries. Every entry of a pattern that appears more than
    // once is left out and reported as ambiguous_key_path.
    static KeyMapper build(std::vector<KeyMappingEntry> entries, WarningCollector& warnings);

    // Concrete segments with array indices already normalized to "[*]"
    LookupResult lookup(const std::vector<std::string>& segments) const;
    LookupResult lookup(const std::string& key_path) const;

    const std::vector<KeyMappingEntry>& entries() const { return entries_; }
    const std::vector<std::string>& ambiguous_patterns() const { return ambiguous_; }
    std::size_t size() const { return entries_.size(); }

    struct TrieNode;

private:
    std::vector<KeyMappingEntry> entries_;
    std::vector<std::string> ambiguous_;
    std::unique_ptr<TrieNode> trie_;

    void insert(std::size_t index);
};

} // namespace schemafm
