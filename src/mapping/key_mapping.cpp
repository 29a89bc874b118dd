#include "schemafm/key_mapping.hpp"
#include "schemafm/platform.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace schemafm {

namespace {

// "containers[*]" -> {"containers", "[*]"}, "x@string" -> {"x", "@string"}
std::pair<std::string, std::string> split_segment(const std::string& segment) {
    auto pos = segment.find_first_of("[@");
    if (pos == std::string::npos) return {segment, ""};
    return {segment.substr(0, pos), segment.substr(pos)};
}

std::string strip_branch(const std::string& pattern) {
    auto dot = pattern.rfind('.');
    auto at = pattern.rfind('@');
    if (at != std::string::npos && (dot == std::string::npos || at > dot)) {
        return pattern.substr(0, at);
    }
    return pattern;
}

ValueKind value_kind_for(const FeatureNode& node) {
    if (!node.children.empty() || !node.alias_of.empty()) return ValueKind::BooleanPresence;
    if (node.is_map || node.unknown || !node.cycle_of.empty()) return ValueKind::Verbatim;
    if (node.type == AttributeType::None && node.branch_type == "object") return ValueKind::BooleanPresence;
    if (!node.enum_values.empty()) return ValueKind::Enumerated;
    return ValueKind::Verbatim;
}

class MappingDeriver {
public:
    explicit MappingDeriver(const FeatureModel& model) : model_(model) {}

    std::vector<KeyMappingEntry> run() {
        for (const auto& kind : model_.kinds()) {
            visit(kind, kind.id, kind.key);
        }
        return std::move(entries_);
    }

private:
    const FeatureModel& model_;
    std::vector<KeyMappingEntry> entries_;

    void visit(const FeatureNode& node, const std::string& id, const std::string& pattern) {
        entries_.push_back({pattern, id, value_kind_for(node)});

        const FeatureNode* content = &node;
        if (!node.alias_of.empty()) {
            content = model_.find(node.alias_of);
            if (!content) {
                spdlog::warn("key mapping: alias target {} of {} not found", node.alias_of, id);
                return;
            }
        }
        if (content->children.empty()) return;

        std::string prefix = strip_branch(pattern);
        for (std::size_t i = 0; i < node.repeat_depth; ++i) prefix += "[*]";
        if (node.is_map) prefix += ".*";

        for (const auto& child : content->children) {
            std::string child_pattern = child.key.empty() && !child.branch_type.empty()
                ? prefix + "@" + child.branch_type
                : prefix + "." + child.key;
            visit(child, id + "." + child.name, child_pattern);
        }
    }
};

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    for (;;) {
        auto tab = line.find('\t', start);
        fields.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    return fields;
}

} // namespace

std::vector<std::string> split_key_path(const std::string& key_path) {
    std::vector<std::string> segments;
    if (key_path.empty()) return segments;
    std::size_t start = 0;
    for (;;) {
        auto dot = key_path.find('.', start);
        segments.push_back(key_path.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments;
}

std::string join_key_path(const std::vector<std::string>& segments) {
    std::string out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '.';
        out += segments[i];
    }
    return out;
}

std::vector<KeyMappingEntry> derive_key_mapping(const FeatureModel& model) {
    auto entries = MappingDeriver(model).run();
    spdlog::debug("derived {} key mapping entries", entries.size());
    return entries;
}

// ============================================================================
// TSV Persistence
// ============================================================================

std::string serialize_key_mapping(const std::vector<KeyMappingEntry>& entries) {
    std::ostringstream out;
    out << "# key_path\tfeature_id\tvalue_kind\n";
    for (const auto& e : entries) {
        out << e.key_path << '\t' << e.feature_id << '\t' << value_kind_to_string(e.value_kind) << '\n';
    }
    return out.str();
}

KeyMappingParseResult parse_key_mapping(const std::string& text) {
    KeyMappingParseResult result;
    std::istringstream in(text);
    std::string line;
    std::size_t number = 0;

    while (std::getline(in, line)) {
        ++number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        auto fields = split_tabs(line);
        if (fields.size() != 3) {
            result.error = "line " + std::to_string(number) + ": expected 3 tab-separated fields";
            return result;
        }
        if (fields[0].empty() || fields[1].empty()) {
            result.error = "line " + std::to_string(number) + ": empty key path or feature id";
            return result;
        }
        auto kind = parse_value_kind(fields[2]);
        if (!kind) {
            result.error = "line " + std::to_string(number) + ": unknown value kind '" + fields[2] + "'";
            return result;
        }
        result.entries.push_back({fields[0], fields[1], *kind});
    }

    result.ok = true;
    return result;
}

Result<void> save_key_mapping(const std::vector<KeyMappingEntry>& entries, const std::string& path) {
    auto written = atomic_write_file(path, serialize_key_mapping(entries));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error).withContext(path));
    }
    return Result<void>::ok();
}

Result<std::vector<KeyMappingEntry>> load_key_mapping_file(const std::string& path) {
    auto file = read_file(path);
    if (!file.ok) {
        return Result<std::vector<KeyMappingEntry>>::err(Error(ErrorCode::FILE_NOT_FOUND, file.error));
    }
    auto parsed = parse_key_mapping(file.content);
    if (!parsed.ok) {
        return Result<std::vector<KeyMappingEntry>>::err(
            Error(ErrorCode::KEY_MAPPING_INVALID, parsed.error).withContext(path));
    }
    return Result<std::vector<KeyMappingEntry>>::ok(std::move(parsed.entries));
}

// ============================================================================
// Segment Trie
// ============================================================================

struct KeyMapper::TrieNode {
    std::map<std::string, std::unique_ptr<TrieNode>> literal;
    std::map<std::string, std::unique_ptr<TrieNode>> wildcard;  // keyed by segment suffix
    std::size_t entry = static_cast<std::size_t>(-1);
    std::string ambiguous;  // pattern excluded for being declared twice
};

KeyMapper::KeyMapper() : trie_(std::make_unique<TrieNode>()) {}
KeyMapper::~KeyMapper() = default;
KeyMapper::KeyMapper(KeyMapper&& other) noexcept = default;
KeyMapper& KeyMapper::operator=(KeyMapper&& other) noexcept = default;

namespace {

KeyMapper::TrieNode* descend(KeyMapper::TrieNode* node, const std::string& segment) {
    auto [base, suffix] = split_segment(segment);
    auto& slot = base == "*" ? node->wildcard[suffix] : node->literal[segment];
    if (!slot) slot = std::make_unique<KeyMapper::TrieNode>();
    return slot.get();
}

void collect(const KeyMapper::TrieNode* node, const std::vector<std::string>& segments, std::size_t i,
             std::set<std::size_t>& hits, std::vector<std::string>& ambiguous) {
    if (i == segments.size()) {
        if (node->entry != static_cast<std::size_t>(-1)) hits.insert(node->entry);
        if (!node->ambiguous.empty()) ambiguous.push_back(node->ambiguous);
        return;
    }
    auto lit = node->literal.find(segments[i]);
    if (lit != node->literal.end()) {
        collect(lit->second.get(), segments, i + 1, hits, ambiguous);
    }
    if (!node->wildcard.empty()) {
        auto wild = node->wildcard.find(split_segment(segments[i]).second);
        if (wild != node->wildcard.end()) {
            collect(wild->second.get(), segments, i + 1, hits, ambiguous);
        }
    }
}

} // namespace

KeyMapper KeyMapper::build(std::vector<KeyMappingEntry> entries, WarningCollector& warnings) {
    KeyMapper mapper;

    std::unordered_map<std::string, std::vector<std::string>> by_pattern;
    for (const auto& e : entries) {
        by_pattern[e.key_path].push_back(e.feature_id);
    }

    std::set<std::string> reported;
    for (auto& e : entries) {
        const auto& ids = by_pattern[e.key_path];
        if (ids.size() > 1) {
            if (reported.insert(e.key_path).second) {
                std::string candidates;
                for (const auto& id : ids) {
                    if (!candidates.empty()) candidates += ",";
                    candidates += id;
                }
                warnings.emit(Warning::ambiguous_key_path, warnings::ambiguous_key_path(e.key_path, candidates));
                mapper.ambiguous_.push_back(e.key_path);

                TrieNode* node = mapper.trie_.get();
                for (const auto& segment : split_key_path(e.key_path)) {
                    node = descend(node, segment);
                }
                node->ambiguous = e.key_path;
            }
            continue;
        }
        mapper.entries_.push_back(std::move(e));
    }

    for (std::size_t i = 0; i < mapper.entries_.size(); ++i) {
        mapper.insert(i);
    }

    spdlog::debug("key mapper: {} entries indexed, {} ambiguous patterns",
                  mapper.entries_.size(), mapper.ambiguous_.size());
    return mapper;
}

void KeyMapper::insert(std::size_t index) {
    TrieNode* node = trie_.get();
    for (const auto& segment : split_key_path(entries_[index].key_path)) {
        node = descend(node, segment);
    }
    node->entry = index;
}

LookupResult KeyMapper::lookup(const std::vector<std::string>& segments) const {
    LookupResult result;
    if (segments.empty() || !trie_) return result;

    std::set<std::size_t> hits;
    std::vector<std::string> ambiguous;
    collect(trie_.get(), segments, 0, hits, ambiguous);

    if (ambiguous.empty() && hits.size() == 1) {
        result.status = LookupStatus::Hit;
        result.entry = &entries_[*hits.begin()];
        return result;
    }
    if (!ambiguous.empty() || hits.size() > 1) {
        result.status = LookupStatus::Ambiguous;
        for (auto i : hits) result.candidates.push_back(entries_[i].key_path);
        for (auto& p : ambiguous) result.candidates.push_back(std::move(p));
    }
    return result;
}

LookupResult KeyMapper::lookup(const std::string& key_path) const {
    return lookup(split_key_path(key_path));
}

} // namespace schemafm
