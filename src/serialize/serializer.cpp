#include "schemafm/serializer.hpp"
#include "schemafm/platform.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace schemafm {

namespace {

// ============================================================================
// Writer
// ============================================================================

// Key written when the "key" attribute is absent
std::string default_key(const FeatureNode& node, bool is_root) {
    if (is_root || !node.branch_type.empty()) return "";
    return node.name;
}

std::string feature_line(const FeatureNode& node, bool is_root) {
    std::string line;
    if (node.type != AttributeType::None) {
        line += attribute_type_to_string(node.type);
        line += ' ';
    }
    line += node.name;

    std::vector<std::string> attrs;
    if (node.abstract) attrs.push_back("abstract");
    if (node.repeat_depth > 0) attrs.push_back("repeatable [" + std::to_string(node.repeat_depth) + "]");
    if (node.is_map) attrs.push_back("map");
    if (node.unknown) attrs.push_back("unknown");
    if (node.deprecated) attrs.push_back("deprecated");
    if (node.key != default_key(node, is_root)) attrs.push_back("key " + quote_literal(node.key));
    if (!node.branch_type.empty()) attrs.push_back("branch " + quote_literal(node.branch_type));
    if (!node.alias_of.empty()) attrs.push_back("alias " + quote_literal(node.alias_of));
    if (!node.cycle_of.empty()) attrs.push_back("cycle " + quote_literal(node.cycle_of));
    if (!node.enum_values.empty()) {
        std::string list = "enum [";
        for (size_t i = 0; i < node.enum_values.size(); ++i) {
            if (i > 0) list += ", ";
            list += quote_literal(node.enum_values[i]);
        }
        list += "]";
        attrs.push_back(list);
    }
    if (!node.default_value.empty()) attrs.push_back("default " + quote_literal(node.default_value));

    if (!attrs.empty()) {
        line += " {";
        for (size_t i = 0; i < attrs.size(); ++i) {
            if (i > 0) line += ", ";
            line += attrs[i];
        }
        line += "}";
    }
    return line;
}

void write_feature(std::ostringstream& out, const FeatureNode& node, size_t depth, bool is_root) {
    out << std::string(depth, '\t') << feature_line(node, is_root) << "\n";
    if (node.children.empty()) return;

    std::string group_indent(depth + 1, '\t');
    if (node.group == GroupType::And) {
        // Runs of equal cardinality share a keyword so declaration order is kept
        size_t i = 0;
        while (i < node.children.size()) {
            Cardinality c = node.children[i].cardinality;
            out << group_indent << (c == Cardinality::Mandatory ? "mandatory" : "optional") << "\n";
            while (i < node.children.size() && node.children[i].cardinality == c) {
                write_feature(out, node.children[i], depth + 2, false);
                ++i;
            }
        }
    } else {
        out << group_indent << group_type_to_string(node.group) << "\n";
        for (const auto& child : node.children) {
            write_feature(out, child, depth + 2, false);
        }
    }
}

// ============================================================================
// Reader
// ============================================================================

struct Line {
    size_t number;
    size_t indent;
    std::string text;
};

class AttributeReader {
public:
    explicit AttributeReader(const std::string& text) : text_(text) {}

    void read(FeatureNode& node, bool& has_key) {
        skip_space();
        expect('{');
        skip_space();
        if (peek() == '}') {
            ++pos_;
            return;
        }
        for (;;) {
            std::string word = read_word();
            if (word == "abstract") {
                node.abstract = true;
            } else if (word == "repeatable") {
                skip_space();
                node.repeat_depth = 1;
                if (peek() == '[') {
                    ++pos_;
                    node.repeat_depth = static_cast<size_t>(std::stoul(read_word()));
                    skip_space();
                    expect(']');
                }
            } else if (word == "map") {
                node.is_map = true;
            } else if (word == "unknown") {
                node.unknown = true;
            } else if (word == "deprecated") {
                node.deprecated = true;
            } else if (word == "key") {
                node.key = read_quoted();
                has_key = true;
            } else if (word == "branch") {
                node.branch_type = read_quoted();
            } else if (word == "alias") {
                node.alias_of = read_quoted();
            } else if (word == "cycle") {
                node.cycle_of = read_quoted();
            } else if (word == "default") {
                node.default_value = read_quoted();
            } else if (word == "enum") {
                skip_space();
                expect('[');
                skip_space();
                while (peek() != ']') {
                    node.enum_values.push_back(read_quoted());
                    skip_space();
                    if (peek() == ',') ++pos_;
                    skip_space();
                }
                ++pos_;
            } else {
                throw std::runtime_error("unknown attribute '" + word + "'");
            }
            skip_space();
            if (peek() == ',') {
                ++pos_;
                skip_space();
                continue;
            }
            expect('}');
            break;
        }
        skip_space();
        if (pos_ != text_.size()) {
            throw std::runtime_error("trailing text after attributes");
        }
    }

private:
    const std::string& text_;
    size_t pos_ = 0;

    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    void expect(char c) {
        if (peek() != c) {
            throw std::runtime_error(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    std::string read_word() {
        skip_space();
        size_t start = pos_;
        while (pos_ < text_.size() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
            ++pos_;
        }
        if (start == pos_) throw std::runtime_error("expected attribute name");
        return text_.substr(start, pos_ - start);
    }

    std::string read_quoted() {
        skip_space();
        expect('\'');
        std::string out;
        while (pos_ < text_.size() && text_[pos_] != '\'') {
            if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) ++pos_;
            out += text_[pos_++];
        }
        expect('\'');
        return out;
    }
};

class ModelReader {
public:
    explicit ModelReader(std::vector<Line> lines) : lines_(std::move(lines)) {}

    FeatureNode read_root() {
        if (lines_.empty()) throw std::runtime_error("features block is empty");
        if (lines_[0].indent != 1) fail(lines_[0], "root feature must be indented once");
        FeatureNode root = read_feature(lines_[0].indent, "", true);
        if (pos_ != lines_.size()) fail(lines_[pos_], "unexpected line after root feature");
        return root;
    }

private:
    std::vector<Line> lines_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const Line& line, const std::string& message) {
        throw std::runtime_error("line " + std::to_string(line.number) + ": " + message);
    }

    FeatureNode read_feature(size_t indent, const std::string& parent_id, bool is_root) {
        const Line& line = lines_[pos_++];
        if (line.indent != indent) fail(line, "unexpected indentation");

        FeatureNode node;
        std::string text = line.text;
        auto brace = text.find('{');
        std::string head = brace == std::string::npos ? text : text.substr(0, brace);
        while (!head.empty() && std::isspace(static_cast<unsigned char>(head.back()))) head.pop_back();

        auto space = head.find(' ');
        if (space != std::string::npos) {
            auto type = parse_attribute_type(head.substr(0, space));
            if (!type) fail(line, "unknown type '" + head.substr(0, space) + "'");
            node.type = *type;
            node.name = head.substr(space + 1);
        } else {
            node.name = head;
        }
        if (node.name.empty()) fail(line, "missing feature name");
        for (char c : node.name) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
                fail(line, "invalid feature name '" + node.name + "'");
            }
        }

        bool has_key = false;
        if (brace != std::string::npos) {
            try {
                std::string attrs = text.substr(brace);
                AttributeReader(attrs).read(node, has_key);
            } catch (const std::exception& e) {
                fail(line, e.what());
            }
        }
        if (!has_key) {
            node.key = default_key(node, is_root);
        }

        node.id = parent_id.empty() ? node.name : parent_id + "." + node.name;
        // Kinds hang directly off the root
        std::string child_parent = is_root ? "" : node.id;

        bool seen_group = false;
        while (pos_ < lines_.size() && lines_[pos_].indent == indent + 1) {
            const Line& group_line = lines_[pos_++];
            const std::string& keyword = group_line.text;

            GroupType group;
            Cardinality cardinality = Cardinality::Optional;
            if (keyword == "mandatory") {
                group = GroupType::And;
                cardinality = Cardinality::Mandatory;
            } else if (keyword == "optional") {
                group = GroupType::And;
            } else if (keyword == "or") {
                group = GroupType::Or;
            } else if (keyword == "alternative") {
                group = GroupType::Alternative;
            } else {
                fail(group_line, "expected group keyword, got '" + keyword + "'");
            }

            if (seen_group && (group != GroupType::And || node.group != GroupType::And)) {
                fail(group_line, "mixed group types under " + node.id);
            }
            seen_group = true;
            node.group = group;

            while (pos_ < lines_.size() && lines_[pos_].indent == indent + 2) {
                FeatureNode child = read_feature(indent + 2, child_parent, false);
                child.cardinality = is_root ? Cardinality::Mandatory : cardinality;
                node.children.push_back(std::move(child));
            }
            if (pos_ < lines_.size() && lines_[pos_].indent > indent + 2) {
                fail(lines_[pos_], "unexpected indentation");
            }
        }
        if (is_root) {
            node.cardinality = Cardinality::Mandatory;
        }
        return node;
    }
};

} // namespace

std::string serialize_model(const FeatureModel& model) {
    std::ostringstream out;
    out << "namespace " << model.namespace_name << "\n\n";
    out << "features\n";
    write_feature(out, model.root, 1, true);

    if (!model.constraints.empty()) {
        out << "\nconstraints\n";
        for (const auto& c : model.constraints) {
            out << "\t" << c.text() << "\n";
        }
    }
    return out.str();
}

ModelParseResult parse_model(const std::string& text) {
    ModelParseResult result;

    enum class Section { Header, Features, Constraints };
    Section section = Section::Header;
    std::vector<Line> feature_lines;

    std::istringstream in(text);
    std::string raw;
    size_t number = 0;

    try {
        while (std::getline(in, raw)) {
            ++number;
            if (!raw.empty() && raw.back() == '\r') raw.pop_back();

            size_t indent = 0;
            while (indent < raw.size() && raw[indent] == '\t') ++indent;
            std::string content = raw.substr(indent);
            while (!content.empty() && std::isspace(static_cast<unsigned char>(content.back()))) content.pop_back();
            if (content.empty() || content.rfind("//", 0) == 0) continue;

            if (indent == 0) {
                if (content.rfind("namespace ", 0) == 0) {
                    result.model.namespace_name = content.substr(10);
                } else if (content == "features") {
                    section = Section::Features;
                } else if (content == "constraints") {
                    section = Section::Constraints;
                } else {
                    result.error = "line " + std::to_string(number) + ": unexpected '" + content + "'";
                    return result;
                }
                continue;
            }

            if (section == Section::Features) {
                feature_lines.push_back({number, indent, content});
            } else if (section == Section::Constraints) {
                auto parsed = parse_expression(content);
                if (!parsed.ok) {
                    result.error = "line " + std::to_string(number) + ": " + parsed.error;
                    return result;
                }
                result.model.constraints.push_back(make_expression_constraint(parsed.expr, "", ""));
            } else {
                result.error = "line " + std::to_string(number) + ": content before features block";
                return result;
            }
        }

        ModelReader reader(std::move(feature_lines));
        result.model.root = reader.read_root();
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }

    if (result.model.namespace_name.empty()) {
        result.model.namespace_name = result.model.root.name;
    }
    result.model.reindex();
    result.ok = true;
    return result;
}

std::string serialize_metadata(const FeatureModel& model) {
    nlohmann::json j;
    j["namespace"] = model.namespace_name;
    j["descriptions"] = nlohmann::json::object();
    for (const auto& [id, text] : model.descriptions) {
        j["descriptions"][id] = text;
    }
    j["aliases"] = nlohmann::json::object();
    for (const auto& [path, id] : model.aliases) {
        j["aliases"][path] = id;
    }
    j["constraints"] = nlohmann::json::array();
    for (const auto& c : model.constraints) {
        j["constraints"].push_back({{"text", c.text()}, {"rule", c.rule}, {"trace", c.trace}});
    }
    return j.dump(2) + "\n";
}

Result<void> apply_metadata(FeatureModel& model, const std::string& json_text) {
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return Result<void>::err(Error(ErrorCode::MODEL_PARSE_ERROR, "metadata must be an object"));
        }
        if (j.contains("descriptions") && j["descriptions"].is_object()) {
            for (auto& [id, text] : j["descriptions"].items()) {
                if (text.is_string()) model.descriptions[id] = text.get<std::string>();
            }
        }
        if (j.contains("aliases") && j["aliases"].is_object()) {
            for (auto& [path, id] : j["aliases"].items()) {
                if (id.is_string()) model.aliases[path] = id.get<std::string>();
            }
        }
        if (j.contains("constraints") && j["constraints"].is_array()) {
            std::unordered_map<std::string, std::pair<std::string, std::string>> traces;
            for (const auto& entry : j["constraints"]) {
                if (!entry.is_object() || !entry.contains("text") || !entry["text"].is_string()) continue;
                traces[entry["text"].get<std::string>()] = {entry.value("rule", ""), entry.value("trace", "")};
            }
            for (auto& c : model.constraints) {
                auto it = traces.find(c.text());
                if (it != traces.end()) {
                    c.rule = it->second.first;
                    c.trace = it->second.second;
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::err(Error(ErrorCode::MODEL_PARSE_ERROR, std::string("metadata: ") + e.what()));
    }
    return Result<void>::ok();
}

std::string metadata_path_for(const std::string& model_path) {
    return replace_extension(model_path, ".meta.json");
}

Result<void> save_model(const FeatureModel& model, const std::string& path) {
    auto written = atomic_write_file(path, serialize_model(model));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error).withContext(path));
    }
    std::string meta_path = metadata_path_for(path);
    auto meta = atomic_write_file(meta_path, serialize_metadata(model));
    if (!meta.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, meta.error).withContext(meta_path));
    }
    spdlog::info("wrote model {} ({} features)", path, model.feature_count());
    return Result<void>::ok();
}

Result<FeatureModel> load_model(const std::string& path) {
    auto file = read_file(path);
    if (!file.ok) {
        return Result<FeatureModel>::err(Error(ErrorCode::FILE_NOT_FOUND, file.error));
    }

    auto parsed = parse_model(file.content);
    if (!parsed.ok) {
        return Result<FeatureModel>::err(Error(ErrorCode::MODEL_PARSE_ERROR, parsed.error).withContext(path));
    }

    std::string meta_path = metadata_path_for(path);
    if (is_regular_file(meta_path)) {
        auto meta = read_file(meta_path);
        if (!meta.ok) {
            return Result<FeatureModel>::err(Error(ErrorCode::IO_ERROR, meta.error));
        }
        auto applied = apply_metadata(parsed.model, meta.content);
        if (applied.isErr()) {
            return Result<FeatureModel>::err(applied.error().withContext(meta_path));
        }
    }

    return Result<FeatureModel>::ok(std::move(parsed.model));
}

} // namespace schemafm
