#include "schemafm/validator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <set>

namespace schemafm {

namespace {

bool ends_with(const std::string& s, const char* suffix) {
    std::string suf(suffix);
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

bool is_marker(const std::string& id) {
    return ends_with(id, kIsNullSuffix) || ends_with(id, kIsEmptySuffix);
}

bool value_matches(const nlohmann::ordered_json& value, const std::string& literal) {
    if (value.is_string()) return value.get<std::string>() == literal;
    if (value.is_array()) {
        return std::any_of(value.begin(), value.end(),
                           [&literal](const nlohmann::ordered_json& v) { return value_matches(v, literal); });
    }
    if (value.is_null()) return false;
    return value.dump() == literal;
}

// Numbers captured for a feature; a single non-numeric value yields none
bool numeric_values(const nlohmann::ordered_json& value, std::vector<double>& out) {
    if (value.is_array()) {
        for (const auto& v : value) {
            if (!numeric_values(v, out)) return false;
        }
        return true;
    }
    if (value.is_number()) {
        out.push_back(value.get<double>());
        return true;
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        char* end = nullptr;
        double number = std::strtod(text.c_str(), &end);
        if (!text.empty() && end == text.c_str() + text.size()) {
            out.push_back(number);
            return true;
        }
    }
    return false;
}

bool satisfies(double value, ExprOp op, double bound) {
    switch (op) {
        case ExprOp::Less: return value < bound;
        case ExprOp::LessEqual: return value <= bound;
        case ExprOp::Greater: return value > bound;
        case ExprOp::GreaterEqual: return value >= bound;
        default: return false;
    }
}

bool value_in_enum(const nlohmann::ordered_json& value, const std::vector<std::string>& allowed) {
    if (value.is_array()) {
        return std::all_of(value.begin(), value.end(),
                           [&allowed](const nlohmann::ordered_json& v) { return value_in_enum(v, allowed); });
    }
    std::string text = value.is_string() ? value.get<std::string>() : value.dump();
    return std::find(allowed.begin(), allowed.end(), text) != allowed.end();
}

class ValidationRun {
public:
    ValidationRun(const FeatureModel& model, const Selection& selection)
        : model_(model), selection_(selection) {
        features_.insert(model_.root.id);
        for (const auto& id : selection_.selected) {
            if (!is_marker(id)) features_.insert(id);
        }
    }

    std::vector<std::string> run() {
        check_unknown();
        check_parents();
        check_mandatory();
        check_groups(GroupType::Or);
        check_groups(GroupType::Alternative);
        check_enums();
        check_constraints();
        return std::move(violations_);
    }

private:
    const FeatureModel& model_;
    const Selection& selection_;
    std::set<std::string> features_;  // selected ids plus the root, markers excluded
    std::vector<std::string> violations_;

    void add(const std::string& violation) {
        if (std::find(violations_.begin(), violations_.end(), violation) == violations_.end()) {
            violations_.push_back(violation);
        }
    }

    bool selected(const std::string& id) const { return features_.count(id) > 0; }

    // Node carrying the feature's own attributes; alias nodes keep theirs
    const FeatureNode* own_node(const std::string& id) const {
        if (const FeatureNode* exact = model_.find(id)) return exact;
        return model_.resolve(id);
    }

    std::string child_id(const std::string& parent, const FeatureNode& child) const {
        return parent == model_.root.id ? child.name : parent + "." + child.name;
    }

    // Children of null values and of empty arrays are not checked
    bool children_checked(const std::string& id) const {
        if (selection_.is_selected(id + kIsNullSuffix)) return false;
        if (selection_.is_selected(id + kIsEmptySuffix)) {
            const FeatureNode* node = own_node(id);
            if (node && node->is_repeatable()) return false;
        }
        return true;
    }

    void check_unknown() {
        for (const auto& id : features_) {
            if (id != model_.root.id && !model_.contains(id)) {
                add("unknown:" + id);
            }
        }
    }

    void check_parents() {
        for (const auto& id : features_) {
            if (id == model_.root.id || !model_.contains(id)) continue;
            std::string parent = model_.parent_id(id);
            if (!selected(parent)) {
                add("parent:" + id);
            }
        }
    }

    void check_mandatory() {
        for (const auto& id : features_) {
            const FeatureNode* node = model_.resolve(id);
            if (!node || node->group != GroupType::And || !children_checked(id)) continue;
            for (const auto& child : node->children) {
                if (!child.is_mandatory()) continue;
                std::string cid = child_id(id, child);
                if (!selected(cid)) {
                    add("mandatory:" + cid);
                }
            }
        }
    }

    void check_groups(GroupType group) {
        for (const auto& id : features_) {
            const FeatureNode* node = model_.resolve(id);
            if (!node || node->group != group || node->children.empty() || !children_checked(id)) continue;

            std::size_t count = 0;
            for (const auto& child : node->children) {
                if (selected(child_id(id, child))) ++count;
            }

            if (group == GroupType::Or) {
                if (count == 0) add("group-or:" + id);
            } else {
                // Each element of a repeatable feature may pick its own branch
                bool ok = model_.inside_repeatable(id) ? count >= 1 : count == 1;
                if (!ok) add("group-alternative:" + id);
            }
        }
    }

    void check_enums() {
        for (const auto& [id, value] : selection_.values) {
            const FeatureNode* node = own_node(id);
            if (!node || node->enum_values.empty() || value.is_null()) continue;
            if (!value_in_enum(value, node->enum_values)) {
                add("enum:" + id);
            }
        }
    }

    void check_constraints() {
        Assignment assignment;
        assignment.is_selected = [this](const std::string& id) { return selected(id); };
        assignment.has_value = [this](const std::string& id, const std::string& literal) {
            auto it = selection_.values.find(id);
            return it != selection_.values.end() && value_matches(it->second, literal);
        };
        // Every value of a repeated feature must respect the bound
        assignment.compares = [this](const std::string& id, ExprOp op, double bound) {
            auto it = selection_.values.find(id);
            if (it == selection_.values.end()) return false;
            std::vector<double> numbers;
            if (!numeric_values(it->second, numbers) || numbers.empty()) return false;
            return std::all_of(numbers.begin(), numbers.end(),
                               [op, bound](double v) { return satisfies(v, op, bound); });
        };
        for (const auto& c : model_.constraints) {
            if (c.expr && !evaluate(*c.expr, assignment)) {
                add("constraint:" + c.text());
            }
        }
    }
};

} // namespace

nlohmann::ordered_json report_to_json(const ValidationReport& report) {
    nlohmann::ordered_json j;
    j["document_id"] = report.document_id;
    j["valid"] = report.valid;
    j["violations"] = report.violations;
    j["elapsed_ms"] = report.elapsed_ms;
    return j;
}

ValidationReport ModelValidator::validate(const Selection& selection) const {
    auto start = std::chrono::steady_clock::now();

    ValidationReport report;
    report.document_id = selection.document_id;
    report.violations = ValidationRun(model_, selection).run();
    report.valid = report.violations.empty();

    auto elapsed = std::chrono::steady_clock::now() - start;
    report.elapsed_ms = std::chrono::duration<double, std::milli>(elapsed).count();

    spdlog::debug("{}: {} ({} violations)", selection.document_id,
                  report.valid ? "valid" : "invalid", report.violations.size());
    return report;
}

} // namespace schemafm
