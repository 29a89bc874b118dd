#include "schemafm/expression.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace schemafm {

namespace {

int precedence(ExprOp op) {
    switch (op) {
        case ExprOp::Iff: return 1;
        case ExprOp::Implies: return 2;
        case ExprOp::Or: return 3;
        case ExprOp::And: return 4;
        case ExprOp::Not: return 5;
        default: return 6;
    }
}

ExprPtr make_nary(ExprOp op, std::vector<ExprPtr> operands) {
    if (operands.size() == 1) return operands.front();
    auto e = std::make_shared<Expr>();
    e->op = op;
    // Flatten nested operators of the same kind
    for (auto& operand : operands) {
        if (operand->op == op) {
            e->operands.insert(e->operands.end(), operand->operands.begin(), operand->operands.end());
        } else {
            e->operands.push_back(std::move(operand));
        }
    }
    return e;
}

std::string render(const Expr& expr, bool sorted);

std::string render_operand(const Expr& parent, const Expr& child, bool sorted, bool right_side) {
    std::string text = render(child, sorted);
    int pp = precedence(parent.op);
    int cp = precedence(child.op);
    bool wrap = cp < pp;
    // Implication is right-associative; iff chains are kept explicit
    if (cp == pp && (parent.op == ExprOp::Implies || parent.op == ExprOp::Iff)) {
        wrap = !right_side || parent.op == ExprOp::Iff;
    }
    return wrap ? "(" + text + ")" : text;
}

std::string render(const Expr& expr, bool sorted) {
    switch (expr.op) {
        case ExprOp::Constant:
            return expr.value ? "true" : "false";
        case ExprOp::Feature:
            return expr.feature;
        case ExprOp::Equals:
            return expr.feature + " == " + quote_literal(expr.literal);
        case ExprOp::NotEquals:
            return expr.feature + " != " + quote_literal(expr.literal);
        case ExprOp::Less:
            return expr.feature + " < " + expr.literal;
        case ExprOp::LessEqual:
            return expr.feature + " <= " + expr.literal;
        case ExprOp::Greater:
            return expr.feature + " > " + expr.literal;
        case ExprOp::GreaterEqual:
            return expr.feature + " >= " + expr.literal;
        case ExprOp::Not:
            return "!" + render_operand(expr, *expr.operands[0], sorted, true);
        case ExprOp::And:
        case ExprOp::Or:
        case ExprOp::Iff: {
            std::vector<std::string> parts;
            for (const auto& operand : expr.operands) {
                parts.push_back(render_operand(expr, *operand, sorted, false));
            }
            if (sorted) std::sort(parts.begin(), parts.end());
            const char* sep = expr.op == ExprOp::And ? " & " : expr.op == ExprOp::Or ? " | " : " <=> ";
            std::string out;
            for (size_t i = 0; i < parts.size(); ++i) {
                if (i > 0) out += sep;
                out += parts[i];
            }
            return out;
        }
        case ExprOp::Implies:
            return render_operand(expr, *expr.operands[0], sorted, false) + " => "
                 + render_operand(expr, *expr.operands[1], sorted, true);
    }
    return "";
}

// ============================================================================
// Parser
// ============================================================================

class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& text) : text_(text) {}

    ExprPtr parse() {
        ExprPtr e = parse_iff();
        skip_space();
        if (pos_ < text_.size()) {
            fail("unexpected '" + text_.substr(pos_, 1) + "'");
        }
        return e;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& message) {
        throw std::runtime_error(message + " at offset " + std::to_string(pos_));
    }

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    bool peek(const std::string& token) {
        skip_space();
        return text_.compare(pos_, token.size(), token) == 0;
    }

    bool accept(const std::string& token) {
        if (peek(token)) {
            pos_ += token.size();
            return true;
        }
        return false;
    }

    ExprPtr parse_iff() {
        ExprPtr lhs = parse_implies();
        while (accept("<=>")) {
            lhs = make_iff(lhs, parse_implies());
        }
        return lhs;
    }

    ExprPtr parse_implies() {
        ExprPtr lhs = parse_or();
        if (accept("=>")) {
            return make_implies(lhs, parse_implies());
        }
        return lhs;
    }

    ExprPtr parse_or() {
        std::vector<ExprPtr> operands{parse_and()};
        while (accept("|")) {
            operands.push_back(parse_and());
        }
        return make_or(std::move(operands));
    }

    ExprPtr parse_and() {
        std::vector<ExprPtr> operands{parse_unary()};
        while (accept("&")) {
            operands.push_back(parse_unary());
        }
        return make_and(std::move(operands));
    }

    ExprPtr parse_unary() {
        skip_space();
        // "!=" only follows an identifier, so a leading '!' is negation
        if (accept("!")) {
            return make_not(parse_unary());
        }
        return parse_atom();
    }

    ExprPtr parse_atom() {
        skip_space();
        if (accept("(")) {
            ExprPtr inner = parse_iff();
            if (!accept(")")) fail("expected ')'");
            return inner;
        }

        std::string id = parse_identifier();
        if (id == "true") return make_constant(true);
        if (id == "false") return make_constant(false);

        if (accept("==")) return make_equals(id, parse_literal());
        if (accept("!=")) return make_not_equals(id, parse_literal());
        if (accept(">=")) return make_comparison(ExprOp::GreaterEqual, id, parse_number());
        if (accept(">")) return make_comparison(ExprOp::Greater, id, parse_number());
        // "<=>" after a feature is equivalence, not a bound
        if (!peek("<=>")) {
            if (accept("<=")) return make_comparison(ExprOp::LessEqual, id, parse_number());
            if (accept("<")) return make_comparison(ExprOp::Less, id, parse_number());
        }
        return make_feature(id);
    }

    std::string parse_identifier() {
        skip_space();
        size_t start = pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
                ++pos_;
            } else {
                break;
            }
        }
        if (start == pos_) fail("expected feature id");
        return text_.substr(start, pos_ - start);
    }

    std::string parse_number() {
        skip_space();
        size_t start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '-') ++pos_;
        size_t digits = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        if (digits == pos_) fail("expected number");
        if (pos_ + 1 < text_.size() && text_[pos_] == '.'
            && std::isdigit(static_cast<unsigned char>(text_[pos_ + 1]))) {
            ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    std::string parse_literal() {
        skip_space();
        if (pos_ >= text_.size() || text_[pos_] != '\'') fail("expected quoted literal");
        ++pos_;
        std::string out;
        while (pos_ < text_.size() && text_[pos_] != '\'') {
            if (text_[pos_] == '\\' && pos_ + 1 < text_.size()) {
                ++pos_;
            }
            out += text_[pos_++];
        }
        if (pos_ >= text_.size()) fail("unterminated literal");
        ++pos_;
        return out;
    }
};

} // namespace

ExprPtr make_constant(bool value) {
    auto e = std::make_shared<Expr>();
    e->op = ExprOp::Constant;
    e->value = value;
    return e;
}

ExprPtr make_feature(const std::string& id) {
    auto e = std::make_shared<Expr>();
    e->op = ExprOp::Feature;
    e->feature = id;
    return e;
}

ExprPtr make_equals(const std::string& id, const std::string& literal) {
    auto e = std::make_shared<Expr>();
    e->op = ExprOp::Equals;
    e->feature = id;
    e->literal = literal;
    return e;
}

ExprPtr make_not_equals(const std::string& id, const std::string& literal) {
    auto e = std::make_shared<Expr>();
    e->op = ExprOp::NotEquals;
    e->feature = id;
    e->literal = literal;
    return e;
}

ExprPtr make_comparison(ExprOp op, const std::string& id, const std::string& number) {
    if (!is_ordering(op)) {
        throw std::invalid_argument("make_comparison: not an ordering operator");
    }
    auto e = std::make_shared<Expr>();
    e->op = op;
    e->feature = id;
    e->literal = number;
    return e;
}

ExprPtr make_not(ExprPtr operand) {
    auto e = std::make_shared<Expr>();
    e->op = ExprOp::Not;
    e->operands.push_back(std::move(operand));
    return e;
}

ExprPtr make_and(std::vector<ExprPtr> operands) {
    return make_nary(ExprOp::And, std::move(operands));
}

ExprPtr make_or(std::vector<ExprPtr> operands) {
    return make_nary(ExprOp::Or, std::move(operands));
}

ExprPtr make_implies(ExprPtr lhs, ExprPtr rhs) {
    auto e = std::make_shared<Expr>();
    e->op = ExprOp::Implies;
    e->operands.push_back(std::move(lhs));
    e->operands.push_back(std::move(rhs));
    return e;
}

ExprPtr make_iff(ExprPtr lhs, ExprPtr rhs) {
    auto e = std::make_shared<Expr>();
    e->op = ExprOp::Iff;
    e->operands.push_back(std::move(lhs));
    e->operands.push_back(std::move(rhs));
    return e;
}

std::string render_expression(const Expr& expr) {
    return render(expr, false);
}

std::string normalize_expression(const Expr& expr) {
    return render(expr, true);
}

ExpressionParseResult parse_expression(const std::string& text) {
    ExpressionParseResult result;
    try {
        ExpressionParser parser(text);
        result.expr = parser.parse();
        result.ok = true;
    } catch (const std::runtime_error& e) {
        result.error = e.what();
    }
    return result;
}

void collect_features(const Expr& expr, std::set<std::string>& out) {
    if (!expr.feature.empty()) {
        out.insert(expr.feature);
    }
    for (const auto& operand : expr.operands) {
        collect_features(*operand, out);
    }
}

bool evaluate(const Expr& expr, const Assignment& assignment) {
    switch (expr.op) {
        case ExprOp::Constant:
            return expr.value;
        case ExprOp::Feature:
            return assignment.is_selected(expr.feature);
        case ExprOp::Equals:
            return assignment.is_selected(expr.feature)
                && assignment.has_value(expr.feature, expr.literal);
        case ExprOp::NotEquals:
            return assignment.is_selected(expr.feature)
                && !assignment.has_value(expr.feature, expr.literal);
        case ExprOp::Less:
        case ExprOp::LessEqual:
        case ExprOp::Greater:
        case ExprOp::GreaterEqual:
            return assignment.is_selected(expr.feature) && assignment.compares
                && assignment.compares(expr.feature, expr.op, std::strtod(expr.literal.c_str(), nullptr));
        case ExprOp::Not:
            return !evaluate(*expr.operands[0], assignment);
        case ExprOp::And:
            for (const auto& operand : expr.operands) {
                if (!evaluate(*operand, assignment)) return false;
            }
            return true;
        case ExprOp::Or:
            for (const auto& operand : expr.operands) {
                if (evaluate(*operand, assignment)) return true;
            }
            return false;
        case ExprOp::Implies:
            return !evaluate(*expr.operands[0], assignment) || evaluate(*expr.operands[1], assignment);
        case ExprOp::Iff:
            return evaluate(*expr.operands[0], assignment) == evaluate(*expr.operands[1], assignment);
    }
    return false;
}

bool is_ordering(ExprOp op) {
    return op == ExprOp::Less || op == ExprOp::LessEqual
        || op == ExprOp::Greater || op == ExprOp::GreaterEqual;
}

std::string quote_literal(const std::string& literal) {
    std::string out = "'";
    for (char c : literal) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += "'";
    return out;
}

} // namespace schemafm
