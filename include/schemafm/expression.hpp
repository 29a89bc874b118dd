#pragma once

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// Propositional Expressions
// ============================================================================
//
// Grammar (lowest to highest precedence):
//   expr    := implies ('<=>' implies)*
//   implies := or ('=>' implies)?
//   or      := and ('|' and)*
//   and     := unary ('&' unary)*
//   unary   := '!' unary | atom
//   atom    := '(' expr ')' | 'true' | 'false'
//            | feature-id (('==' | '!=') literal)?
//            | feature-id ('<' | '<=' | '>' | '>=') number
// Feature ids are dotted names; literals are single-quoted with \' escapes.
// Numbers are decimal, optionally signed.

enum class ExprOp {
    Constant,
    Feature,
    Equals,
    NotEquals,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Not,
    And,
    Or,
    Implies,
    Iff
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct Expr {
    ExprOp op = ExprOp::Constant;
    bool value = false;         // Constant
    std::string feature;        // Feature and the comparisons
    std::string literal;        // Equals, NotEquals; number text for the ordering ops
    std::vector<ExprPtr> operands;
};

ExprPtr make_constant(bool value);
ExprPtr make_feature(const std::string& id);
ExprPtr make_equals(const std::string& id, const std::string& literal);
ExprPtr make_not_equals(const std::string& id, const std::string& literal);
// op is one of Less, LessEqual, Greater, GreaterEqual
ExprPtr make_comparison(ExprOp op, const std::string& id, const std::string& number);
ExprPtr make_not(ExprPtr operand);
ExprPtr make_and(std::vector<ExprPtr> operands);
ExprPtr make_or(std::vector<ExprPtr> operands);
ExprPtr make_implies(ExprPtr lhs, ExprPtr rhs);
ExprPtr make_iff(ExprPtr lhs, ExprPtr rhs);

// Canonical text with minimal parentheses
std::string render_expression(const Expr& expr);

// Render with and/or/iff operands sorted, for order-insensitive comparison
std::string normalize_expression(const Expr& expr);

struct ExpressionParseResult {
    bool ok = false;
    std::string error;
    ExprPtr expr;
};

ExpressionParseResult parse_expression(const std::string& text);

// Every feature id the expression mentions
void collect_features(const Expr& expr, std::set<std::string>& out);

// Truth assignment for evaluation. Unselected features are false and a
// comparison against an unselected feature is false.
struct Assignment {
    std::function<bool(const std::string&)> is_selected;
    std::function<bool(const std::string&, const std::string&)> has_value;
    // Ordering comparison of the feature's numeric values against a bound;
    // unset means every ordering comparison is false
    std::function<bool(const std::string&, ExprOp, double)> compares;
};

bool is_ordering(ExprOp op);

bool evaluate(const Expr& expr, const Assignment& assignment);

std::string quote_literal(const std::string& literal);

} // namespace schemafm
