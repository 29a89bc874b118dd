#include <doctest/doctest.h>
#include <schemafm/expression.hpp>

#include <set>
#include <stdexcept>

using namespace schemafm;

namespace {

std::string roundtrip(const std::string& text) {
    auto parsed = parse_expression(text);
    REQUIRE_MESSAGE(parsed.ok, parsed.error);
    return render_expression(*parsed.expr);
}

Assignment assignment_of(const std::set<std::string>& selected,
                         const std::set<std::pair<std::string, std::string>>& values = {}) {
    Assignment a;
    a.is_selected = [selected](const std::string& id) { return selected.count(id) > 0; };
    a.has_value = [values](const std::string& id, const std::string& literal) {
        return values.count({id, literal}) > 0;
    };
    return a;
}

} // namespace

TEST_CASE("render uses minimal parentheses") {
    auto e = make_implies(make_and({make_feature("A.x"), make_feature("A.y")}),
                          make_or({make_feature("A.z"), make_not(make_feature("A.w"))}));
    CHECK(render_expression(*e) == "A.x & A.y => A.z | !A.w");

    auto nested = make_and({make_or({make_feature("a"), make_feature("b")}), make_feature("c")});
    CHECK(render_expression(*nested) == "(a | b) & c");

    auto negated = make_not(make_and({make_feature("a"), make_feature("b")}));
    CHECK(render_expression(*negated) == "!(a & b)");
}

TEST_CASE("implication is right-associative") {
    CHECK(roundtrip("a => b => c") == "a => b => c");
    CHECK(roundtrip("(a => b) => c") == "(a => b) => c");

    auto parsed = parse_expression("a => b => c");
    REQUIRE(parsed.ok);
    CHECK(parsed.expr->op == ExprOp::Implies);
    CHECK(parsed.expr->operands[0]->feature == "a");
    CHECK(parsed.expr->operands[1]->op == ExprOp::Implies);
}

TEST_CASE("same-operator chains are flattened") {
    auto e = make_and({make_and({make_feature("a"), make_feature("b")}), make_feature("c")});
    CHECK(e->operands.size() == 3);
    CHECK(render_expression(*e) == "a & b & c");

    auto single = make_or({make_feature("only")});
    CHECK(single->op == ExprOp::Feature);
}

TEST_CASE("comparisons quote and escape literals") {
    auto e = make_equals("Pod.spec.restartPolicy", "Never");
    CHECK(render_expression(*e) == "Pod.spec.restartPolicy == 'Never'");
    CHECK(quote_literal("it's") == "'it\\'s'");

    auto parsed = parse_expression("X.y != 'a\\'b'");
    REQUIRE(parsed.ok);
    CHECK(parsed.expr->op == ExprOp::NotEquals);
    CHECK(parsed.expr->literal == "a'b");
    CHECK(render_expression(*parsed.expr) == "X.y != 'a\\'b'");
}

TEST_CASE("parse round-trips rendered text") {
    for (const char* text : {
             "Pod.spec.a => Pod.spec.b",
             "Pod.spec.a => !Pod.spec.b",
             "Pod.spec => Pod.spec.a | Pod.spec.b",
             "Svc.type == 'NodePort' => Svc.ports",
             "(a <=> b) <=> c",
             "!(a | b) & true",
         }) {
        CHECK(roundtrip(text) == text);
    }
}

TEST_CASE("parse errors report the offset") {
    auto unbalanced = parse_expression("(a & b");
    CHECK_FALSE(unbalanced.ok);
    CHECK(unbalanced.error.find("expected ')'") != std::string::npos);

    auto trailing = parse_expression("a b");
    CHECK_FALSE(trailing.ok);
    CHECK(trailing.error.find("offset") != std::string::npos);

    CHECK_FALSE(parse_expression("a == b").ok);
    CHECK_FALSE(parse_expression("a == 'open").ok);
    CHECK_FALSE(parse_expression("").ok);
}

TEST_CASE("normalize sorts commutative operands") {
    auto a = parse_expression("Pod => Pod.b | Pod.a");
    auto b = parse_expression("Pod => Pod.a | Pod.b");
    REQUIRE(a.ok);
    REQUIRE(b.ok);
    CHECK(render_expression(*a.expr) != render_expression(*b.expr));
    CHECK(normalize_expression(*a.expr) == normalize_expression(*b.expr));
}

TEST_CASE("collect_features lists every mentioned id") {
    auto parsed = parse_expression("A.x == 'v' & !A.y => A.z | true");
    REQUIRE(parsed.ok);
    std::set<std::string> ids;
    collect_features(*parsed.expr, ids);
    CHECK(ids == std::set<std::string>{"A.x", "A.y", "A.z"});
}

TEST_CASE("evaluate follows selection and values") {
    auto requires_expr = parse_expression("a => b").expr;
    CHECK(evaluate(*requires_expr, assignment_of({})));
    CHECK_FALSE(evaluate(*requires_expr, assignment_of({"a"})));
    CHECK(evaluate(*requires_expr, assignment_of({"a", "b"})));

    auto excludes_expr = parse_expression("a => !b").expr;
    CHECK_FALSE(evaluate(*excludes_expr, assignment_of({"a", "b"})));

    auto eq = parse_expression("t == 'nfs' => s").expr;
    CHECK(evaluate(*eq, assignment_of({"t"}, {{"t", "local"}})));
    CHECK_FALSE(evaluate(*eq, assignment_of({"t"}, {{"t", "nfs"}})));

    // A comparison against an unselected feature is false either way
    auto ne = parse_expression("t != 'nfs'").expr;
    CHECK_FALSE(evaluate(*ne, assignment_of({})));
    CHECK(evaluate(*ne, assignment_of({"t"}, {{"t", "local"}})));

    auto iff = parse_expression("a <=> b").expr;
    CHECK(evaluate(*iff, assignment_of({})));
    CHECK_FALSE(evaluate(*iff, assignment_of({"b"})));
}

TEST_CASE("ordering comparisons take unquoted numbers") {
    for (const char* text : {
             "Pod.port >= 1 & Pod.port <= 65535",
             "Pod.port => Pod.port > 0 & Pod.port < 65536",
             "Pod.ratio >= -0.5",
         }) {
        CHECK(roundtrip(text) == text);
    }

    auto parsed = parse_expression("a<=10");
    REQUIRE(parsed.ok);
    CHECK(parsed.expr->op == ExprOp::LessEqual);
    CHECK(parsed.expr->feature == "a");
    CHECK(parsed.expr->literal == "10");

    // Equivalence is not read as a bound
    auto iff = parse_expression("a <=> b");
    REQUIRE(iff.ok);
    CHECK(iff.expr->op == ExprOp::Iff);

    CHECK_FALSE(parse_expression("a >= 'x'").ok);
    CHECK_FALSE(parse_expression("a < b").ok);
    CHECK_THROWS_AS(make_comparison(ExprOp::Equals, "a", "1"), std::invalid_argument);
}

TEST_CASE("ordering comparisons evaluate against numeric values") {
    auto bound = parse_expression("p => p >= 1 & p <= 65535").expr;

    Assignment a = assignment_of({"p"});
    double port = 80;
    a.compares = [&port](const std::string& id, ExprOp op, double limit) {
        if (id != "p") return false;
        switch (op) {
            case ExprOp::GreaterEqual: return port >= limit;
            case ExprOp::LessEqual: return port <= limit;
            default: return false;
        }
    };
    CHECK(evaluate(*bound, a));
    port = 0;
    CHECK_FALSE(evaluate(*bound, a));
    port = 70000;
    CHECK_FALSE(evaluate(*bound, a));

    // Without numeric values a bound never holds, unless its feature is absent
    CHECK_FALSE(evaluate(*bound, assignment_of({"p"})));
    CHECK(evaluate(*bound, assignment_of({})));
}
