// ============================================================================
// tests/test_clause.cpp — Clause algebra and Skolem allocator tests
// ============================================================================

#include "helpers.hpp"

#include "folcnf/clause.hpp"
#include "folcnf/skolem.hpp"

#include <stdexcept>

namespace folcnf {

static void test_render_connectives(TestContext& ctx) {
    ClauseFactory f;
    ClauseId p = f.make_predicate("P", std::vector<std::string>{"A"});
    ClauseId q = f.make_predicate("Q", std::vector<std::string>{"B"});

    ctx.check_eq(f.to_string(p), "P(A)", "predicate");
    ctx.check_eq(f.to_string(f.make_not(p)), "(not P(A))", "not");
    ctx.check_eq(f.to_string(f.make_and(p, q)), "(P(A) and Q(B))", "and");
    ctx.check_eq(f.to_string(f.make_or(p, q)), "(P(A) or Q(B))", "or");
    ctx.check_eq(f.to_string(f.make_implies(p, q)), "(P(A) -> Q(B))", "implies");
}

static void test_render_quantifiers_and_terms(TestContext& ctx) {
    ClauseFactory f;
    ClauseId pxy = f.make_predicate("P", std::vector<std::string>{"X", "Y"});
    ctx.check_eq(f.to_string(pxy), "P(X, Y)", "two arguments");
    ctx.check_eq(f.to_string(f.make_for_all({"X", "Y"}, pxy)),
                 "(for_all (X, Y) P(X, Y))", "for_all");
    ctx.check_eq(f.to_string(f.make_there_exists({"Y"}, pxy)),
                 "(there_exists (Y) P(X, Y))", "there_exists");
    ctx.check_eq(f.to_string(f.make_predicate("Rain", std::vector<TermId>{})),
                 "Rain()", "nullary predicate");

    TermId x = f.make_symbol("X");
    TermId y = f.make_symbol("Y");
    ctx.check_eq(f.term_to_string(f.make_skolem(3, {x, y})), "F_3(X, Y)", "skolem term");
    ctx.check_eq(f.term_to_string(f.make_skolem(0, {})), "F_0()", "skolem constant");
}

static void test_interning_is_structural(TestContext& ctx) {
    ClauseFactory f;
    ClauseId a = f.make_predicate("P", std::vector<std::string>{"X", "Y"});
    ClauseId b = f.make_predicate("P", std::vector<std::string>{"X", "Y"});
    ClauseId swapped = f.make_predicate("P", std::vector<std::string>{"Y", "X"});
    ClauseId renamed = f.make_predicate("Q", std::vector<std::string>{"X", "Y"});

    ctx.check(a == b, "equal predicates share an id");
    ctx.check(a != swapped, "argument order matters");
    ctx.check(a != renamed, "name matters");
    ctx.check(f.make_and(a, swapped) == f.make_and(b, swapped), "compound interning");
    ctx.check(f.make_and(a, swapped) != f.make_and(swapped, a), "operand order matters");
    ctx.check(f.make_for_all({"X"}, a) != f.make_there_exists({"X"}, a),
              "quantifier kind matters");
}

static void test_predicate_hash_covers_arguments(TestContext& ctx) {
    ClauseFactory f;
    ClauseId pa = f.make_predicate("P", std::vector<std::string>{"a"});
    ClauseId pb = f.make_predicate("P", std::vector<std::string>{"b"});
    const ClauseNode& na = f.node(pa);
    const ClauseNode& nb = f.node(pb);

    ctx.check(!(na == nb), "P(a) != P(b)");
    ctx.check(ClauseNodeHash{}(na) != ClauseNodeHash{}(nb), "P(a) and P(b) hash apart");

    ClauseNode copy = na;
    ctx.check(copy == na && ClauseNodeHash{}(copy) == ClauseNodeHash{}(na),
              "equal nodes hash equal");
}

static void test_is_variable(TestContext& ctx) {
    ClauseFactory f;
    ctx.check(f.is_variable(f.make_symbol("X")), "X is a variable");
    ctx.check(f.is_variable(f.make_symbol("Xs")), "Xs is a variable");
    ctx.check(!f.is_variable(f.make_symbol("a")), "a is a constant");
    ctx.check(!f.is_variable(f.make_symbol("socrates")), "socrates is a constant");
    ctx.check(!f.is_variable(f.make_symbol("_X")), "_X is a constant");
    ctx.check(!f.is_variable(f.make_symbol("")), "empty name is not a variable");
    ctx.check(!f.is_variable(f.make_skolem(0, {f.make_symbol("X")})),
              "skolem terms are never variables");
}

static void test_skolem_identity(TestContext& ctx) {
    ClauseFactory f;
    TermId x = f.make_symbol("X");
    ctx.check(f.make_skolem(1, {x}) == f.make_skolem(1, {x}), "same witness, same id");
    ctx.check(f.make_skolem(1, {x}) != f.make_skolem(2, {x}), "different witness numbers");
}

static void test_invalid_construction(TestContext& ctx) {
    ClauseFactory f;
    ClauseId p = f.make_predicate("P", std::vector<std::string>{"X"});
    ctx.check_throws<std::invalid_argument>(
        [&] { f.make_for_all({}, p); }, "empty for_all rejected");
    ctx.check_throws<std::invalid_argument>(
        [&] { f.make_there_exists({"X", "X"}, p); }, "duplicate variable rejected");
    ctx.check_throws<std::out_of_range>(
        [&] { f.node(kInvalidId); }, "invalid clause id");
    ctx.check_throws<std::out_of_range>(
        [&] { f.term(12345); }, "invalid term id");
}

static void test_allocator_monotonic(TestContext& ctx) {
    ClauseFactory f;
    SkolemAllocator skolems;
    TermId x = f.make_symbol("X");

    TermId s0 = skolems.fresh(f, {x});
    TermId s1 = skolems.fresh(f, {x});
    TermId s2 = skolems.fresh(f, {});
    ctx.check_eq(f.term_to_string(s0), "F_0(X)", "first witness");
    ctx.check_eq(f.term_to_string(s1), "F_1(X)", "second witness");
    ctx.check_eq(f.term_to_string(s2), "F_2()", "third witness");
    ctx.check(s0 != s1, "same capture, distinct witnesses");
    ctx.check(skolems.next_id() == 3, "next id");
    ctx.check(skolems.allocated() == 3, "allocated count");

    SkolemAllocator offset(40);
    ctx.check_eq(f.term_to_string(offset.fresh(f, {x})), "F_40(X)", "first id injected");
    ctx.check(offset.allocated() == 1, "allocated counts from first id");
}

static void test_allocators_are_independent(TestContext& ctx) {
    ClauseFactory f1;
    ClauseFactory f2;
    SkolemAllocator a1;
    SkolemAllocator a2;
    for (int i = 0; i < 5; ++i) {
        std::string s1 = f1.term_to_string(a1.fresh(f1, {f1.make_symbol("Z")}));
        std::string s2 = f2.term_to_string(a2.fresh(f2, {f2.make_symbol("Z")}));
        ctx.check_eq(s1, s2, "run " + std::to_string(i));
    }
}

void run_clause_tests(TestRunner& runner) {
    runner.run("render_connectives",              test_render_connectives);
    runner.run("render_quantifiers_and_terms",    test_render_quantifiers_and_terms);
    runner.run("interning_is_structural",         test_interning_is_structural);
    runner.run("predicate_hash_covers_arguments", test_predicate_hash_covers_arguments);
    runner.run("is_variable",                     test_is_variable);
    runner.run("skolem_identity",                 test_skolem_identity);
    runner.run("invalid_construction",            test_invalid_construction);
    runner.run("allocator_monotonic",             test_allocator_monotonic);
    runner.run("allocators_are_independent",      test_allocators_are_independent);
}

}  // namespace folcnf
