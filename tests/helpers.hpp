// ============================================================================
// tests/helpers.hpp — Shared fixtures for the selftest suites
// ============================================================================

#ifndef FOLCNF_TESTS_HELPERS_HPP
#define FOLCNF_TESTS_HELPERS_HPP

#include "folcnf/clause.hpp"
#include "folcnf/config.hpp"
#include "folcnf/test.hpp"

#include <random>
#include <string>
#include <vector>

namespace folcnf {

// ── Suites ──────────────────────────────────────────────────────────────────

void run_clause_tests(TestRunner& runner);
void run_normalization_tests(TestRunner& runner);
void run_skolem_tests(TestRunner& runner);
void run_cnf_tests(TestRunner& runner, const PipelineOptions& opts);
void run_unify_tests(TestRunner& runner);
void run_pipeline_tests(TestRunner& runner, const PipelineOptions& opts);

// ── Formula generators ──────────────────────────────────────────────────────

/// Random quantifier-free clause over the atoms P(a), Q(a), R(a), S(a).
ClauseId random_propositional(ClauseFactory& f, std::mt19937_64& rng,
                              int depth, bool with_implies);

/// Random clause with quantifiers.  Every binder introduces a new variable
/// name (V0, V1, ...), so bound variables are never shadowed.
ClauseId random_quantified(ClauseFactory& f, std::mt19937_64& rng, int depth);

// ── Truth tables ────────────────────────────────────────────────────────────

/// True if a and b agree under every assignment to their predicate atoms.
/// Both must be quantifier-free.
bool same_truth_table(ClauseId a, ClauseId b, const ClauseFactory& f);

/// True if any node in the tree has the given kind.
bool contains_kind(ClauseId id, const ClauseFactory& f, ClauseKind kind);

/// Rendered predicates of extract_predicates(id).
std::vector<std::string> rendered_predicates(ClauseId id, const ClauseFactory& f);

}  // namespace folcnf

#endif  // FOLCNF_TESTS_HELPERS_HPP
