// ============================================================================
// folcnf/unify.hpp — Disagreement-set unification
// ============================================================================
//
// Robinson-style most-general-unifier search.  A disagreement set of term
// pairs is built from the literals, then resolved first-in first-out:
//
//   (t, t)          identical, dropped
//   (X, t)          X ↦ t; X is replaced by t in every remaining pair,
//                   including inside Skolem captured lists
//   (t, X)          X ↦ t, symmetric
//   (F_n(ā), F_n(b̄)) same witness: pairs (aᵢ, bᵢ) are added
//   anything else   NoUnifier
//
// Binding X to a term that contains X fails the occurs check (NoUnifier).
//
// A Substitution is applied sequentially: binding i is applied to the
// result of applying bindings 0..i-1.  Applying the result of a
// successful unify() to both sides makes every paired argument list
// syntactically identical.
//
// ============================================================================

#ifndef FOLCNF_UNIFY_HPP
#define FOLCNF_UNIFY_HPP

#include "folcnf/clause.hpp"

#include <optional>
#include <string>
#include <vector>

namespace folcnf {

struct Binding {
    TermId variable;
    TermId value;

    bool operator==(const Binding& o) const noexcept {
        return variable == o.variable && value == o.value;
    }
};

using Substitution = std::vector<Binding>;

// ── unify ───────────────────────────────────────────────────────────────────
// Clause-level check.  Every predicate of extract_predicates(x) is paired
// with every same-named predicate of extract_predicates(y) and all their
// argument positions join the disagreement set.  Polarity is ignored.
// Throws NoUnifier when there is no unifier, including a same-named arity
// mismatch.  With no shared predicate name the result is empty.

Substitution unify(ClauseId x, ClauseId y, ClauseFactory& f);

/// Same as unify(), returning nullopt instead of throwing NoUnifier.
std::optional<Substitution> try_unify(ClauseId x, ClauseId y, ClauseFactory& f);

// ── unify_literals ──────────────────────────────────────────────────────────
// The textbook single-pair primitive used by resolution.  `p` and `q` are
// literals (Predicate or Not(Predicate), polarity ignored).  Throws
// NoUnifier on differing names or arities, or disagreeing arguments.

Substitution unify_literals(ClauseId p, ClauseId q, ClauseFactory& f);

// ── Application ─────────────────────────────────────────────────────────────

TermId   apply(const Substitution& sigma, TermId term, ClauseFactory& f);
ClauseId apply_to_clause(const Substitution& sigma, ClauseId id, ClauseFactory& f);

/// "{X -> a, Y -> F_0(Z)}"
std::string to_string(const Substitution& sigma, const ClauseFactory& f);

}  // namespace folcnf

#endif  // FOLCNF_UNIFY_HPP
