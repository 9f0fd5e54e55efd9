// ============================================================================
// folcnf/normalization.hpp — Implication elimination, NNF, Skolemization
// ============================================================================
//
// The front half of the clausal-form pipeline.  The phases, in the order
// the pipeline runs them:
//
//   1. Eliminate →    — rewrite implications to disjunctions.
//   2. NNF            — push negation inward until it rests only on
//                       predicates.
//   3. Skolemize      — replace existentially bound variables with Skolem
//                       witness terms over the enclosing universals.
//   4. Drop ∀         — (optional) remove the remaining universal
//                       quantifiers; clause variables are implicitly ∀.
//
// All phases are pure functions: they take a ClauseId and a ClauseFactory
// and return a new (interned) ClauseId.  Skolemization additionally draws
// witnesses from an explicit SkolemAllocator.
//
// ============================================================================

#ifndef FOLCNF_NORMALIZATION_HPP
#define FOLCNF_NORMALIZATION_HPP

#include "folcnf/clause.hpp"
#include "folcnf/skolem.hpp"

namespace folcnf {

// ── negate ──────────────────────────────────────────────────────────────────
//
// Return the negation of `id` with the negation pushed inward:
//
//   ¬P(..)          ≡   Not(P(..))
//   ¬¬φ             ≡   φ
//   ¬(φ ∧ ψ)       ≡   ¬φ ∨ ¬ψ            (De Morgan)
//   ¬(φ ∨ ψ)       ≡   ¬φ ∧ ¬ψ            (De Morgan)
//   ¬∀x φ           ≡   ∃x ¬φ              (duality)
//   ¬∃x φ           ≡   ∀x ¬φ              (duality)
//   ¬(φ → ψ)       ≡   φ ∧ ¬ψ
//
// The implication rule is only applied at the top node: φ is returned as
// is.  Implications below must already have been eliminated for the
// result to be in NNF.

ClauseId negate(ClauseId id, ClauseFactory& f);

// ── Phase 1: Implication elimination ────────────────────────────────────────
//
//   φ → ψ     ≡   negate(φ) ∨ ψ        (applied bottom-up)
//
// After this phase the clause contains no Implies nodes.

ClauseId eliminate_implications(ClauseId id, ClauseFactory& f);

// ── Phase 2: Negation Normal Form ───────────────────────────────────────────
//
// For Not(φ): bring φ to NNF, then negate() it.  Other kinds are rebuilt
// from their NNF children.  Throws UnsupportedClauseKind on Implies: run
// eliminate_implications() first.
//
// After NNF, Not appears only directly above a Predicate.

ClauseId to_nnf(ClauseId id, ClauseFactory& f);

/// Phases 1 and 2 in order.
ClauseId normalize_negations(ClauseId id, ClauseFactory& f);

// ── Phase 3: Skolemization ──────────────────────────────────────────────────
//
// Walks the tree carrying
//   - the universal scope: universally bound variables seen so far, in
//     binding order (extended on entering ForAll);
//   - the existential map: existential variable → its Skolem witness.
//
//   ∃x̄ φ           →  φ, with one fresh witness F_n(scope) per x in x̄,
//                      allocated when the binder is reached
//   ∀x̄ φ           →  ∀x̄ φ', scope extended by x̄ for φ
//   P(.., x, ..)    →  P(.., F_n(scope), ..) for every existential x
//
// Every occurrence of one bound variable shares the same witness.  All
// other kinds (including Implies) are rebuilt with Skolemized children, so
// the phase may run before or after NNF; the pipeline runs it after.
// Input should have uniquely named bound variables.

ClauseId skolemize(ClauseId id, ClauseFactory& f, SkolemAllocator& skolems);

// ── Phase 4: Universal dropping ─────────────────────────────────────────────
//
// Remove every ForAll node.  Throws UnsupportedClauseKind on ThereExists:
// Skolemize first.

ClauseId drop_universals(ClauseId id, ClauseFactory& f);

}  // namespace folcnf

#endif  // FOLCNF_NORMALIZATION_HPP
