// ============================================================================
// folcnf/z3_equivalence.hpp — Z3 wrapper for propositional equivalence
// ============================================================================
//
// Encodes a quantifier-free clause as a Z3 boolean formula in which every
// distinct predicate (name + arguments) is an independent atom, and asks Z3
// whether two such encodings can ever disagree.
//
// Usage:
//   Z3EquivalenceChecker checker(factory);
//   if (checker.check_equivalent(before, after) ==
//       EquivalenceResult::Equivalent) {
//       // same truth table over the predicate atoms
//   }
//
// IMPORTANT: this is the propositional abstraction only.  Quantifiers are
// not encoded; clauses that still contain them yield Unknown.
//
// ============================================================================

#ifndef FOLCNF_Z3_EQUIVALENCE_HPP
#define FOLCNF_Z3_EQUIVALENCE_HPP

#include "folcnf/clause.hpp"

#include <z3++.h>

#include <memory>
#include <optional>
#include <unordered_map>

namespace folcnf {

// ── Results ─────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

enum class EquivalenceResult {
    Equivalent,
    NotEquivalent,
    Unknown
};

// ── Z3EquivalenceChecker ────────────────────────────────────────────────────
// Keeps one Z3 context for the lifetime of the checker; every query runs in
// its own solver scope.

class Z3EquivalenceChecker {
public:
    explicit Z3EquivalenceChecker(const ClauseFactory& factory);

    /// Equivalent iff no assignment to the atoms distinguishes a and b.
    EquivalenceResult check_equivalent(ClauseId a, ClauseId b);

    /// Satisfiability of a single quantifier-free clause.
    Z3Result check_satisfiable(ClauseId id);

private:
    // Convert a quantifier-free clause to a Z3 boolean expression.
    // Returns nullopt if the clause contains a quantifier.
    std::optional<z3::expr> to_z3_bool(ClauseId id);

    // Get or create the Z3 boolean constant for a predicate.
    z3::expr get_atom(ClauseId predicate);

    Z3Result solve(const z3::expr& e);

    const ClauseFactory& factory_;
    z3::context          ctx_;
    z3::solver           solver_;

    // Predicate id → Z3 boolean constant (z3::expr has no default
    // constructor, hence the unique_ptr).
    std::unordered_map<ClauseId, std::unique_ptr<z3::expr>> atoms_;
};

}  // namespace folcnf

#endif  // FOLCNF_Z3_EQUIVALENCE_HPP
