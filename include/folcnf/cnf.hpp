// ============================================================================
// folcnf/cnf.hpp — Distribution to CNF, literal extraction, shape queries
// ============================================================================
//
// distribute_or() turns an NNF, quantifier-free clause into conjunctive
// normal form by pushing Or below And:
//
//   (φ ∧ ψ) ∨ χ   →   (φ ∨ χ) ∧ (ψ ∨ χ)
//   χ ∨ (φ ∧ ψ)   →   (φ ∨ χ) ∧ (ψ ∨ χ)
//
// Each new Or is distributed again, since a single step can expose a new
// Or-over-And.  When both operands of an Or are conjunctions, one of them
// has to be picked for expansion; the TieBreaker makes that choice.  The
// resulting trees differ in shape but are logically equivalent.
//
// ============================================================================

#ifndef FOLCNF_CNF_HPP
#define FOLCNF_CNF_HPP

#include "folcnf/clause.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace folcnf {

// ── TieBreaker ──────────────────────────────────────────────────────────────

enum class DistributionPolicy : std::uint8_t {
    Left,    // always expand the left conjunction
    Right,   // always expand the right conjunction
    Random   // seeded coin flip
};

/// Human-readable string for a DistributionPolicy.
const char* policy_name(DistributionPolicy p) noexcept;

class TieBreaker {
public:
    explicit TieBreaker(DistributionPolicy policy = DistributionPolicy::Left,
                        std::uint64_t seed = 1337)
        : policy_(policy), rng_(seed) {}

    /// True if the left operand's conjunction should be expanded.
    bool expand_left();

    DistributionPolicy policy() const noexcept { return policy_; }
    std::uint32_t      ties() const noexcept { return ties_; }

private:
    DistributionPolicy policy_;
    std::mt19937_64    rng_;
    std::uint32_t      ties_ = 0;
};

// ── Distribution ────────────────────────────────────────────────────────────
// Not, quantifiers and Implies are rebuilt with distributed children.

ClauseId distribute_or(ClauseId id, ClauseFactory& f, TieBreaker& ties);

/// Same, with the Left policy.
ClauseId distribute_or(ClauseId id, ClauseFactory& f);

// ── Predicate extraction ────────────────────────────────────────────────────
// All Predicate leaves, left to right, depth first.  Negation, quantifiers
// and connectives are looked through; callers that need clause grouping use
// cnf_clauses().

std::vector<ClauseId> extract_predicates(ClauseId id, const ClauseFactory& f);

// ── Shape queries ───────────────────────────────────────────────────────────

/// Only Or, Not and Predicate nodes.
bool is_monolithic_or(ClauseId id, const ClauseFactory& f);

/// No Implies, and every Not wraps a Predicate.
bool is_nnf(ClauseId id, const ClauseFactory& f);

/// Quantifier-free NNF with no Or above an And.
bool is_cnf(ClauseId id, const ClauseFactory& f);

/// Split a CNF clause into its disjunctions, each as a list of literals
/// (Predicate or Not(Predicate)) in left-to-right order.  Throws
/// UnsupportedClauseKind if `id` is not in CNF.
std::vector<std::vector<ClauseId>> cnf_clauses(ClauseId id, const ClauseFactory& f);

}  // namespace folcnf

#endif  // FOLCNF_CNF_HPP
