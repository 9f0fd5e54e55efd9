// ============================================================================
// normalization.cpp — Implication elimination, NNF, Skolemization
// ============================================================================
//
// Each phase is a recursive, bottom-up transformation over the interned
// clause DAG.  Because ClauseFactory interns everything, rebuilding an
// unchanged subtree yields the very same id.
//
// IMPORTANT: When recursing, copy the node's kind, children and vectors
// *before* the recursive call, because the call may grow the factory and
// invalidate any reference to a ClauseNode (e.g. `const ClauseNode& n`).
//
// ============================================================================

#include "folcnf/normalization.hpp"
#include "folcnf/errors.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace folcnf {

// ============================================================================
// negate
// ============================================================================

ClauseId negate(ClauseId id, ClauseFactory& f) {
    ClauseKind kind = f.node(id).kind;
    ClauseId child0 = f.node(id).children[0];
    ClauseId child1 = f.node(id).children[1];

    switch (kind) {
        // ¬P → ¬P (literal)
        case ClauseKind::Predicate:
            return f.make_not(id);

        // ¬¬φ → φ
        case ClauseKind::Not:
            return child0;

        // ¬(φ ∧ ψ) → (¬φ ∨ ¬ψ)
        case ClauseKind::And: {
            auto c0 = negate(child0, f);
            auto c1 = negate(child1, f);
            return f.make_or(c0, c1);
        }

        // ¬(φ ∨ ψ) → (¬φ ∧ ¬ψ)
        case ClauseKind::Or: {
            auto c0 = negate(child0, f);
            auto c1 = negate(child1, f);
            return f.make_and(c0, c1);
        }

        // ¬(φ → ψ) → (φ ∧ ¬ψ)
        case ClauseKind::Implies:
            return f.make_and(child0, negate(child1, f));

        // ¬∀x φ → ∃x ¬φ
        case ClauseKind::ForAll: {
            auto vars = f.node(id).vars;
            return f.make_there_exists(std::move(vars), negate(child0, f));
        }

        // ¬∃x φ → ∀x ¬φ
        case ClauseKind::ThereExists: {
            auto vars = f.node(id).vars;
            return f.make_for_all(std::move(vars), negate(child0, f));
        }
    }

    throw UnsupportedClauseKind(kind, "negate");
}

// ============================================================================
// Phase 1: Implication Elimination
// ============================================================================

ClauseId eliminate_implications(ClauseId id, ClauseFactory& f) {
    ClauseKind kind = f.node(id).kind;
    ClauseId child0 = f.node(id).children[0];
    ClauseId child1 = f.node(id).children[1];

    switch (kind) {
        case ClauseKind::Predicate:
            return id;

        case ClauseKind::Not:
            return f.make_not(eliminate_implications(child0, f));

        case ClauseKind::And: {
            auto c0 = eliminate_implications(child0, f);
            auto c1 = eliminate_implications(child1, f);
            return f.make_and(c0, c1);
        }
        case ClauseKind::Or: {
            auto c0 = eliminate_implications(child0, f);
            auto c1 = eliminate_implications(child1, f);
            return f.make_or(c0, c1);
        }

        case ClauseKind::ForAll: {
            auto vars = f.node(id).vars;
            return f.make_for_all(std::move(vars), eliminate_implications(child0, f));
        }
        case ClauseKind::ThereExists: {
            auto vars = f.node(id).vars;
            return f.make_there_exists(std::move(vars),
                                       eliminate_implications(child0, f));
        }

        // ── Implication: φ → ψ  ≡  ¬φ ∨ ψ ─────────────────────────────
        case ClauseKind::Implies: {
            ClauseId lhs = eliminate_implications(child0, f);
            ClauseId rhs = eliminate_implications(child1, f);
            return f.make_or(negate(lhs, f), rhs);
        }
    }

    throw UnsupportedClauseKind(kind, "eliminate_implications");
}

// ============================================================================
// Phase 2: Negation Normal Form (NNF)
// ============================================================================
//
// For non-negated nodes, just recurse.  For Not(φ), bring φ to NNF first;
// negate() of an NNF clause is again in NNF.

ClauseId to_nnf(ClauseId id, ClauseFactory& f) {
    ClauseKind kind = f.node(id).kind;
    ClauseId child0 = f.node(id).children[0];
    ClauseId child1 = f.node(id).children[1];

    switch (kind) {
        case ClauseKind::Predicate:
            return id;

        case ClauseKind::Not:
            return negate(to_nnf(child0, f), f);

        case ClauseKind::And: {
            auto c0 = to_nnf(child0, f);
            auto c1 = to_nnf(child1, f);
            return f.make_and(c0, c1);
        }
        case ClauseKind::Or: {
            auto c0 = to_nnf(child0, f);
            auto c1 = to_nnf(child1, f);
            return f.make_or(c0, c1);
        }

        case ClauseKind::ForAll: {
            auto vars = f.node(id).vars;
            return f.make_for_all(std::move(vars), to_nnf(child0, f));
        }
        case ClauseKind::ThereExists: {
            auto vars = f.node(id).vars;
            return f.make_there_exists(std::move(vars), to_nnf(child0, f));
        }

        // Must have been removed by eliminate_implications().
        case ClauseKind::Implies:
            break;
    }

    throw UnsupportedClauseKind(kind, "to_nnf");
}

ClauseId normalize_negations(ClauseId id, ClauseFactory& f) {
    ClauseId step1 = eliminate_implications(id, f);
    ClauseId step2 = to_nnf(step1, f);
    return step2;
}

// ============================================================================
// Phase 3: Skolemization
// ============================================================================

namespace {

using ExistentialMap = std::unordered_map<std::string, TermId>;

ClauseId skolemize_rec(ClauseId id, ClauseFactory& f, SkolemAllocator& skolems,
                       const std::vector<TermId>& scope,
                       const ExistentialMap& witnesses) {
    ClauseKind kind = f.node(id).kind;
    ClauseId child0 = f.node(id).children[0];
    ClauseId child1 = f.node(id).children[1];

    switch (kind) {
        case ClauseKind::Predicate: {
            if (witnesses.empty()) return id;
            std::string name = f.node(id).name;
            std::vector<TermId> args = f.node(id).args;
            for (TermId& a : args) {
                const TermNode& t = f.term(a);
                if (t.kind != TermKind::Symbol) continue;
                auto it = witnesses.find(t.name);
                if (it != witnesses.end()) a = it->second;
            }
            return f.make_predicate(name, std::move(args));
        }

        // The binder disappears; its variables get one witness each, shared
        // by every occurrence in the body.
        case ClauseKind::ThereExists: {
            auto vars = f.node(id).vars;
            ExistentialMap inner = witnesses;
            for (const auto& v : vars) {
                inner[v] = skolems.fresh(f, scope);
            }
            return skolemize_rec(child0, f, skolems, scope, inner);
        }

        case ClauseKind::ForAll: {
            auto vars = f.node(id).vars;
            std::vector<TermId> inner_scope = scope;
            ExistentialMap inner = witnesses;
            for (const auto& v : vars) {
                inner_scope.push_back(f.make_symbol(v));
                inner.erase(v);  // rebinding shadows an outer ∃
            }
            ClauseId body = skolemize_rec(child0, f, skolems, inner_scope, inner);
            return f.make_for_all(std::move(vars), body);
        }

        case ClauseKind::Not:
            return f.make_not(skolemize_rec(child0, f, skolems, scope, witnesses));

        case ClauseKind::And: {
            auto c0 = skolemize_rec(child0, f, skolems, scope, witnesses);
            auto c1 = skolemize_rec(child1, f, skolems, scope, witnesses);
            return f.make_and(c0, c1);
        }
        case ClauseKind::Or: {
            auto c0 = skolemize_rec(child0, f, skolems, scope, witnesses);
            auto c1 = skolemize_rec(child1, f, skolems, scope, witnesses);
            return f.make_or(c0, c1);
        }
        case ClauseKind::Implies: {
            auto c0 = skolemize_rec(child0, f, skolems, scope, witnesses);
            auto c1 = skolemize_rec(child1, f, skolems, scope, witnesses);
            return f.make_implies(c0, c1);
        }
    }

    throw UnsupportedClauseKind(kind, "skolemize");
}

}  // namespace

ClauseId skolemize(ClauseId id, ClauseFactory& f, SkolemAllocator& skolems) {
    return skolemize_rec(id, f, skolems, {}, {});
}

// ============================================================================
// Phase 4: Universal dropping
// ============================================================================

ClauseId drop_universals(ClauseId id, ClauseFactory& f) {
    ClauseKind kind = f.node(id).kind;
    ClauseId child0 = f.node(id).children[0];
    ClauseId child1 = f.node(id).children[1];

    switch (kind) {
        case ClauseKind::Predicate:
            return id;
        case ClauseKind::ForAll:
            return drop_universals(child0, f);
        case ClauseKind::Not:
            return f.make_not(drop_universals(child0, f));
        case ClauseKind::And: {
            auto c0 = drop_universals(child0, f);
            auto c1 = drop_universals(child1, f);
            return f.make_and(c0, c1);
        }
        case ClauseKind::Or: {
            auto c0 = drop_universals(child0, f);
            auto c1 = drop_universals(child1, f);
            return f.make_or(c0, c1);
        }
        case ClauseKind::Implies: {
            auto c0 = drop_universals(child0, f);
            auto c1 = drop_universals(child1, f);
            return f.make_implies(c0, c1);
        }

        // Dropping ∀ above an unresolved ∃ would change its witness scope.
        case ClauseKind::ThereExists:
            break;
    }

    throw UnsupportedClauseKind(kind, "drop_universals");
}

}  // namespace folcnf
