// ============================================================================
// cnf.cpp — Or-over-And distribution, literal extraction, shape queries
// ============================================================================

#include "folcnf/cnf.hpp"
#include "folcnf/errors.hpp"

// #define FOLCNF_TRACE 1  // Uncomment for distribution trace output
#ifdef FOLCNF_TRACE
#include <iostream>
#endif

namespace folcnf {

// ============================================================================
// TieBreaker
// ============================================================================

const char* policy_name(DistributionPolicy p) noexcept {
    switch (p) {
        case DistributionPolicy::Left:   return "left";
        case DistributionPolicy::Right:  return "right";
        case DistributionPolicy::Random: return "random";
    }
    return "?";
}

bool TieBreaker::expand_left() {
    ++ties_;
    switch (policy_) {
        case DistributionPolicy::Left:   return true;
        case DistributionPolicy::Right:  return false;
        // Low bit of the raw engine output: std::*_distribution results
        // differ between standard libraries, the engine sequence does not.
        case DistributionPolicy::Random: return (rng_() & 1u) == 0;
    }
    return true;
}

// ============================================================================
// distribute_or
// ============================================================================

ClauseId distribute_or(ClauseId id, ClauseFactory& f, TieBreaker& ties) {
    // Copy node kind and children BEFORE any recursive calls.
    ClauseKind kind = f.node(id).kind;
    ClauseId child0 = f.node(id).children[0];
    ClauseId child1 = f.node(id).children[1];

    switch (kind) {
        case ClauseKind::Predicate:
            return id;

        case ClauseKind::Not:
            return f.make_not(distribute_or(child0, f, ties));

        case ClauseKind::And: {
            auto c0 = distribute_or(child0, f, ties);
            auto c1 = distribute_or(child1, f, ties);
            return f.make_and(c0, c1);
        }

        case ClauseKind::Or: {
            ClauseId lhs = distribute_or(child0, f, ties);
            ClauseId rhs = distribute_or(child1, f, ties);
            bool lhs_and = f.node(lhs).kind == ClauseKind::And;
            bool rhs_and = f.node(rhs).kind == ClauseKind::And;
            if (!lhs_and && !rhs_and) {
                return f.make_or(lhs, rhs);
            }

            bool pick_left = lhs_and && (!rhs_and || ties.expand_left());
            ClauseId conj  = pick_left ? lhs : rhs;
            ClauseId other = pick_left ? rhs : lhs;
            ClauseId conj_l = f.node(conj).children[0];
            ClauseId conj_r = f.node(conj).children[1];

#ifdef FOLCNF_TRACE
            std::cerr << "distribute " << f.to_string(other) << " over "
                      << f.to_string(conj) << "\n";
#endif

            auto d0 = distribute_or(f.make_or(conj_l, other), f, ties);
            auto d1 = distribute_or(f.make_or(conj_r, other), f, ties);
            return f.make_and(d0, d1);
        }

        case ClauseKind::Implies: {
            auto c0 = distribute_or(child0, f, ties);
            auto c1 = distribute_or(child1, f, ties);
            return f.make_implies(c0, c1);
        }

        case ClauseKind::ForAll: {
            auto vars = f.node(id).vars;
            return f.make_for_all(std::move(vars), distribute_or(child0, f, ties));
        }
        case ClauseKind::ThereExists: {
            auto vars = f.node(id).vars;
            return f.make_there_exists(std::move(vars), distribute_or(child0, f, ties));
        }
    }

    throw UnsupportedClauseKind(kind, "distribute_or");
}

ClauseId distribute_or(ClauseId id, ClauseFactory& f) {
    TieBreaker ties(DistributionPolicy::Left);
    return distribute_or(id, f, ties);
}

// ============================================================================
// extract_predicates
// ============================================================================

static void extract_into(ClauseId id, const ClauseFactory& f,
                         std::vector<ClauseId>& out) {
    const ClauseNode& n = f.node(id);
    switch (n.kind) {
        case ClauseKind::Predicate:
            out.push_back(id);
            return;
        case ClauseKind::And:
        case ClauseKind::Or:
        case ClauseKind::Implies:
            extract_into(n.children[0], f, out);
            extract_into(n.children[1], f, out);
            return;
        case ClauseKind::Not:
        case ClauseKind::ForAll:
        case ClauseKind::ThereExists:
            extract_into(n.children[0], f, out);
            return;
    }
    throw UnsupportedClauseKind(n.kind, "extract_predicates");
}

std::vector<ClauseId> extract_predicates(ClauseId id, const ClauseFactory& f) {
    std::vector<ClauseId> out;
    extract_into(id, f, out);
    return out;
}

// ============================================================================
// Shape queries
// ============================================================================

bool is_monolithic_or(ClauseId id, const ClauseFactory& f) {
    const ClauseNode& n = f.node(id);
    switch (n.kind) {
        case ClauseKind::Predicate:
            return true;
        case ClauseKind::Or:
            return is_monolithic_or(n.children[0], f) &&
                   is_monolithic_or(n.children[1], f);
        case ClauseKind::Not:
            return is_monolithic_or(n.children[0], f);
        default:
            return false;
    }
}

bool is_nnf(ClauseId id, const ClauseFactory& f) {
    const ClauseNode& n = f.node(id);
    switch (n.kind) {
        case ClauseKind::Predicate:
            return true;
        case ClauseKind::Not:
            return f.node(n.children[0]).kind == ClauseKind::Predicate;
        case ClauseKind::And:
        case ClauseKind::Or:
            return is_nnf(n.children[0], f) && is_nnf(n.children[1], f);
        case ClauseKind::ForAll:
        case ClauseKind::ThereExists:
            return is_nnf(n.children[0], f);
        case ClauseKind::Implies:
            return false;
    }
    return false;
}

static bool is_literal(ClauseId id, const ClauseFactory& f) {
    const ClauseNode& n = f.node(id);
    if (n.kind == ClauseKind::Predicate) return true;
    return n.kind == ClauseKind::Not &&
           f.node(n.children[0]).kind == ClauseKind::Predicate;
}

static bool is_disjunction(ClauseId id, const ClauseFactory& f) {
    const ClauseNode& n = f.node(id);
    if (n.kind == ClauseKind::Or) {
        return is_disjunction(n.children[0], f) && is_disjunction(n.children[1], f);
    }
    return is_literal(id, f);
}

bool is_cnf(ClauseId id, const ClauseFactory& f) {
    const ClauseNode& n = f.node(id);
    if (n.kind == ClauseKind::And) {
        return is_cnf(n.children[0], f) && is_cnf(n.children[1], f);
    }
    return is_disjunction(id, f);
}

// ============================================================================
// cnf_clauses
// ============================================================================

static void collect_literals(ClauseId id, const ClauseFactory& f,
                             std::vector<ClauseId>& out) {
    const ClauseNode& n = f.node(id);
    if (n.kind == ClauseKind::Or) {
        collect_literals(n.children[0], f, out);
        collect_literals(n.children[1], f, out);
        return;
    }
    if (!is_literal(id, f)) {
        throw UnsupportedClauseKind(n.kind, "cnf_clauses");
    }
    out.push_back(id);
}

static void collect_clauses(ClauseId id, const ClauseFactory& f,
                            std::vector<std::vector<ClauseId>>& out) {
    const ClauseNode& n = f.node(id);
    if (n.kind == ClauseKind::And) {
        collect_clauses(n.children[0], f, out);
        collect_clauses(n.children[1], f, out);
        return;
    }
    std::vector<ClauseId> literals;
    collect_literals(id, f, literals);
    out.push_back(std::move(literals));
}

std::vector<std::vector<ClauseId>> cnf_clauses(ClauseId id, const ClauseFactory& f) {
    std::vector<std::vector<ClauseId>> out;
    collect_clauses(id, f, out);
    return out;
}

}  // namespace folcnf
