// ============================================================================
// z3_equivalence.cpp — Implementation of the Z3 equivalence checker
// ============================================================================

#include "folcnf/z3_equivalence.hpp"

namespace folcnf {

Z3EquivalenceChecker::Z3EquivalenceChecker(const ClauseFactory& factory)
    : factory_(factory), ctx_(), solver_(ctx_) {}

z3::expr Z3EquivalenceChecker::get_atom(ClauseId predicate) {
    auto it = atoms_.find(predicate);
    if (it != atoms_.end()) {
        return *it->second;
    }
    // The rendered predicate is unique per interned id and reads well in
    // Z3 models.
    std::string name = factory_.to_string(predicate);
    auto var = std::make_unique<z3::expr>(ctx_.bool_const(name.c_str()));
    z3::expr result = *var;
    atoms_[predicate] = std::move(var);
    return result;
}

std::optional<z3::expr> Z3EquivalenceChecker::to_z3_bool(ClauseId id) {
    const ClauseNode& n = factory_.node(id);

    switch (n.kind) {
        case ClauseKind::Predicate:
            return get_atom(id);

        case ClauseKind::Not: {
            auto child = to_z3_bool(n.children[0]);
            if (!child) return std::nullopt;
            return !(*child);
        }

        case ClauseKind::And: {
            auto lhs = to_z3_bool(n.children[0]);
            auto rhs = to_z3_bool(n.children[1]);
            if (!lhs || !rhs) return std::nullopt;
            return (*lhs) && (*rhs);
        }

        case ClauseKind::Or: {
            auto lhs = to_z3_bool(n.children[0]);
            auto rhs = to_z3_bool(n.children[1]);
            if (!lhs || !rhs) return std::nullopt;
            return (*lhs) || (*rhs);
        }

        case ClauseKind::Implies: {
            auto lhs = to_z3_bool(n.children[0]);
            auto rhs = to_z3_bool(n.children[1]);
            if (!lhs || !rhs) return std::nullopt;
            return z3::implies(*lhs, *rhs);
        }

        // Quantifiers have no propositional reading.
        case ClauseKind::ForAll:
        case ClauseKind::ThereExists:
            return std::nullopt;
    }

    return std::nullopt;
}

Z3Result Z3EquivalenceChecker::solve(const z3::expr& e) {
    solver_.push();
    solver_.add(e);
    z3::check_result r = solver_.check();
    solver_.pop();

    switch (r) {
        case z3::sat:     return Z3Result::SAT;
        case z3::unsat:   return Z3Result::UNSAT;
        case z3::unknown: return Z3Result::UNKNOWN;
    }
    return Z3Result::UNKNOWN;
}

EquivalenceResult Z3EquivalenceChecker::check_equivalent(ClauseId a, ClauseId b) {
    auto ea = to_z3_bool(a);
    auto eb = to_z3_bool(b);
    if (!ea || !eb) return EquivalenceResult::Unknown;

    // a ≢ b satisfiable ⇔ some assignment tells them apart.
    switch (solve(*ea != *eb)) {
        case Z3Result::UNSAT:   return EquivalenceResult::Equivalent;
        case Z3Result::SAT:     return EquivalenceResult::NotEquivalent;
        case Z3Result::UNKNOWN: return EquivalenceResult::Unknown;
    }
    return EquivalenceResult::Unknown;
}

Z3Result Z3EquivalenceChecker::check_satisfiable(ClauseId id) {
    auto e = to_z3_bool(id);
    if (!e) return Z3Result::UNKNOWN;
    return solve(*e);
}

}  // namespace folcnf
