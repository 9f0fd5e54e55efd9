// ============================================================================
// tests/helpers.cpp — Shared fixtures for the selftest suites
// ============================================================================

#include "helpers.hpp"

#include "folcnf/cnf.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace folcnf {

// ============================================================================
// Formula generators
// ============================================================================
//
// Choices use the raw engine output modulo n so that a given seed yields
// the same formulas with every standard library.

ClauseId random_propositional(ClauseFactory& f, std::mt19937_64& rng,
                              int depth, bool with_implies) {
    static const char* const kAtoms[] = {"P", "Q", "R", "S"};
    if (depth <= 0 || rng() % 5 == 0) {
        return f.make_predicate(kAtoms[rng() % 4], std::vector<std::string>{"a"});
    }

    unsigned choices = with_implies ? 4u : 3u;
    switch (rng() % choices) {
        case 0:
            return f.make_not(random_propositional(f, rng, depth - 1, with_implies));
        case 1: {
            auto l = random_propositional(f, rng, depth - 1, with_implies);
            auto r = random_propositional(f, rng, depth - 1, with_implies);
            return f.make_and(l, r);
        }
        case 2: {
            auto l = random_propositional(f, rng, depth - 1, with_implies);
            auto r = random_propositional(f, rng, depth - 1, with_implies);
            return f.make_or(l, r);
        }
        default: {
            auto l = random_propositional(f, rng, depth - 1, with_implies);
            auto r = random_propositional(f, rng, depth - 1, with_implies);
            return f.make_implies(l, r);
        }
    }
}

static ClauseId random_quantified_rec(ClauseFactory& f, std::mt19937_64& rng,
                                      int depth, std::vector<std::string>& scope,
                                      int& next_var) {
    static const char* const kNames[] = {"P", "Q", "R"};
    if (depth <= 0 || rng() % 6 == 0) {
        std::size_t arity = 1 + rng() % 2;
        std::vector<std::string> args;
        for (std::size_t i = 0; i < arity; ++i) {
            std::size_t pick = rng() % (scope.size() + 1);
            args.push_back(pick == scope.size() ? std::string("a") : scope[pick]);
        }
        return f.make_predicate(kNames[rng() % 3], args);
    }

    switch (rng() % 6) {
        case 0:
            return f.make_not(random_quantified_rec(f, rng, depth - 1, scope, next_var));
        case 1: {
            auto l = random_quantified_rec(f, rng, depth - 1, scope, next_var);
            auto r = random_quantified_rec(f, rng, depth - 1, scope, next_var);
            return f.make_and(l, r);
        }
        case 2: {
            auto l = random_quantified_rec(f, rng, depth - 1, scope, next_var);
            auto r = random_quantified_rec(f, rng, depth - 1, scope, next_var);
            return f.make_or(l, r);
        }
        case 3: {
            auto l = random_quantified_rec(f, rng, depth - 1, scope, next_var);
            auto r = random_quantified_rec(f, rng, depth - 1, scope, next_var);
            return f.make_implies(l, r);
        }
        default: {
            bool universal = (rng() % 2) == 0;
            std::string v = "V" + std::to_string(next_var++);
            scope.push_back(v);
            ClauseId body = random_quantified_rec(f, rng, depth - 1, scope, next_var);
            scope.pop_back();
            return universal ? f.make_for_all({v}, body)
                             : f.make_there_exists({v}, body);
        }
    }
}

ClauseId random_quantified(ClauseFactory& f, std::mt19937_64& rng, int depth) {
    std::vector<std::string> scope;
    int next_var = 0;
    return random_quantified_rec(f, rng, depth, scope, next_var);
}

// ============================================================================
// Truth tables
// ============================================================================

static bool evaluate(ClauseId id, const ClauseFactory& f,
                     const std::unordered_map<ClauseId, bool>& assignment) {
    const ClauseNode& n = f.node(id);
    switch (n.kind) {
        case ClauseKind::Predicate:
            return assignment.at(id);
        case ClauseKind::Not:
            return !evaluate(n.children[0], f, assignment);
        case ClauseKind::And:
            return evaluate(n.children[0], f, assignment) &&
                   evaluate(n.children[1], f, assignment);
        case ClauseKind::Or:
            return evaluate(n.children[0], f, assignment) ||
                   evaluate(n.children[1], f, assignment);
        case ClauseKind::Implies:
            return !evaluate(n.children[0], f, assignment) ||
                   evaluate(n.children[1], f, assignment);
        case ClauseKind::ForAll:
        case ClauseKind::ThereExists:
            break;
    }
    throw std::logic_error("evaluate: quantified clause has no truth table");
}

bool same_truth_table(ClauseId a, ClauseId b, const ClauseFactory& f) {
    std::vector<ClauseId> atoms = extract_predicates(a, f);
    std::vector<ClauseId> more = extract_predicates(b, f);
    atoms.insert(atoms.end(), more.begin(), more.end());
    std::sort(atoms.begin(), atoms.end());
    atoms.erase(std::unique(atoms.begin(), atoms.end()), atoms.end());

    std::unordered_map<ClauseId, bool> assignment;
    for (std::uint64_t mask = 0; mask < (1ull << atoms.size()); ++mask) {
        for (std::size_t i = 0; i < atoms.size(); ++i) {
            assignment[atoms[i]] = (mask >> i) & 1u;
        }
        if (evaluate(a, f, assignment) != evaluate(b, f, assignment)) {
            return false;
        }
    }
    return true;
}

bool contains_kind(ClauseId id, const ClauseFactory& f, ClauseKind kind) {
    const ClauseNode& n = f.node(id);
    if (n.kind == kind) return true;
    for (ClauseId c : n.children) {
        if (c != kInvalidId && contains_kind(c, f, kind)) return true;
    }
    return false;
}

std::vector<std::string> rendered_predicates(ClauseId id, const ClauseFactory& f) {
    std::vector<std::string> out;
    for (ClauseId p : extract_predicates(id, f)) {
        out.push_back(f.to_string(p));
    }
    return out;
}

}  // namespace folcnf
