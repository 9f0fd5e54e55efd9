// ============================================================================
// unify.cpp — Disagreement-set unification
// ============================================================================

#include "folcnf/unify.hpp"
#include "folcnf/cnf.hpp"
#include "folcnf/errors.hpp"

#include <deque>
#include <utility>

namespace folcnf {

namespace {

using TermPair = std::pair<TermId, TermId>;

// Replace every occurrence of `var` in `t` by `value`.  Only Skolem terms
// have subterms.
TermId replace(TermId t, TermId var, TermId value, ClauseFactory& f) {
    if (t == var) return value;
    if (f.term(t).kind != TermKind::Skolem) return t;

    std::uint64_t skolem_id = f.term(t).skolem_id;
    std::vector<TermId> args = f.term(t).args;
    bool changed = false;
    for (TermId& a : args) {
        TermId r = replace(a, var, value, f);
        if (r != a) {
            a = r;
            changed = true;
        }
    }
    return changed ? f.make_skolem(skolem_id, std::move(args)) : t;
}

bool occurs(TermId var, TermId t, const ClauseFactory& f) {
    if (t == var) return true;
    const TermNode& n = f.term(t);
    for (TermId a : n.args) {
        if (occurs(var, a, f)) return true;
    }
    return false;
}

ClauseId strip_negation(ClauseId id, const ClauseFactory& f) {
    const ClauseNode& n = f.node(id);
    if (n.kind == ClauseKind::Not) return n.children[0];
    return id;
}

// Add the argument pairs of two same-named predicates.
void add_disagreements(ClauseId p, ClauseId q, const ClauseFactory& f,
                       std::deque<TermPair>& pending) {
    const ClauseNode& pn = f.node(p);
    const ClauseNode& qn = f.node(q);
    if (pn.args.size() != qn.args.size()) {
        throw NoUnifier("arity mismatch for " + pn.name + ": " +
                        std::to_string(pn.args.size()) + " vs " +
                        std::to_string(qn.args.size()));
    }
    for (std::size_t i = 0; i < pn.args.size(); ++i) {
        pending.emplace_back(pn.args[i], qn.args[i]);
    }
}

// ── resolve ─────────────────────────────────────────────────────────────────
// Drain the disagreement set into a substitution.

Substitution resolve(std::deque<TermPair> pending, ClauseFactory& f) {
    Substitution out;

    auto bind = [&](TermId var, TermId value) {
        if (occurs(var, value, f)) {
            throw NoUnifier("occurs check: " + f.term_to_string(var) + " in " +
                            f.term_to_string(value));
        }
        for (TermPair& p : pending) {
            p.first  = replace(p.first, var, value, f);
            p.second = replace(p.second, var, value, f);
        }
        out.push_back(Binding{var, value});
    };

    while (!pending.empty()) {
        auto [a, b] = pending.front();
        pending.pop_front();

        if (a == b) continue;

        if (f.is_variable(a)) {
            bind(a, b);
        } else if (f.is_variable(b)) {
            bind(b, a);
        } else {
            const TermNode& ta = f.term(a);
            const TermNode& tb = f.term(b);
            if (ta.kind == TermKind::Skolem && tb.kind == TermKind::Skolem &&
                ta.skolem_id == tb.skolem_id && ta.args.size() == tb.args.size()) {
                for (std::size_t i = 0; i < ta.args.size(); ++i) {
                    pending.emplace_back(ta.args[i], tb.args[i]);
                }
                continue;
            }
            throw NoUnifier("cannot unify " + f.term_to_string(a) + " with " +
                            f.term_to_string(b));
        }
    }
    return out;
}

}  // namespace

// ============================================================================
// unify / try_unify / unify_literals
// ============================================================================

Substitution unify(ClauseId x, ClauseId y, ClauseFactory& f) {
    std::vector<ClauseId> xs = extract_predicates(x, f);
    std::vector<ClauseId> ys = extract_predicates(y, f);

    std::deque<TermPair> pending;
    for (ClauseId p : xs) {
        for (ClauseId q : ys) {
            if (f.node(p).name == f.node(q).name) {
                add_disagreements(p, q, f, pending);
            }
        }
    }
    return resolve(std::move(pending), f);
}

std::optional<Substitution> try_unify(ClauseId x, ClauseId y, ClauseFactory& f) {
    try {
        return unify(x, y, f);
    } catch (const NoUnifier&) {
        return std::nullopt;
    }
}

Substitution unify_literals(ClauseId p, ClauseId q, ClauseFactory& f) {
    ClauseId pa = strip_negation(p, f);
    ClauseId qa = strip_negation(q, f);
    for (ClauseId atom : {pa, qa}) {
        ClauseKind k = f.node(atom).kind;
        if (k != ClauseKind::Predicate) {
            throw UnsupportedClauseKind(k, "unify_literals");
        }
    }
    if (f.node(pa).name != f.node(qa).name) {
        throw NoUnifier("predicate names differ: " + f.node(pa).name + " vs " +
                        f.node(qa).name);
    }

    std::deque<TermPair> pending;
    add_disagreements(pa, qa, f, pending);
    return resolve(std::move(pending), f);
}

// ============================================================================
// Application
// ============================================================================

TermId apply(const Substitution& sigma, TermId term, ClauseFactory& f) {
    for (const Binding& b : sigma) {
        term = replace(term, b.variable, b.value, f);
    }
    return term;
}

ClauseId apply_to_clause(const Substitution& sigma, ClauseId id, ClauseFactory& f) {
    ClauseKind kind = f.node(id).kind;
    ClauseId child0 = f.node(id).children[0];
    ClauseId child1 = f.node(id).children[1];

    switch (kind) {
        case ClauseKind::Predicate: {
            std::string name = f.node(id).name;
            std::vector<TermId> args = f.node(id).args;
            for (TermId& a : args) a = apply(sigma, a, f);
            return f.make_predicate(name, std::move(args));
        }
        case ClauseKind::Not:
            return f.make_not(apply_to_clause(sigma, child0, f));
        case ClauseKind::And: {
            auto c0 = apply_to_clause(sigma, child0, f);
            auto c1 = apply_to_clause(sigma, child1, f);
            return f.make_and(c0, c1);
        }
        case ClauseKind::Or: {
            auto c0 = apply_to_clause(sigma, child0, f);
            auto c1 = apply_to_clause(sigma, child1, f);
            return f.make_or(c0, c1);
        }
        case ClauseKind::Implies: {
            auto c0 = apply_to_clause(sigma, child0, f);
            auto c1 = apply_to_clause(sigma, child1, f);
            return f.make_implies(c0, c1);
        }
        case ClauseKind::ForAll: {
            auto vars = f.node(id).vars;
            return f.make_for_all(std::move(vars), apply_to_clause(sigma, child0, f));
        }
        case ClauseKind::ThereExists: {
            auto vars = f.node(id).vars;
            return f.make_there_exists(std::move(vars),
                                       apply_to_clause(sigma, child0, f));
        }
    }

    throw UnsupportedClauseKind(kind, "apply_to_clause");
}

std::string to_string(const Substitution& sigma, const ClauseFactory& f) {
    std::string out = "{";
    for (std::size_t i = 0; i < sigma.size(); ++i) {
        if (i > 0) out += ", ";
        out += f.term_to_string(sigma[i].variable) + " -> " +
               f.term_to_string(sigma[i].value);
    }
    out += "}";
    return out;
}

}  // namespace folcnf
