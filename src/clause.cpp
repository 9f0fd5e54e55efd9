// ============================================================================
// clause.cpp — Implementation of the clause algebra, interning, and printing
// ============================================================================

#include "folcnf/clause.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>

namespace folcnf {

namespace {

// Boost-style hash combine, same mixing for terms and clauses.
inline void mix(std::size_t& h, std::size_t v) noexcept {
    h ^= v + 0x9e3779b9 + (h << 6) + (h >> 2);
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

}  // namespace

// ── clause_kind_name ────────────────────────────────────────────────────────

const char* clause_kind_name(ClauseKind k) noexcept {
    switch (k) {
        case ClauseKind::Predicate:   return "Predicate";
        case ClauseKind::Not:         return "Not";
        case ClauseKind::And:         return "And";
        case ClauseKind::Or:          return "Or";
        case ClauseKind::Implies:     return "Implies";
        case ClauseKind::ForAll:      return "ForAll";
        case ClauseKind::ThereExists: return "ThereExists";
    }
    return "?";
}

// ── TermNode equality / hash ────────────────────────────────────────────────

bool TermNode::operator==(const TermNode& o) const noexcept {
    return kind == o.kind &&
           name == o.name &&
           skolem_id == o.skolem_id &&
           args == o.args;
}

std::size_t TermNodeHash::operator()(const TermNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    mix(h, std::hash<std::string>{}(n.name));
    mix(h, std::hash<std::uint64_t>{}(n.skolem_id));
    for (TermId a : n.args) {
        mix(h, std::hash<TermId>{}(a));
    }
    return h;
}

// ── ClauseNode equality / hash ──────────────────────────────────────────────

bool ClauseNode::operator==(const ClauseNode& o) const noexcept {
    return kind == o.kind &&
           name == o.name &&
           args == o.args &&
           vars == o.vars &&
           children[0] == o.children[0] &&
           children[1] == o.children[1];
}

// Combine kind, name, args, vars and children.  Predicates therefore hash
// on (name, args) together, consistent with operator==.
std::size_t ClauseNodeHash::operator()(const ClauseNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    mix(h, std::hash<std::string>{}(n.name));
    for (TermId a : n.args) {
        mix(h, std::hash<TermId>{}(a));
    }
    for (const auto& v : n.vars) {
        mix(h, std::hash<std::string>{}(v));
    }
    mix(h, std::hash<ClauseId>{}(n.children[0]));
    mix(h, std::hash<ClauseId>{}(n.children[1]));
    return h;
}

// ── Interning ───────────────────────────────────────────────────────────────

TermId ClauseFactory::intern_term(TermNode node) {
    auto it = term_intern_.find(node);
    if (it != term_intern_.end()) {
        return it->second;
    }
    TermId id = static_cast<TermId>(terms_.size());
    terms_.push_back(std::move(node));
    term_intern_[terms_.back()] = id;
    return id;
}

ClauseId ClauseFactory::intern(ClauseNode node) {
    auto it = intern_.find(node);
    if (it != intern_.end()) {
        return it->second;
    }
    ClauseId id = static_cast<ClauseId>(nodes_.size());
    nodes_.push_back(std::move(node));
    intern_[nodes_.back()] = id;
    return id;
}

// ── Term constructors ───────────────────────────────────────────────────────

TermId ClauseFactory::make_symbol(const std::string& name) {
    TermNode n;
    n.kind = TermKind::Symbol;
    n.name = name;
    return intern_term(std::move(n));
}

TermId ClauseFactory::make_skolem(std::uint64_t skolem_id,
                                  std::vector<TermId> captured) {
    TermNode n;
    n.kind = TermKind::Skolem;
    n.skolem_id = skolem_id;
    n.args = std::move(captured);
    return intern_term(std::move(n));
}

// ── Clause constructors ─────────────────────────────────────────────────────

ClauseId ClauseFactory::make_predicate(const std::string& name,
                                       std::vector<TermId> args) {
    ClauseNode n;
    n.kind = ClauseKind::Predicate;
    n.name = name;
    n.args = std::move(args);
    return intern(std::move(n));
}

ClauseId ClauseFactory::make_predicate(const std::string& name,
                                       const std::vector<std::string>& arg_names) {
    std::vector<TermId> args;
    args.reserve(arg_names.size());
    for (const auto& a : arg_names) {
        args.push_back(make_symbol(a));
    }
    return make_predicate(name, std::move(args));
}

ClauseId ClauseFactory::make_not(ClauseId child) {
    ClauseNode n;
    n.kind = ClauseKind::Not;
    n.children[0] = child;
    return intern(std::move(n));
}

ClauseId ClauseFactory::make_and(ClauseId lhs, ClauseId rhs) {
    ClauseNode n;
    n.kind = ClauseKind::And;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

ClauseId ClauseFactory::make_or(ClauseId lhs, ClauseId rhs) {
    ClauseNode n;
    n.kind = ClauseKind::Or;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

ClauseId ClauseFactory::make_implies(ClauseId lhs, ClauseId rhs) {
    ClauseNode n;
    n.kind = ClauseKind::Implies;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

ClauseId ClauseFactory::make_quantifier(ClauseKind kind,
                                        std::vector<std::string> vars,
                                        ClauseId child) {
    if (vars.empty()) {
        throw std::invalid_argument(std::string(clause_kind_name(kind)) +
                                    ": empty variable list");
    }
    std::unordered_set<std::string> seen;
    for (const auto& v : vars) {
        if (!seen.insert(v).second) {
            throw std::invalid_argument(std::string(clause_kind_name(kind)) +
                                        ": duplicate variable '" + v + "'");
        }
    }
    ClauseNode n;
    n.kind = kind;
    n.vars = std::move(vars);
    n.children[0] = child;
    return intern(std::move(n));
}

ClauseId ClauseFactory::make_for_all(std::vector<std::string> vars, ClauseId child) {
    return make_quantifier(ClauseKind::ForAll, std::move(vars), child);
}

ClauseId ClauseFactory::make_there_exists(std::vector<std::string> vars,
                                          ClauseId child) {
    return make_quantifier(ClauseKind::ThereExists, std::move(vars), child);
}

// ── Accessors ───────────────────────────────────────────────────────────────

const TermNode& ClauseFactory::term(TermId id) const {
    if (id >= terms_.size()) {
        throw std::out_of_range("ClauseFactory::term: invalid TermId");
    }
    return terms_[id];
}

const ClauseNode& ClauseFactory::node(ClauseId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("ClauseFactory::node: invalid ClauseId");
    }
    return nodes_[id];
}

std::size_t ClauseFactory::term_count() const noexcept {
    return terms_.size();
}

std::size_t ClauseFactory::size() const noexcept {
    return nodes_.size();
}

bool ClauseFactory::is_variable(TermId id) const {
    const TermNode& t = term(id);
    if (t.kind != TermKind::Symbol || t.name.empty()) return false;
    return std::isupper(static_cast<unsigned char>(t.name.front())) != 0;
}

// ── Pretty-printing ─────────────────────────────────────────────────────────
// Debug grammar only; there is no parser for it.

std::string ClauseFactory::term_to_string(TermId id) const {
    const TermNode& t = term(id);
    switch (t.kind) {
        case TermKind::Symbol:
            return t.name;
        case TermKind::Skolem: {
            std::vector<std::string> parts;
            parts.reserve(t.args.size());
            for (TermId a : t.args) parts.push_back(term_to_string(a));
            return "F_" + std::to_string(t.skolem_id) + "(" + join(parts) + ")";
        }
    }
    return "<?>";
}

std::string ClauseFactory::to_string(ClauseId id) const {
    const ClauseNode& n = node(id);

    switch (n.kind) {
        case ClauseKind::Predicate: {
            std::vector<std::string> parts;
            parts.reserve(n.args.size());
            for (TermId a : n.args) parts.push_back(term_to_string(a));
            return n.name + "(" + join(parts) + ")";
        }
        case ClauseKind::Not:
            return "(not " + to_string(n.children[0]) + ")";
        case ClauseKind::And:
            return "(" + to_string(n.children[0]) + " and " + to_string(n.children[1]) + ")";
        case ClauseKind::Or:
            return "(" + to_string(n.children[0]) + " or " + to_string(n.children[1]) + ")";
        case ClauseKind::Implies:
            return "(" + to_string(n.children[0]) + " -> " + to_string(n.children[1]) + ")";
        case ClauseKind::ForAll:
            return "(for_all (" + join(n.vars) + ") " + to_string(n.children[0]) + ")";
        case ClauseKind::ThereExists:
            return "(there_exists (" + join(n.vars) + ") " + to_string(n.children[0]) + ")";
    }
    return "<?>";
}

}  // namespace folcnf
