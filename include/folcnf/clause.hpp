// ============================================================================
// folcnf/clause.hpp — Term and clause algebra for first-order formulas
// ============================================================================
//
// Design notes:
//
//   Every term and every clause is represented as a node in an interned
//   DAG.  Two nodes that are structurally identical share the same id.
//   This gives O(1) structural equality and makes every node immutable:
//   a transformation never edits a node, it asks the factory for a new
//   one.
//
//   Term kinds:
//     - Symbol    : a name token.  Uppercase-first names are variables,
//                   anything else is a constant / function symbol.
//     - Skolem    : a witness term F_<n>(captured...), where n is the
//                   allocation number and captured is the ordered
//                   sequence of universal variables in scope.
//
//   Clause kinds:
//     - Predicate   : name(args...), a leaf
//     - Not         : negation, child[0]
//     - And         : conjunction, child[0] & child[1]
//     - Or          : disjunction, child[0] | child[1]
//     - Implies     : implication child[0] -> child[1] (pre-NNF only)
//     - ForAll      : universal quantifier over vars, child[0]
//     - ThereExists : existential quantifier over vars, child[0]
//                     (removed by Skolemization)
//
//   ClauseFactory owns all nodes and provides the interning mechanism
//   via structural hashing.  Clients receive TermId / ClauseId handles.
//
// ============================================================================

#ifndef FOLCNF_CLAUSE_HPP
#define FOLCNF_CLAUSE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace folcnf {

// ── Handles ─────────────────────────────────────────────────────────────────
// Lightweight handles into the factory's interning tables.  The id is an
// index into the corresponding node vector.  kInvalidId signals "none".
// ─────────────────────────────────────────────────────────────────────────────

using TermId   = std::uint32_t;
using ClauseId = std::uint32_t;
inline constexpr std::uint32_t kInvalidId = static_cast<std::uint32_t>(-1);

// ── Terms ───────────────────────────────────────────────────────────────────

enum class TermKind : std::uint8_t {
    Symbol,
    Skolem
};

struct TermNode {
    TermKind            kind{};
    std::string         name;          // Symbol only
    std::uint64_t       skolem_id{0};  // Skolem only
    std::vector<TermId> args;          // Skolem captured terms, in order

    bool operator==(const TermNode& o) const noexcept;
};

struct TermNodeHash {
    std::size_t operator()(const TermNode& n) const noexcept;
};

// ── Clauses ─────────────────────────────────────────────────────────────────

enum class ClauseKind : std::uint8_t {
    Predicate,
    Not,
    And,
    Or,
    Implies,
    ForAll,
    ThereExists
};

/// Human-readable string for a ClauseKind.
const char* clause_kind_name(ClauseKind k) noexcept;

// ── ClauseNode ──────────────────────────────────────────────────────────────
// Immutable stored node.  The factory is the sole owner.
//
// Hash and equality both cover every field, so a Predicate is keyed by
// (name, args) jointly and never by its name alone.

struct ClauseNode {
    ClauseKind               kind{};
    std::string              name;   // Predicate name
    std::vector<TermId>      args;   // Predicate arguments
    std::vector<std::string> vars;   // ForAll / ThereExists variables
    ClauseId                 children[2]{kInvalidId, kInvalidId};

    bool operator==(const ClauseNode& o) const noexcept;
};

struct ClauseNodeHash {
    std::size_t operator()(const ClauseNode& n) const noexcept;
};

// ── ClauseFactory ───────────────────────────────────────────────────────────
// Thread-unsafe (single-threaded design).  Owns term and clause storage and
// the interning maps.  Every make_*() method returns the canonical id for
// that structure.

class ClauseFactory {
public:
    ClauseFactory() = default;

    // ── Terms ───────────────────────────────────────────────────────────
    TermId make_symbol(const std::string& name);
    TermId make_skolem(std::uint64_t skolem_id, std::vector<TermId> captured);

    // ── Clauses ─────────────────────────────────────────────────────────
    ClauseId make_predicate(const std::string& name, std::vector<TermId> args);
    ClauseId make_predicate(const std::string& name,
                            const std::vector<std::string>& arg_names);
    ClauseId make_not(ClauseId child);
    ClauseId make_and(ClauseId lhs, ClauseId rhs);
    ClauseId make_or(ClauseId lhs, ClauseId rhs);
    ClauseId make_implies(ClauseId lhs, ClauseId rhs);

    /// Quantifiers.  Throws std::invalid_argument if `vars` is empty or
    /// names the same variable twice.
    ClauseId make_for_all(std::vector<std::string> vars, ClauseId child);
    ClauseId make_there_exists(std::vector<std::string> vars, ClauseId child);

    // ── Accessors ───────────────────────────────────────────────────────
    const TermNode&   term(TermId id) const;
    const ClauseNode& node(ClauseId id) const;
    std::size_t       term_count() const noexcept;
    std::size_t       size() const noexcept;

    /// True for a Symbol whose name starts with an uppercase letter.
    /// Skolem terms are never variables.
    bool is_variable(TermId id) const;

    // ── Pretty-print ────────────────────────────────────────────────────
    std::string term_to_string(TermId id) const;
    std::string to_string(ClauseId id) const;

private:
    TermId   intern_term(TermNode node);
    ClauseId intern(ClauseNode node);
    ClauseId make_quantifier(ClauseKind kind, std::vector<std::string> vars,
                             ClauseId child);

    std::vector<TermNode>                                 terms_;
    std::unordered_map<TermNode, TermId, TermNodeHash>    term_intern_;
    std::vector<ClauseNode>                               nodes_;
    std::unordered_map<ClauseNode, ClauseId, ClauseNodeHash> intern_;
};

}  // namespace folcnf

#endif  // FOLCNF_CLAUSE_HPP
