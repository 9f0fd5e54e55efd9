// ============================================================================
// folcnf/pipeline.hpp — Clausal-form pipeline driver
// ============================================================================
//
// Chains the individual phases in their fixed order:
//
//   eliminate_implications → to_nnf → skolemize → [drop_universals]
//     → distribute_or
//
// The Pipeline owns the SkolemAllocator and TieBreaker built from its
// PipelineOptions, so repeated run() calls keep handing out fresh Skolem
// numbers: witnesses of different input formulas never collide.
//
// ============================================================================

#ifndef FOLCNF_PIPELINE_HPP
#define FOLCNF_PIPELINE_HPP

#include "folcnf/clause.hpp"
#include "folcnf/cnf.hpp"
#include "folcnf/config.hpp"
#include "folcnf/skolem.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace folcnf {

// ── Statistics ──────────────────────────────────────────────────────────────
// Describes the most recent run().  Sizes count tree nodes, so a shared
// subtree is counted once per occurrence.

struct PipelineStats {
    std::uint32_t input_size = 0;
    std::uint32_t nnf_size = 0;
    std::uint32_t skolem_size = 0;
    std::uint32_t cnf_size = 0;
    std::uint64_t skolem_terms = 0;
    std::uint32_t tie_breaks = 0;
    std::uint64_t elapsed_us = 0;

    void reset() noexcept { *this = PipelineStats{}; }

    std::string to_string() const;
};

/// Number of nodes in the tree rooted at `id`.
std::uint32_t tree_size(ClauseId id, const ClauseFactory& f);

// ── Pipeline ────────────────────────────────────────────────────────────────

class Pipeline {
public:
    explicit Pipeline(ClauseFactory& factory, PipelineOptions options = {});

    /// Bring `id` to CNF.  With drop_universals disabled, ForAll nodes
    /// survive and block distribution across them.
    ClauseId run(ClauseId id);

    /// run() and split the result into clauses of literals.
    std::vector<std::vector<ClauseId>> clausify(ClauseId id);

    const PipelineStats&   stats() const noexcept { return stats_; }
    const PipelineOptions& options() const noexcept { return options_; }
    SkolemAllocator&       skolems() noexcept { return skolems_; }

private:
    void trace(const char* stage, ClauseId id) const;

    ClauseFactory&  factory_;
    PipelineOptions options_;
    SkolemAllocator skolems_;
    TieBreaker      ties_;
    PipelineStats   stats_;
};

}  // namespace folcnf

#endif  // FOLCNF_PIPELINE_HPP
