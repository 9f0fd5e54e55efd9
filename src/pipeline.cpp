// ============================================================================
// pipeline.cpp — Clausal-form pipeline driver
// ============================================================================

#include "folcnf/pipeline.hpp"
#include "folcnf/normalization.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace folcnf {

// ── PipelineStats ───────────────────────────────────────────────────────────

std::string PipelineStats::to_string() const {
    std::ostringstream oss;
    oss << "input=" << input_size
        << " nnf=" << nnf_size
        << " skolem=" << skolem_size
        << " cnf=" << cnf_size
        << " skolem_terms=" << skolem_terms
        << " tie_breaks=" << tie_breaks
        << " elapsed_us=" << elapsed_us;
    return oss.str();
}

std::uint32_t tree_size(ClauseId id, const ClauseFactory& f) {
    const ClauseNode& n = f.node(id);
    std::uint32_t size = 1;
    for (ClauseId c : n.children) {
        if (c != kInvalidId) size += tree_size(c, f);
    }
    return size;
}

// ── Pipeline ────────────────────────────────────────────────────────────────

Pipeline::Pipeline(ClauseFactory& factory, PipelineOptions options)
    : factory_(factory),
      options_(options),
      skolems_(options.first_skolem_id),
      ties_(options.policy, options.seed) {}

void Pipeline::trace(const char* stage, ClauseId id) const {
    if (!options_.verbose) return;
    std::cerr << "[" << stage << "] " << factory_.to_string(id) << "\n";
}

// The order matters:
//   (1) Implication elimination removes ->, producing only and/or/not.
//   (2) NNF pushes negation onto predicates and dualises quantifiers, so
//       every quantifier has its final polarity.
//   (3) Skolemization removes there_exists.
//   (4) Dropping for_all lets distribution reach across the old binders.
//   (5) Distribution moves every and above every or.

ClauseId Pipeline::run(ClauseId id) {
    auto start = std::chrono::steady_clock::now();
    stats_.reset();
    std::uint64_t skolems_before = skolems_.allocated();
    std::uint32_t ties_before = ties_.ties();

    stats_.input_size = tree_size(id, factory_);
    trace("input", id);

    ClauseId step1 = eliminate_implications(id, factory_);
    trace("eliminate_implications", step1);

    ClauseId step2 = to_nnf(step1, factory_);
    stats_.nnf_size = tree_size(step2, factory_);
    trace("nnf", step2);

    ClauseId step3 = skolemize(step2, factory_, skolems_);
    if (options_.drop_universals) {
        step3 = drop_universals(step3, factory_);
    }
    stats_.skolem_size = tree_size(step3, factory_);
    trace("skolemize", step3);

    ClauseId step4 = distribute_or(step3, factory_, ties_);
    stats_.cnf_size = tree_size(step4, factory_);
    trace("cnf", step4);

    stats_.skolem_terms = skolems_.allocated() - skolems_before;
    stats_.tie_breaks = ties_.ties() - ties_before;
    stats_.elapsed_us = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count());

    if (options_.verbose) {
        std::cerr << "[stats] " << stats_.to_string() << "\n";
    }
    return step4;
}

std::vector<std::vector<ClauseId>> Pipeline::clausify(ClauseId id) {
    return cnf_clauses(run(id), factory_);
}

}  // namespace folcnf
