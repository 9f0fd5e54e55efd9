// ============================================================================
// folcnf/config.hpp — Pipeline options and command-line handling
// ============================================================================
//
// PipelineOptions configures one clausal-form run.  Options wraps it for
// the selftest executable, which fills it from argv.
//
// ============================================================================

#ifndef FOLCNF_CONFIG_HPP
#define FOLCNF_CONFIG_HPP

#include "folcnf/cnf.hpp"

#include <cstdint>
#include <string>

namespace folcnf {

// ── PipelineOptions ─────────────────────────────────────────────────────────

struct PipelineOptions {
    DistributionPolicy policy = DistributionPolicy::Left;
    std::uint64_t      seed = 1337;            // TieBreaker seed (Random policy)
    std::uint64_t      first_skolem_id = 0;    // first F_<n> handed out
    bool               drop_universals = true; // strip ∀ before distribution
    bool               verbose = false;        // print every stage to stderr
};

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    PipelineOptions pipeline;
    std::string     filter;   // run only tests whose name contains this
    bool            help = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// "left" / "right" / "random".  Throws std::runtime_error otherwise.
DistributionPolicy parse_policy(const std::string& name);

}  // namespace folcnf

#endif  // FOLCNF_CONFIG_HPP
