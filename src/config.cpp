// ============================================================================
// config.cpp — Command-line option parsing
// ============================================================================

#include "folcnf/config.hpp"

#include <iostream>
#include <stdexcept>

namespace folcnf {

// ── parse_policy ────────────────────────────────────────────────────────────

DistributionPolicy parse_policy(const std::string& name) {
    if (name == "left")   return DistributionPolicy::Left;
    if (name == "right")  return DistributionPolicy::Right;
    if (name == "random") return DistributionPolicy::Random;
    throw std::runtime_error("unknown distribution policy: " + name);
}

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.pipeline.verbose = true;
        } else if (arg == "--policy") {
            opts.pipeline.policy = parse_policy(value_of(i, arg));
        } else if (arg == "--seed") {
            opts.pipeline.seed = std::stoull(value_of(i, arg));
        } else if (arg == "--first-skolem") {
            opts.pipeline.first_skolem_id = std::stoull(value_of(i, arg));
        } else if (arg == "--keep-universals") {
            opts.pipeline.drop_universals = false;
        } else if (arg == "--filter") {
            opts.filter = value_of(i, arg);
        } else {
            throw std::runtime_error("unknown option: " + arg);
        }
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS]\n"
        << "\n"
        << "folcnf selftests.\n"
        << "\n"
        << "Options:\n"
        << "  --filter <text>        Run only tests whose name contains <text>\n"
        << "  --policy <p>           Tie-break for Or over two Ands: left|right|random\n"
        << "  --seed <n>             Seed for the random tie-break (default 1337)\n"
        << "  --first-skolem <n>     First Skolem number to allocate (default 0)\n"
        << "  --keep-universals      Do not strip for_all before distribution\n"
        << "  --verbose, -v          Print every pipeline stage\n"
        << "  --help, -h             Show this message\n";
}

}  // namespace folcnf
