// ============================================================================
// folcnf/skolem.hpp — Fresh Skolem witness allocation
// ============================================================================
//
// A SkolemAllocator is a monotonic id source.  Each call to fresh() hands
// out a number strictly greater than every number handed out before by the
// same allocator and interns the witness term F_<n>(captured...) in the
// given factory.
//
// The allocator is an explicit object passed to skolemize(), never global
// state: two pipeline runs with allocators starting from the same first_id
// produce identical output.  Like ClauseFactory it is not thread-safe; use
// one allocator per run.
//
// ============================================================================

#ifndef FOLCNF_SKOLEM_HPP
#define FOLCNF_SKOLEM_HPP

#include "folcnf/clause.hpp"

#include <cstdint>
#include <vector>

namespace folcnf {

class SkolemAllocator {
public:
    explicit SkolemAllocator(std::uint64_t first_id = 0) noexcept
        : first_(first_id), next_(first_id) {}

    /// Allocate a new witness capturing `captured` verbatim.
    TermId fresh(ClauseFactory& f, std::vector<TermId> captured);

    /// The number the next fresh() call will use.
    std::uint64_t next_id() const noexcept { return next_; }

    /// How many witnesses this allocator has produced.
    std::uint64_t allocated() const noexcept { return next_ - first_; }

private:
    std::uint64_t first_;
    std::uint64_t next_;
};

}  // namespace folcnf

#endif  // FOLCNF_SKOLEM_HPP
