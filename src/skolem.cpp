// ============================================================================
// skolem.cpp — Skolem witness allocation
// ============================================================================

#include "folcnf/skolem.hpp"

#include <limits>
#include <stdexcept>

namespace folcnf {

TermId SkolemAllocator::fresh(ClauseFactory& f, std::vector<TermId> captured) {
    if (next_ == std::numeric_limits<std::uint64_t>::max()) {
        throw std::overflow_error("SkolemAllocator: id space exhausted");
    }
    return f.make_skolem(next_++, std::move(captured));
}

}  // namespace folcnf
