// ============================================================================
// folcnf/errors.hpp — Exception types raised by the normalization pipeline
// ============================================================================
//
//   Error                  — common base, a std::runtime_error.
//   UnsupportedClauseKind  — a traversal met a node kind it has no rule for
//                            at this pipeline stage (precondition violation).
//   NoUnifier              — two terms / literals cannot be unified.  This is
//                            an expected outcome, not a bug.
//
// ============================================================================

#ifndef FOLCNF_ERRORS_HPP
#define FOLCNF_ERRORS_HPP

#include "folcnf/clause.hpp"

#include <stdexcept>
#include <string>

namespace folcnf {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnsupportedClauseKind : public Error {
public:
    UnsupportedClauseKind(ClauseKind kind, const std::string& stage)
        : Error(stage + ": clause of kind " + clause_kind_name(kind) +
                " is not supported here"),
          kind_(kind) {}

    ClauseKind kind() const noexcept { return kind_; }

private:
    ClauseKind kind_;
};

class NoUnifier : public Error {
public:
    using Error::Error;
};

}  // namespace folcnf

#endif  // FOLCNF_ERRORS_HPP
