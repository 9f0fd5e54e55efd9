// ============================================================================
// folcnf/test.hpp — Lightweight selftest framework
// ============================================================================
//
// Defines a minimal test harness: register test functions, run them,
// and report pass/fail counts.  No external dependencies.
//
// Usage:
//   void test_foo(TestContext& ctx) {
//       ctx.check(1 + 1 == 2, "basic math");
//   }
//   // in a suite:  runner.run("foo", test_foo);
//
// ============================================================================

#ifndef FOLCNF_TEST_HPP
#define FOLCNF_TEST_HPP

#include <functional>
#include <string>
#include <utility>

namespace folcnf {

// ── TestContext ──────────────────────────────────────────────────────────────

class TestContext {
public:
    /// Record a check.  If `condition` is false, logs a failure.
    void check(bool condition, const std::string& description);

    /// Record a string-equality check with nice diff output.
    void check_eq(const std::string& actual, const std::string& expected,
                  const std::string& description);

    /// Record a check that `fn` throws an exception of type E.
    template <typename E, typename Fn>
    void check_throws(Fn&& fn, const std::string& description) {
        bool thrown = false;
        try {
            fn();
        } catch (const E&) {
            thrown = true;
        }
        check(thrown, description);
    }

    /// Total checks so far.
    int total() const noexcept { return total_; }

    /// Failed checks so far.
    int failed() const noexcept { return failed_; }

private:
    int total_  = 0;
    int failed_ = 0;
    std::string current_test_;

    friend class TestRunner;
};

// ── TestRunner ──────────────────────────────────────────────────────────────

class TestRunner {
public:
    using TestFunc = std::function<void(TestContext&)>;

    /// Only tests whose name contains `filter` are run (empty: all).
    explicit TestRunner(std::string filter = "") : filter_(std::move(filter)) {}

    /// Register and immediately run a named test.
    void run(const std::string& name, TestFunc func);

    /// Print summary and return exit code (0 = all pass, 1 = failures).
    int summarise() const;

private:
    std::string filter_;
    int tests_run_    = 0;
    int tests_failed_ = 0;
    int checks_total_ = 0;
    int checks_failed_ = 0;
};

}  // namespace folcnf

#endif  // FOLCNF_TEST_HPP
