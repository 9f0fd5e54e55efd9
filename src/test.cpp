// ============================================================================
// test.cpp — Selftest harness
// ============================================================================

#include "folcnf/test.hpp"

#include <exception>
#include <iostream>

namespace folcnf {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    if (!filter_.empty() && name.find(filter_) == std::string::npos) {
        return;
    }

    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

}  // namespace folcnf
