// test/unittest/test_harness.hpp
// Minimal test registry and assertion macros shared by the unit tests
//
// A failed ASSERT_* throws TestFailure; run_all_tests() catches it, reports
// the test as FAIL and returns non-zero if anything failed.
#pragma once

#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

struct TestFailure : std::runtime_error {
    explicit TestFailure(const std::string& what) : std::runtime_error(what) {}
};

struct Test {
    const char* name;
    void (*func)();
};

inline std::vector<Test>& test_registry() {
    static std::vector<Test> tests;
    return tests;
}

inline void register_test(const char* name, void (*func)()) {
    test_registry().push_back({name, func});
}

// Simple test framework
#define TEST(name) \
    void test_##name(); \
    struct TestRegistrar_##name { \
        TestRegistrar_##name() { register_test(#name, test_##name); } \
    } registrar_##name; \
    void test_##name()

#define TEST_FAIL_(msg_expr) do { \
    std::ostringstream os_; \
    os_ << __FILE__ << ":" << __LINE__ << " " << msg_expr; \
    throw TestFailure(os_.str()); \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if (!((a) == (b))) { \
        TEST_FAIL_("Expected " << #a << " == " << #b << " (got " << (a) << " vs " << (b) << ")"); \
    } \
} while(0)

#define ASSERT_NE(a, b) do { \
    if ((a) == (b)) { \
        TEST_FAIL_("Expected " << #a << " != " << #b); \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        TEST_FAIL_("Expected " << #cond << " to be true"); \
    } \
} while(0)

#define ASSERT_FALSE(cond) do { \
    if (cond) { \
        TEST_FAIL_("Expected " << #cond << " to be false"); \
    } \
} while(0)

#define ASSERT_GT(a, b) do { \
    if (!((a) > (b))) { \
        TEST_FAIL_("Expected " << #a << " > " << #b << " (got " << (a) << " vs " << (b) << ")"); \
    } \
} while(0)

#define ASSERT_GE(a, b) do { \
    if (!((a) >= (b))) { \
        TEST_FAIL_("Expected " << #a << " >= " << #b << " (got " << (a) << " vs " << (b) << ")"); \
    } \
} while(0)

#define ASSERT_LT(a, b) do { \
    if (!((a) < (b))) { \
        TEST_FAIL_("Expected " << #a << " < " << #b << " (got " << (a) << " vs " << (b) << ")"); \
    } \
} while(0)

#define ASSERT_LE(a, b) do { \
    if (!((a) <= (b))) { \
        TEST_FAIL_("Expected " << #a << " <= " << #b << " (got " << (a) << " vs " << (b) << ")"); \
    } \
} while(0)

#define ASSERT_NEAR(a, b, tol) do { \
    if (std::fabs(static_cast<double>(a) - static_cast<double>(b)) > (tol)) { \
        TEST_FAIL_("Expected " << #a << " ~= " << #b << " within " << (tol) \
                   << " (got " << (a) << " vs " << (b) << ")"); \
    } \
} while(0)

#define ASSERT_THROWS(expr, ExceptionType) do { \
    bool thrown_ = false; \
    try { expr; } catch (const ExceptionType&) { thrown_ = true; } \
    if (!thrown_) { \
        TEST_FAIL_("Expected " << #expr << " to throw " << #ExceptionType); \
    } \
} while(0)

inline int run_all_tests(const char* suite) {
    std::cout << "Running " << suite << " tests..." << std::endl;
    std::cout << "=================================" << std::endl;

    int passed = 0;
    int failed = 0;

    for (const auto& test : test_registry()) {
        std::cout << "Running: " << test.name << "... ";
        std::cout.flush();

        try {
            test.func();
            std::cout << "PASS" << std::endl;
            passed++;
        } catch (const TestFailure& e) {
            std::cout << "FAIL" << std::endl;
            std::cerr << "  " << e.what() << std::endl;
            failed++;
        } catch (const std::exception& e) {
            std::cout << "FAIL" << std::endl;
            std::cerr << "  Unexpected exception: " << e.what() << std::endl;
            failed++;
        }
    }

    std::cout << "=================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;

    return failed > 0 ? 1 : 0;
}
