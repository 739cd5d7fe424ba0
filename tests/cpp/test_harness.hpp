/**
 * Minimal test framework shared by the test executables
 */

#ifndef LMSGEN_TEST_HARNESS_HPP
#define LMSGEN_TEST_HARNESS_HPP

#include <iostream>
#include <stdexcept>
#include <string>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... " << std::flush; \
    try

#define TEST_END \
    std::cout << "PASSED" << std::endl; \
    ++tests_passed; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << std::endl; \
        ++tests_failed; \
    } catch (...) { \
        std::cout << "FAILED: Unknown exception" << std::endl; \
        ++tests_failed; \
    }

#define ASSERT_TRUE(cond) \
    if (!(cond)) throw std::runtime_error("Assertion failed: " #cond)

#define ASSERT_FALSE(cond) \
    if (cond) throw std::runtime_error("Assertion failed: NOT " #cond)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw std::runtime_error("Assertion failed: " #a " == " #b)

// Passes only if expr throws an exception of type ex
#define ASSERT_THROWS(expr, ex) \
    do { \
        bool thrown_ = false; \
        try { (void)(expr); } catch (const ex&) { thrown_ = true; } \
        if (!thrown_) throw std::runtime_error("Expected " #ex " from: " #expr); \
    } while (0)

inline int report_results() {
    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;
    return tests_failed > 0 ? 1 : 0;
}

#endif // LMSGEN_TEST_HARNESS_HPP
