// Minimal test harness: each suite is a plain executable run by CTest.
#pragma once
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " << #name << "... "; \
    try { \
        test_##name(); \
        std::cout << "PASS" << std::endl; \
        tests_passed++; \
    } catch (const std::exception& e) { \
        std::cout << "FAIL: " << e.what() << std::endl; \
        tests_failed++; \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        throw std::runtime_error(std::string("line ") + std::to_string(__LINE__) + ": " #cond); \
    } \
} while(0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_EQ(expected, actual) do { \
    if (!((expected) == (actual))) { \
        std::ostringstream oss_; \
        oss_ << "line " << __LINE__ << ": expected " << (expected) << " but got " << (actual); \
        throw std::runtime_error(oss_.str()); \
    } \
} while(0)

// Passes only if stmt throws exactly ExType (or a subclass).
#define ASSERT_THROWS(stmt, ExType) do { \
    bool thrown_ = false; \
    try { stmt; } catch (const ExType&) { thrown_ = true; } \
    if (!thrown_) { \
        throw std::runtime_error(std::string("line ") + std::to_string(__LINE__) + ": " #stmt " did not throw " #ExType); \
    } \
} while(0)

#define TEST_SUMMARY() do { \
    std::cout << std::endl << "Passed: " << tests_passed << ", Failed: " << tests_failed << std::endl; \
    return tests_failed == 0 ? 0 : 1; \
} while(0)
