// Pass/fail bookkeeping shared by the testbenches
#ifndef MEDRV_TB_TEST_COMMON_H
#define MEDRV_TB_TEST_COMMON_H

#include <systemc.h>
#include <iomanip>
#include <iostream>
#include <string>

static int tests_passed = 0;
static int tests_failed = 0;

inline bool check(bool condition, const std::string& description) {
    std::cout << "  " << description << " - " << (condition ? "PASS" : "FAIL") << std::endl;
    if (condition) tests_passed++;
    else tests_failed++;
    return condition;
}

inline bool check_eq(uint64_t actual, uint64_t expected, const std::string& description) {
    bool ok = actual == expected;
    std::cout << "  " << description << ": 0x" << std::hex << actual;
    if (!ok) std::cout << " (expected 0x" << expected << ")";
    std::cout << std::dec << " - " << (ok ? "PASS" : "FAIL") << std::endl;
    if (ok) tests_passed++;
    else tests_failed++;
    return ok;
}

inline void section(const std::string& title) {
    std::cout << "\n=== " << title << " ===" << std::endl;
}

inline int summary(const char* bench) {
    int total = tests_passed + tests_failed;
    std::cout << "\n=== " << bench << " summary ===" << std::endl;
    std::cout << "Passed: " << tests_passed << "/" << total << std::endl;
    if (tests_failed == 0) std::cout << "ALL TESTS PASSED!" << std::endl;
    else std::cout << tests_failed << " TESTS FAILED!" << std::endl;
    return tests_failed == 0 ? 0 : 1;
}

inline uint32_t floatToHex(float f) {
    union { float f; uint32_t i; } u;
    u.f = f;
    return u.i;
}

inline uint64_t doubleToHex(double d) {
    union { double d; uint64_t i; } u;
    u.d = d;
    return u.i;
}

#endif
