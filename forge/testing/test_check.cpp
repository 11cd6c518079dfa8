/**
 * @file test_check.cpp
 * @brief Minimal pass/fail reporting shared by the test programs.
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 */

#include "test_check.hpp"
#include <iostream>

static int passed = 0;
static int failed = 0;

void test_section(const std::string& title) {
    std::cout << "\n--- " << title << " ---" << std::endl;
}

void test_check(bool condition, const std::string& description) {
    if (condition) {
        passed++;
        std::cout << "✓ PASS " << description << std::endl;
    } else {
        failed++;
        std::cout << "✗ FAIL " << description << std::endl;
    }
}

int test_summary() {
    std::cout << "\n=== " << passed << " passed, " << failed << " failed ===" << std::endl;
    return failed == 0 ? 0 : 1;
}
