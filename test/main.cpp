// Copyright (c) 2025-2026 The cbtrace Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/logging.h"

#include <iostream>

// Usage: cbtrace_tests [suite]
int main(int argc, char* argv[]) {
    // Keep expected warnings out of the test report.
    core::Logger::instance().set_level(core::LogLevel::ERR);

    std::cout << "cbtrace Unit Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    return test::run_all_tests(argc > 1 ? argv[1] : "");
}
