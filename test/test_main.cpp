#include <gtest/gtest.h>

#include "util/Logger.hpp"

/**
 * @brief Main entry point for monosync unit tests
 *
 * All test files are automatically registered with GoogleTest.
 * Run with: ./monosync_tests
 *
 * Or with CMake CTest: ctest --output-on-failure
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Keep expected failures (conflicts, lost races) out of the test output
    monosync::Logger::instance().setLevel(monosync::LogLevel::Error);
    return RUN_ALL_TESTS();
}
