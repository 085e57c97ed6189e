/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Each test file registers its tests automatically via the TEST() macro.
 *
 * Build: cmake --build . --target jsonsql_tests
 * Run:   ./jsonsql_tests
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
