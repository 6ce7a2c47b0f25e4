/**
 * @file test_main_gtest.cpp
 * @brief Main entry point for GTest test suite
 */

#include <gtest/gtest.h>

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
