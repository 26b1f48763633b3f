// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the piiguard unit and integration tests.
// Log output is raised to ERROR so test output stays readable.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    piiguard::util::logger::setLogLevel(piiguard::util::logger::LogLevel::ERROR);
    return RUN_ALL_TESTS();
}
