// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the Keystone unit and integration suites.
// Engine log output is raised to WARN so test output stays readable.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    keystone::util::logger::setLogLevel(keystone::util::logger::LogLevel::WARN);
    return RUN_ALL_TESTS();
}
