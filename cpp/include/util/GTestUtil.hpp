#pragma once

#include <gtest/gtest.h>

/*
 * Shared main() for the UnitTests executables.
 *
 * Dispatches to the standard gtest main function, while adding the LoggingUtil cmdline params, so
 * that a test binary accepts both --gtest_* options and our own --log-filename, --debug-logging,
 * etc. Every UnitTests.cpp ends with:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */
int launch_gtest(int argc, char** argv);
