// Test main file - Catch2 provides main() function
// This file is intentionally minimal as Catch2WithMain handles everything

#include <catch2/catch_test_macros.hpp>

#include "CheckendVersion.hpp"

#include <string>

// Simple smoke test to verify test framework and version macros are wired up
TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
    REQUIRE(std::string(checkend::kSdkName) == "checkend-cpp");
    REQUIRE(std::string(checkend::kSdkVersion) == CHECKEND_SDK_VERSION);
}
