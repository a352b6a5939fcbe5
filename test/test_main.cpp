// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test runner: logging is silent unless FORKSCAN_TEST_LOGLEVEL is set

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    const char* level = std::getenv("FORKSCAN_TEST_LOGLEVEL");
    InitializeTestLogging(level ? level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
