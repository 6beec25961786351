// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license
// Test runner: Catch2 session plus a --loglevel option for the app logger

#include <catch2/catch_session.hpp>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    Catch::Session session;

    // Quiet by default; --loglevel=trace shows the backend's own logging
    std::string log_level = "off";
    using namespace Catch::Clara;
    auto cli = session.cli()
        | Opt(log_level, "level")["--loglevel"]("application log level (trace..off)");
    session.cli(cli);

    int rc = session.applyCommandLine(argc, argv);
    if (rc != 0) {
        return rc;
    }

    InitializeTestLogging(log_level);
    int result = session.run();
    ShutdownTestLogging();
    return result;
}
