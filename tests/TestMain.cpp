#include <catch2/catch_session.hpp>

#include "mm/core/Logger.hpp"

int main(int argc, char* argv[]) {
    // Merge runs log every resource at Info; keep test output to warnings
    // unless MM_LOG_LEVEL asks for more.
    mm::core::Logger::SetMinimumLevel(mm::core::LogLevel::Warning);
    mm::core::Logger::ConfigureFromEnvironment();

    Catch::Session session;
    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }
    return session.run();
}
