#include "mm/core/Logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "mm/core/Error.hpp"

namespace {

// Restores the log level and closes the log file on scope exit.
struct LoggerFileGuard {
    std::filesystem::path path;
    mm::core::LogLevel level = mm::core::Logger::MinimumLevel();
    LoggerFileGuard() = default;
    explicit LoggerFileGuard(std::filesystem::path p) : path(std::move(p)) {}
    ~LoggerFileGuard() {
        mm::core::Logger::SetMinimumLevel(level);
        mm::core::Logger::SetLogFile({});
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

} // namespace

TEST_CASE("Logger writes formatted messages to file", "[logger]") {
    const std::filesystem::path tempFile =
        std::filesystem::temp_directory_path() / "modmerge_logger_test.log";

    LoggerFileGuard guard(tempFile);

    mm::core::Logger::SetMinimumLevel(mm::core::LogLevel::Info);
    mm::core::Logger::SetLogFile(tempFile);
    mm::core::Logger::Info("[ModMerger] Merged {} resources", 42);

    std::ifstream file(tempFile);
    REQUIRE(file.is_open());

    std::string line;
    std::getline(file, line);
    file.close();

    REQUIRE(line.find("[Info] [ModMerger] Merged 42 resources") != std::string::npos);
}

TEST_CASE("Logger listeners receive log lines", "[logger]") {
    std::vector<std::string> captured;
    const auto token = mm::core::Logger::RegisterListener(
        [&captured](mm::core::LogLevel level, const std::string& line) {
            if (level == mm::core::LogLevel::Warning) {
                captured.push_back(line);
            }
        });

    mm::core::Logger::Warning("Captured warning {}", 7);
    mm::core::Logger::Info("Not captured");

    mm::core::Logger::UnregisterListener(token);
    mm::core::Logger::Warning("After unregister");

    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().find("[Warning] Captured warning 7") != std::string::npos);
}

TEST_CASE("Logger drops lines below the minimum level", "[logger]") {
    LoggerFileGuard guard;
    std::vector<mm::core::LogLevel> levels;
    const auto token = mm::core::Logger::RegisterListener(
        [&levels](mm::core::LogLevel level, const std::string&) { levels.push_back(level); });

    mm::core::Logger::SetMinimumLevel(mm::core::LogLevel::Warning);
    mm::core::Logger::Info("[ModMerger] dropped");
    mm::core::Logger::Warning("[ModMerger] kept");
    mm::core::Logger::Error("[ModMerger] kept");
    mm::core::Logger::UnregisterListener(token);

    REQUIRE(levels == std::vector<mm::core::LogLevel>{mm::core::LogLevel::Warning, mm::core::LogLevel::Error});
    REQUIRE(mm::core::ParseLogLevel("WARNING") == mm::core::LogLevel::Warning);
    REQUIRE_FALSE(mm::core::ParseLogLevel("verbose").has_value());
}

TEST_CASE("Error messages carry resource and field", "[logger][errors]") {
    const mm::core::ParseError error(mm::core::ParseErrorKind::TypeMismatch, {}, "LinkTarget", "expected string");
    const auto tagged = error.WithResource("Actor/ActorLink/Enemy_Lynel.bxml");

    REQUIRE(tagged.kind() == mm::core::ParseErrorKind::TypeMismatch);
    REQUIRE(tagged.resource() == "Actor/ActorLink/Enemy_Lynel.bxml");
    REQUIRE(tagged.field() == "LinkTarget");
    REQUIRE(std::string(tagged.what()).find("Actor/ActorLink/Enemy_Lynel.bxml") != std::string::npos);

    const mm::core::MissingResourceError missing("Actor/X.bxml", "Pack/A.pack//Actor/X.bxml");
    REQUIRE(missing.entry() == "Actor/X.bxml");
    REQUIRE(missing.canonicalKey() == "Pack/A.pack//Actor/X.bxml");
}
