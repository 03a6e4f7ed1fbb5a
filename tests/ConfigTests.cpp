#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "TestFixtures.hpp"
#include "mm/utils/Config.hpp"
#include "mm/utils/ThreadPool.hpp"

using mm::content::MissingResourcePolicy;
using mm::core::Endian;
using mm::utils::ConfigLoader;

TEST_CASE("Config reads every engine option", "[config]") {
    const auto result = ConfigLoader::LoadFromString(R"({
        "platform": "wiiu",
        "workerThreads": 4,
        "mergeGenericFormats": true,
        "missingResources": "skip",
        "compressOutput": false,
        "logLevel": "Warning"
    })");

    REQUIRE_FALSE(result.HasErrors());
    REQUIRE_FALSE(result.HasWarnings());
    REQUIRE(result.loadedFromFile);
    REQUIRE(result.config.platform == Endian::Big);
    REQUIRE(result.config.workerThreads == 4);
    REQUIRE(result.config.mergeGenericFormats);
    REQUIRE(result.config.missingResources == MissingResourcePolicy::Skip);
    REQUIRE_FALSE(result.config.compressOutput);
    REQUIRE(result.config.logLevel == mm::core::LogLevel::Warning);
}

TEST_CASE("Config falls back to defaults on bad values", "[config]") {
    const auto result = ConfigLoader::LoadFromString(R"({
        "platform": "ps4",
        "workerThreads": 500,
        "missingResources": "ignore",
        "compressOutput": "yes"
    })");

    REQUIRE_FALSE(result.HasErrors());
    REQUIRE(result.warnings.size() == 4);
    REQUIRE(result.config.platform == Endian::Little);
    REQUIRE(result.config.workerThreads == 64);
    REQUIRE(result.config.missingResources == MissingResourcePolicy::Fail);
    REQUIRE(result.config.compressOutput);

    REQUIRE(ConfigLoader::LoadFromString(R"({"workerThreads": -2})").config.workerThreads == 0);
    REQUIRE(ConfigLoader::LoadFromString(R"({"platform": "nx"})").config.platform == Endian::Little);
}

TEST_CASE("Config reports unreadable input", "[config][errors]") {
    const auto malformed = ConfigLoader::LoadFromString("{ \"platform\": ", "broken.json");
    REQUIRE(malformed.HasErrors());
    REQUIRE_FALSE(malformed.loadedFromFile);

    REQUIRE(ConfigLoader::LoadFromString("[1, 2]").HasErrors());

    const TempDirectory dir("config_missing");
    const auto missing = ConfigLoader::Load(dir.path / "modmerge.json");
    REQUIRE_FALSE(missing.HasErrors());
    REQUIRE(missing.HasWarnings());
    REQUIRE_FALSE(missing.loadedFromFile);
    REQUIRE(missing.config.compressOutput);
}

TEST_CASE("Config file paths resolve against the config directory", "[config][io]") {
    const TempDirectory dir("config_file");
    dir.WriteFile("logs/.keep", {});
    dir.WriteFile("modmerge.json", BytesOf(R"({"logFile": "logs/merge.log"})"));

    const auto result = ConfigLoader::Load(dir.path / "modmerge.json");
    REQUIRE(result.loadedFromFile);
    REQUIRE_FALSE(result.HasWarnings());
    REQUIRE(result.config.logFile == (dir.path / "logs" / "merge.log").lexically_normal());
}

TEST_CASE("Worker thread counts resolve within bounds", "[config][threads]") {
    REQUIRE(mm::utils::ThreadPool::ResolveThreadCount(0) >= 1);
    REQUIRE(mm::utils::ThreadPool::ResolveThreadCount(0) <= 64);
    REQUIRE(mm::utils::ThreadPool::ResolveThreadCount(3) == 3);
    REQUIRE(mm::utils::ThreadPool::ResolveThreadCount(1000) == 64);

    mm::utils::ThreadPool pool(2);
    REQUIRE(pool.ThreadCount() == 2);
    auto answer = pool.Submit([] { return 42; });
    REQUIRE(answer.get() == 42);

    const std::vector<int> values{1, 2, 3, 4};
    auto squares = pool.SubmitEach(values, [](int value) {
        if (value == 3) {
            throw std::runtime_error("three");
        }
        return value * value;
    });
    mm::utils::ThreadPool::WaitAll(squares);
    REQUIRE(squares[0].get() == 1);
    REQUIRE(squares[3].get() == 16);
    REQUIRE_THROWS_AS(squares[2].get(), std::runtime_error);
}
