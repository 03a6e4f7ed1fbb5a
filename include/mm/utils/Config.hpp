#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "mm/content/ResourceData.hpp"
#include "mm/core/Endian.hpp"
#include "mm/core/Logger.hpp"

namespace mm::utils {

struct EngineConfig {
    core::Endian platform = core::Endian::Little;
    std::size_t workerThreads = 0;      // 0 = hardware concurrency
    std::filesystem::path logFile;
    core::LogLevel logLevel = core::LogLevel::Info;
    bool mergeGenericFormats = false;
    content::MissingResourcePolicy missingResources = content::MissingResourcePolicy::Fail;
    bool compressOutput = true;
};

struct ConfigLoadResult {
    EngineConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Critical errors that should prevent a merge run
    std::vector<std::string> warnings;    // Values replaced by defaults

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);

    // Parses an already loaded JSON text; `source` names it in messages.
    static ConfigLoadResult LoadFromString(const std::string& text, const std::string& source = "<string>");

private:
    static ConfigLoadResult Parse(const std::string& text,
                                  const std::string& source,
                                  const std::filesystem::path& baseDirectory);
    static void ValidateConfig(EngineConfig& config, ConfigLoadResult& result);
};

} // namespace mm::utils
