#include "mm/utils/Config.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "mm/core/Logger.hpp"

namespace mm::utils {

namespace {

constexpr int kMinWorkerThreads = 0;
constexpr int kMaxWorkerThreads = 64;

template <typename T>
static T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback, ConfigLoadResult& result) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        result.warnings.push_back(fmt::format("Failed to parse key '{}': {}", key, e.what()));
        return fallback;
    }
}

// Relative paths are resolved against `baseDirectory` when one is given.
void ApplyJson(const nlohmann::json& json, const std::filesystem::path& baseDirectory, ConfigLoadResult& result) {
    EngineConfig& config = result.config;

    const std::string platform = GetOrDefault<std::string>(json, "platform", "switch", result);
    if (platform == "switch" || platform == "nx") {
        config.platform = core::Endian::Little;
    } else if (platform == "wiiu") {
        config.platform = core::Endian::Big;
    } else {
        result.warnings.push_back(
            fmt::format("Unknown platform '{}', expected \"switch\" or \"wiiu\"; using switch", platform));
    }

    const int threads = GetOrDefault<int>(json, "workerThreads", 0, result);
    if (threads < kMinWorkerThreads || threads > kMaxWorkerThreads) {
        result.warnings.push_back(fmt::format("workerThreads ({}) should be between {} and {}, clamping",
                                              threads, kMinWorkerThreads, kMaxWorkerThreads));
    }
    config.workerThreads = static_cast<std::size_t>(std::clamp(threads, kMinWorkerThreads, kMaxWorkerThreads));

    const std::string logFile = GetOrDefault<std::string>(json, "logFile", {}, result);
    if (!logFile.empty()) {
        config.logFile = logFile;
        if (config.logFile.is_relative() && !baseDirectory.empty()) {
            config.logFile = (baseDirectory / config.logFile).lexically_normal();
        }
    }

    const std::string level = GetOrDefault<std::string>(json, "logLevel", "info", result);
    if (const auto parsed = core::ParseLogLevel(level)) {
        config.logLevel = *parsed;
    } else {
        result.warnings.push_back(fmt::format("Unknown logLevel '{}'; using info", level));
    }

    config.mergeGenericFormats = GetOrDefault<bool>(json, "mergeGenericFormats", config.mergeGenericFormats, result);
    config.compressOutput = GetOrDefault<bool>(json, "compressOutput", config.compressOutput, result);

    const std::string missing = GetOrDefault<std::string>(json, "missingResources", "fail", result);
    if (missing == "fail") {
        config.missingResources = content::MissingResourcePolicy::Fail;
    } else if (missing == "skip") {
        config.missingResources = content::MissingResourcePolicy::Skip;
    } else {
        result.warnings.push_back(
            fmt::format("Unknown missingResources policy '{}', expected \"fail\" or \"skip\"; using fail", missing));
    }
}

void Report(const ConfigLoadResult& result) {
    for (const auto& warning : result.warnings) {
        core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        core::Logger::Error("[ConfigLoader] {}", error);
    }
}

} // namespace

ConfigLoadResult ConfigLoader::LoadFromString(const std::string& text, const std::string& source) {
    return Parse(text, source, {});
}

ConfigLoadResult ConfigLoader::Parse(const std::string& text,
                                     const std::string& source,
                                     const std::filesystem::path& baseDirectory) {
    ConfigLoadResult result;

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        result.errors.push_back(fmt::format("Failed to parse JSON '{}': {}", source, e.what()));
        Report(result);
        return result;
    }

    if (!json.is_object()) {
        result.errors.push_back(fmt::format("Config '{}' must be a JSON object", source));
        Report(result);
        return result;
    }

    ApplyJson(json, baseDirectory, result);
    result.loadedFromFile = true;
    ValidateConfig(result.config, result);
    Report(result);
    return result;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        ConfigLoadResult result;
        result.warnings.push_back(fmt::format("Config file '{}' not found, using defaults",
                                              path.empty() ? "<none>" : path.string()));
        Report(result);
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        ConfigLoadResult result;
        result.errors.push_back(fmt::format("Failed to open config file '{}'", path.string()));
        Report(result);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    ConfigLoadResult result = Parse(buffer.str(), path.string(), path.parent_path());
    if (result.loadedFromFile) {
        core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    }
    return result;
}

void ConfigLoader::ValidateConfig(EngineConfig& config, ConfigLoadResult& result) {
    if (!config.logFile.empty()) {
        const auto parent = config.logFile.parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            result.warnings.push_back(
                fmt::format("Log file directory does not exist: {}", parent.string()));
        }
    }
}

} // namespace mm::utils
