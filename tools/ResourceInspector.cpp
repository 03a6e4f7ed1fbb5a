#include <fmt/core.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "mm/content/ResourceRegistry.hpp"
#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"
#include "mm/formats/Byml.hpp"
#include "mm/formats/BymlJson.hpp"
#include "mm/formats/Yaz0.hpp"
#include "mm/merge/ResourceLoader.hpp"
#include "mm/utils/Config.hpp"

namespace {

void PrintUsage() {
    fmt::print("Usage: mm_inspect <path-to-resource> [--generic] [--config <modmerge.json>]\n");
}

void PrintMembers(const mm::content::ResourceTable& table, const mm::content::SarcMap& sarc, int depth) {
    for (const auto& [path, entry] : sarc.Entries()) {
        const auto it = table.find(entry.value);
        const std::string_view kind = it == table.end() ? "<missing>" : it->second.KindName();
        fmt::print("{:{}}{} [{}]\n", "", depth * 2, path, kind);
        if (it != table.end()) {
            if (const auto* nested = it->second.AsSarc()) {
                PrintMembers(table, *nested, depth + 1);
            }
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return EXIT_FAILURE;
    }

    const std::filesystem::path inputPath = argv[1];
    bool generic = false;
    std::filesystem::path configPath;
    for (int i = 2; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--generic") {
            generic = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            PrintUsage();
            return EXIT_FAILURE;
        }
    }

    mm::core::Logger::ConfigureFromEnvironment();
    mm::utils::EngineConfig config;
    if (!configPath.empty()) {
        const auto loaded = mm::utils::ConfigLoader::Load(configPath);
        if (loaded.HasErrors()) {
            return EXIT_FAILURE;
        }
        config = loaded.config;
        mm::core::Logger::SetMinimumLevel(config.logLevel);
        if (!config.logFile.empty()) {
            mm::core::Logger::SetLogFile(config.logFile);
        }
    }
    config.mergeGenericFormats = config.mergeGenericFormats || generic;

    if (!std::filesystem::exists(inputPath)) {
        fmt::print(stderr, "Error: file '{}' does not exist.\n", inputPath.string());
        return EXIT_FAILURE;
    }

    std::ifstream stream(inputPath, std::ios::binary);
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (!stream.good() && !stream.eof()) {
        fmt::print(stderr, "Error: failed to read '{}'.\n", inputPath.string());
        return EXIT_FAILURE;
    }

    mm::content::ResourceRegistry registry(mm::content::RegistryOptions{config.mergeGenericFormats});
    mm::merge::ResourceLoader loader(registry);

    try {
        mm::content::ResourceTable table;
        const std::string key = loader.Load(table, inputPath.generic_string(), bytes);
        const auto& root = table.at(key);

        fmt::print("Loaded '{}'\n", inputPath.string());
        fmt::print("  Key:           {}\n", key);
        fmt::print("  Kind:          {}\n", root.KindName());
        fmt::print("  Compressed:    {}\n", mm::formats::yaz0::IsCompressed(bytes));
        if (const auto& source = root.Source()) {
            fmt::print("  Endian:        {}\n", mm::core::ToString(source->endian));
        }

        mm::content::SerializeContext context;
        context.missingResources = config.missingResources;
        const auto rebuilt = root.ToBinary(config.platform, table, context, false, key);
        fmt::print("  Output ({}): {} bytes\n", mm::core::PlatformName(config.platform), rebuilt.size());

        if (const auto* sarc = root.AsSarc()) {
            fmt::print("\nMembers ({}):\n", sarc->Entries().Size());
            PrintMembers(table, *sarc, 1);
            return EXIT_SUCCESS;
        }

        const auto plain = mm::formats::yaz0::DecompressIfNeeded(bytes, key);
        if (mm::formats::Byml::IsByml(plain)) {
            const auto document = mm::formats::Byml::FromBinary(plain, key);
            fmt::print("\n{}\n", mm::formats::ToJson(document).dump(2));
        }
    } catch (const mm::core::Error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
