#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mm::merge {

/**
 * @brief Files a mod, or a merged set of mods, touches.
 *
 * Paths are relative to the base content root and the add-on content root
 * respectively, exactly as they appear on disk (".sbyml", not ".byml").
 */
struct Manifest {
    std::set<std::string> contentFiles;
    std::set<std::string> aocFiles;

    void Extend(const Manifest& other);
    void Clear();
    bool IsEmpty() const { return contentFiles.empty() && aocFiles.empty(); }

    // Canonical resource keys of every file, add-on keys under utils::kAocPrefix.
    std::vector<std::string> Resources() const;

    static std::string CanonicalKey(std::string_view path, bool aoc);

    bool operator==(const Manifest&) const = default;
};

struct ManifestLoadResult {
    bool success = false;
    Manifest manifest;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct ManifestSaveResult {
    bool success = false;
    std::vector<std::string> errors;
};

ManifestLoadResult LoadManifest(const std::filesystem::path& manifestPath);
ManifestLoadResult ParseManifest(const std::string& text);
ManifestSaveResult SaveManifest(const Manifest& manifest, const std::filesystem::path& manifestPath);
std::string SerializeManifest(const Manifest& manifest);

} // namespace mm::merge
