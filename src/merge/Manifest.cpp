#include "mm/merge/Manifest.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "mm/utils/PathUtil.hpp"

namespace mm::merge {
namespace {

void ReadSection(const nlohmann::json& json,
                 const char* key,
                 std::set<std::string>& out,
                 ManifestLoadResult& result) {
    if (!json.contains(key)) {
        return;
    }
    const auto& section = json[key];
    if (!section.is_array()) {
        result.errors.push_back("'" + std::string(key) + "' section must be an array of file paths");
        return;
    }
    for (std::size_t i = 0; i < section.size(); ++i) {
        if (!section[i].is_string()) {
            result.warnings.push_back("'" + std::string(key) + "' entry at index " + std::to_string(i) +
                                      " is not a string, skipping");
            continue;
        }
        std::string path = section[i].get<std::string>();
        if (path.empty()) {
            result.warnings.push_back("'" + std::string(key) + "' entry at index " + std::to_string(i) +
                                      " is empty, skipping");
            continue;
        }
        out.insert(std::move(path));
    }
}

} // namespace

void Manifest::Extend(const Manifest& other) {
    contentFiles.insert(other.contentFiles.begin(), other.contentFiles.end());
    aocFiles.insert(other.aocFiles.begin(), other.aocFiles.end());
}

void Manifest::Clear() {
    contentFiles.clear();
    aocFiles.clear();
}

std::string Manifest::CanonicalKey(std::string_view path, bool aoc) {
    if (!aoc) {
        return utils::CanonicalizePath(path);
    }
    std::string key(utils::kAocPrefix);
    key.append(utils::CanonicalizePath(path));
    return key;
}

std::vector<std::string> Manifest::Resources() const {
    std::vector<std::string> keys;
    keys.reserve(contentFiles.size() + aocFiles.size());
    for (const auto& file : contentFiles) {
        keys.push_back(CanonicalKey(file, false));
    }
    for (const auto& file : aocFiles) {
        keys.push_back(CanonicalKey(file, true));
    }
    return keys;
}

ManifestLoadResult ParseManifest(const std::string& text) {
    ManifestLoadResult result;

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        result.errors.push_back(std::string("Failed to parse manifest JSON: ") + ex.what());
        return result;
    }

    if (!json.is_object()) {
        result.errors.push_back("Manifest must be a JSON object with 'content' and 'aoc' arrays");
        return result;
    }

    ReadSection(json, "content", result.manifest.contentFiles, result);
    ReadSection(json, "aoc", result.manifest.aocFiles, result);
    result.success = result.errors.empty();
    return result;
}

ManifestLoadResult LoadManifest(const std::filesystem::path& manifestPath) {
    std::ifstream file(manifestPath);
    if (!file.is_open()) {
        ManifestLoadResult result;
        result.errors.push_back("Failed to open manifest: " + manifestPath.string());
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseManifest(buffer.str());
}

std::string SerializeManifest(const Manifest& manifest) {
    nlohmann::json json;
    json["content"] = manifest.contentFiles;
    json["aoc"] = manifest.aocFiles;
    return json.dump(2);
}

ManifestSaveResult SaveManifest(const Manifest& manifest, const std::filesystem::path& manifestPath) {
    ManifestSaveResult result;

    std::error_code ec;
    const auto parent = manifestPath.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            result.errors.push_back("Cannot create directory '" + parent.string() + "': " + ec.message());
            return result;
        }
    }

    std::ofstream file(manifestPath, std::ios::trunc);
    if (!file.is_open()) {
        result.errors.push_back("Failed to open manifest for writing: " + manifestPath.string());
        return result;
    }
    file << SerializeManifest(manifest) << '\n';
    if (!file) {
        result.errors.push_back("Failed to write manifest: " + manifestPath.string());
        return result;
    }
    result.success = true;
    return result;
}

} // namespace mm::merge
