#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace mm::merge {

/**
 * @brief Read access to unmodified game files.
 *
 * Paths are relative to the content root, or start with utils::kAocPrefix for
 * add-on content. A path may descend into archives with "//" separators
 * ("Pack/Bootup.pack//Ecosystem/AreaData.sbyml").
 */
class DumpSource {
public:
    virtual ~DumpSource() = default;

    // Bytes of a plain file, or nothing when the dump lacks it.
    virtual std::optional<std::vector<std::uint8_t>> ReadFile(std::string_view path) const = 0;

    // Like ReadFile but resolves archive members; member bytes are returned as stored.
    std::optional<std::vector<std::uint8_t>> Read(std::string_view path) const;

    // Throws core::MissingResourceError when neither path resolves.
    std::vector<std::uint8_t> GetFromSarc(std::string_view primaryPath, std::string_view fallbackPath) const;
};

// Unpacked dump on disk: a content directory and an optional add-on directory.
class DirectoryDump : public DumpSource {
public:
    explicit DirectoryDump(std::filesystem::path contentRoot, std::filesystem::path aocRoot = {});

    std::optional<std::vector<std::uint8_t>> ReadFile(std::string_view path) const override;

    const std::filesystem::path& ContentRoot() const { return m_contentRoot; }
    const std::filesystem::path& AocRoot() const { return m_aocRoot; }

private:
    std::filesystem::path m_contentRoot;
    std::filesystem::path m_aocRoot;
};

} // namespace mm::merge
