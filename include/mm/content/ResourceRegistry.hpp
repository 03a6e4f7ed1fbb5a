#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "mm/content/ResourceData.hpp"

namespace mm::content {

struct RegistryOptions {
    // Parse unmatched parameter archives and BYML documents into typed generic
    // resources instead of passing them through as opaque bytes.
    bool mergeGenericFormats = false;
};

/**
 * @brief Maps a resource path and its bytes to a typed resource.
 *
 * Schemas are matched against the canonical path in a fixed priority order.
 * Unmatched data falls back on its magic: AAMP and BYML are recognised,
 * everything else raises core::UnsupportedFormatError.
 */
class ResourceRegistry {
public:
    using Parser = std::function<MergeableResource(std::span<const std::uint8_t>)>;

    struct Schema {
        std::string_view kind;
        bool (*matches)(std::string_view canonicalPath);
        Parser parse;
    };

    explicit ResourceRegistry(RegistryOptions options = {});

    const RegistryOptions& Options() const { return m_options; }
    const std::vector<Schema>& Schemas() const { return m_schemas; }

    // Kind of the first schema matching the canonical path.
    std::optional<std::string_view> MatchSchema(std::string_view canonicalPath) const;

    /**
     * Decompresses Yaz0 data, then parses by schema or magic. Parse failures
     * are rethrown as core::ParseError tagged with the path.
     */
    ResourceData IdentifyAndParse(std::string_view path, std::vector<std::uint8_t> bytes) const;

    // Byte order recorded in an AAMP, BYML or SARC header.
    static std::optional<core::Endian> DetectEndian(std::span<const std::uint8_t> data);

private:
    RegistryOptions m_options;
    std::vector<Schema> m_schemas;
};

} // namespace mm::content
