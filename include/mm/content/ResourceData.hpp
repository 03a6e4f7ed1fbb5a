#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "mm/collections/DeleteMap.hpp"
#include "mm/content/MergeableResource.hpp"
#include "mm/core/Endian.hpp"

namespace mm::content {

class ResourceData;

// Canonical resource key to resource.
using ResourceTable = std::map<std::string, ResourceData>;

enum class MissingResourcePolicy {
    Fail,
    Skip
};

// Per-serialization state: how to treat dangling archive entries, and which were dropped.
struct SerializeContext {
    MissingResourcePolicy missingResources = MissingResourcePolicy::Fail;
    std::vector<std::string> skippedEntries;
};

/**
 * @brief Bytes the engine does not interpret.
 *
 * Agnostic data is identical on every platform. Platform data keeps the big
 * endian (Wii U) and little endian (Switch) variants side by side because the
 * same logical content differs byte for byte between them.
 */
class BinaryResource {
public:
    struct Agnostic {
        std::vector<std::uint8_t> data;
        bool operator==(const Agnostic&) const = default;
    };
    struct Platform {
        std::optional<std::vector<std::uint8_t>> wiiu;
        std::optional<std::vector<std::uint8_t>> nx;
        bool operator==(const Platform&) const = default;
    };

    BinaryResource() = default;
    BinaryResource(Agnostic agnostic) : m_data(std::move(agnostic)) {}
    BinaryResource(Platform platform) : m_data(std::move(platform)) {}

    static BinaryResource ForPlatform(core::Endian endian, std::vector<std::uint8_t> data);

    bool IsAgnostic() const { return std::holds_alternative<Agnostic>(m_data); }

    BinaryResource Diff(const BinaryResource& modified) const;
    BinaryResource Merge(const BinaryResource& diff) const;

    // Throws core::MissingResourceError when platform data lacks the requested variant.
    std::vector<std::uint8_t> ToBinary(core::Endian endian, std::string_view key = {}) const;

    bool operator==(const BinaryResource&) const = default;

private:
    std::variant<Agnostic, Platform> m_data;
};

/**
 * @brief An archive as a map from member path to canonical resource key.
 *
 * Members are resolved through the resource table at serialization time.
 */
class SarcMap {
public:
    SarcMap() = default;
    explicit SarcMap(collections::SortedDeleteMap<std::string, std::string> entries)
        : m_entries(std::move(entries)) {}

    const collections::SortedDeleteMap<std::string, std::string>& Entries() const { return m_entries; }
    collections::SortedDeleteMap<std::string, std::string>& Entries() { return m_entries; }

    SarcMap Diff(const SarcMap& modified) const { return SarcMap(m_entries.Diff(modified.m_entries)); }
    SarcMap Merge(const SarcMap& diff) const { return SarcMap(m_entries.Merge(diff.m_entries)); }

    std::vector<std::uint8_t> ToBinary(core::Endian endian,
                                       const ResourceTable& table,
                                       SerializeContext& context,
                                       std::string_view key = {}) const;

    bool operator==(const SarcMap&) const = default;

private:
    collections::SortedDeleteMap<std::string, std::string> m_entries;
};

// Original bytes a typed resource was parsed from, reused while it stays unchanged.
struct SourceBytes {
    std::vector<std::uint8_t> data;
    core::Endian endian = core::Endian::Little;
    bool compressed = false;
};

/**
 * @brief One entry of the merged resource tree: opaque bytes, a typed
 * resource or a nested archive.
 */
class ResourceData {
public:
    using Variant = std::variant<BinaryResource, MergeableResource, SarcMap>;

    ResourceData(BinaryResource binary) : m_value(std::move(binary)) {}
    ResourceData(MergeableResource resource, std::optional<SourceBytes> source = std::nullopt)
        : m_value(std::move(resource)), m_source(std::move(source)) {}
    ResourceData(SarcMap sarc) : m_value(std::move(sarc)) {}

    const BinaryResource* AsBinary() const { return std::get_if<BinaryResource>(&m_value); }
    const MergeableResource* AsMergeable() const { return std::get_if<MergeableResource>(&m_value); }
    const SarcMap* AsSarc() const { return std::get_if<SarcMap>(&m_value); }
    const Variant& Value() const { return m_value; }
    const std::optional<SourceBytes>& Source() const { return m_source; }

    std::string_view KindName() const;

    ResourceData Diff(const ResourceData& modified) const;
    ResourceData Merge(const ResourceData& diff) const;

    /**
     * Serializes for the given platform, resolving archive members through the
     * table. With `compress` the result is Yaz0 compressed; opaque binary data
     * is always returned exactly as it was loaded.
     */
    std::vector<std::uint8_t> ToBinary(core::Endian endian,
                                       const ResourceTable& table,
                                       SerializeContext& context,
                                       bool compress = false,
                                       std::string_view key = {}) const;

    // Compares the resource values; retained source bytes do not participate.
    bool operator==(const ResourceData& other) const { return m_value == other.m_value; }

private:
    Variant m_value;
    std::optional<SourceBytes> m_source;
};

} // namespace mm::content
