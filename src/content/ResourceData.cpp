#include "mm/content/ResourceData.hpp"

#include <fmt/format.h>

#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"
#include "mm/formats/Sarc.hpp"
#include "mm/formats/Yaz0.hpp"
#include "mm/utils/PathUtil.hpp"

namespace mm::content {

namespace {

std::vector<std::uint8_t> MaybeCompress(std::vector<std::uint8_t> data, bool compress) {
    return compress ? formats::yaz0::Compress(data) : data;
}

std::string_view VariantName(const ResourceData::Variant& value) {
    switch (value.index()) {
        case 0:  return "Binary";
        case 1:  return std::get<MergeableResource>(value).KindName();
        default: return "Sarc";
    }
}

} // namespace

BinaryResource BinaryResource::ForPlatform(core::Endian endian, std::vector<std::uint8_t> data) {
    Platform platform;
    if (endian == core::Endian::Big) {
        platform.wiiu = std::move(data);
    } else {
        platform.nx = std::move(data);
    }
    return BinaryResource(std::move(platform));
}

BinaryResource BinaryResource::Diff(const BinaryResource& modified) const {
    if (IsAgnostic() && modified.IsAgnostic()) {
        return modified;
    }
    const auto* base = std::get_if<Platform>(&m_data);
    const auto* other = std::get_if<Platform>(&modified.m_data);
    if (!base || !other) {
        throw core::SchemaMismatchError("diff", IsAgnostic() ? "agnostic binary" : "platform binary",
                                        modified.IsAgnostic() ? "agnostic binary" : "platform binary");
    }
    Platform diff;
    if (base->wiiu != other->wiiu) {
        diff.wiiu = other->wiiu;
    }
    if (base->nx != other->nx) {
        diff.nx = other->nx;
    }
    return BinaryResource(std::move(diff));
}

BinaryResource BinaryResource::Merge(const BinaryResource& diff) const {
    if (IsAgnostic() && diff.IsAgnostic()) {
        return diff;
    }
    const auto* base = std::get_if<Platform>(&m_data);
    const auto* other = std::get_if<Platform>(&diff.m_data);
    if (!base || !other) {
        throw core::SchemaMismatchError("merge", IsAgnostic() ? "agnostic binary" : "platform binary",
                                        diff.IsAgnostic() ? "agnostic binary" : "platform binary");
    }
    Platform merged;
    merged.wiiu = other->wiiu ? other->wiiu : base->wiiu;
    merged.nx = other->nx ? other->nx : base->nx;
    return BinaryResource(std::move(merged));
}

std::vector<std::uint8_t> BinaryResource::ToBinary(core::Endian endian, std::string_view key) const {
    if (const auto* agnostic = std::get_if<Agnostic>(&m_data)) {
        return agnostic->data;
    }
    const auto& platform = std::get<Platform>(m_data);
    const auto& data = endian == core::Endian::Big ? platform.wiiu : platform.nx;
    if (!data) {
        throw core::MissingResourceError(key, key, fmt::format("no binary data for {}", core::PlatformName(endian)));
    }
    return *data;
}

std::vector<std::uint8_t> SarcMap::ToBinary(core::Endian endian,
                                            const ResourceTable& table,
                                            SerializeContext& context,
                                            std::string_view key) const {
    formats::Sarc sarc(endian);
    for (const auto& [path, entry] : m_entries) {
        if (entry.deleted) {
            continue;
        }
        const auto& canonical = entry.value;
        const auto it = table.find(canonical);
        if (it == table.end()) {
            if (context.missingResources == MissingResourcePolicy::Skip) {
                core::Logger::Warning("[SarcMap] Skipping '{}' in '{}': no resource '{}'", path, key, canonical);
                context.skippedEntries.push_back(canonical);
                continue;
            }
            throw core::MissingResourceError(path, canonical, fmt::format("referenced by archive '{}'", key));
        }
        const bool compress = !it->second.AsBinary() && utils::HasCompressedExtension(path);
        sarc.AddFile(path, it->second.ToBinary(endian, table, context, compress, canonical));
    }
    return sarc.ToBinary();
}

std::string_view ResourceData::KindName() const {
    return VariantName(m_value);
}

ResourceData ResourceData::Diff(const ResourceData& modified) const {
    return std::visit(
        [&](const auto& base, const auto& other) -> ResourceData {
            using A = std::decay_t<decltype(base)>;
            using B = std::decay_t<decltype(other)>;
            if constexpr (std::is_same_v<A, B>) {
                return ResourceData(base.Diff(other));
            } else {
                core::Logger::Error("[ResourceData] Tried to diff {} against {}", KindName(), modified.KindName());
                throw core::SchemaMismatchError("diff", KindName(), modified.KindName());
            }
        },
        m_value, modified.m_value);
}

ResourceData ResourceData::Merge(const ResourceData& diff) const {
    return std::visit(
        [&](const auto& base, const auto& other) -> ResourceData {
            using A = std::decay_t<decltype(base)>;
            using B = std::decay_t<decltype(other)>;
            if constexpr (std::is_same_v<A, B>) {
                return ResourceData(base.Merge(other));
            } else {
                core::Logger::Error("[ResourceData] Tried to merge {} onto {}", diff.KindName(), KindName());
                throw core::SchemaMismatchError("merge", KindName(), diff.KindName());
            }
        },
        m_value, diff.m_value);
}

std::vector<std::uint8_t> ResourceData::ToBinary(core::Endian endian,
                                                 const ResourceTable& table,
                                                 SerializeContext& context,
                                                 bool compress,
                                                 std::string_view key) const {
    if (const auto* binary = AsBinary()) {
        return binary->ToBinary(endian, key);
    }
    if (const auto* sarc = AsSarc()) {
        return MaybeCompress(sarc->ToBinary(endian, table, context, key), compress);
    }

    const auto& resource = std::get<MergeableResource>(m_value);
    if (m_source && m_source->endian == resource.OutputEndian(endian)) {
        if (m_source->compressed == compress) {
            return m_source->data;
        }
        if (m_source->compressed) {
            return formats::yaz0::Decompress(m_source->data, key);
        }
        return formats::yaz0::Compress(m_source->data);
    }
    return MaybeCompress(resource.ToBinary(endian), compress);
}

} // namespace mm::content
