#include "mm/content/ResourceRegistry.hpp"

#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"
#include "mm/formats/Aamp.hpp"
#include "mm/formats/Byml.hpp"
#include "mm/formats/Sarc.hpp"
#include "mm/formats/Yaz0.hpp"
#include "mm/utils/PathUtil.hpp"

namespace mm::content {

namespace {

template <typename T>
ResourceRegistry::Schema MakeSchema() {
    return ResourceRegistry::Schema{
        T::kKindName,
        &T::PathMatches,
        [](std::span<const std::uint8_t> data) { return MergeableResource(T::FromBinary(data)); },
    };
}

} // namespace

ResourceRegistry::ResourceRegistry(RegistryOptions options)
    : m_options(options) {
    // Exact-path schemas first, then extension schemas.
    m_schemas.push_back(MakeSchema<ActorInfo>());
    m_schemas.push_back(MakeSchema<AreaData>());
    m_schemas.push_back(MakeSchema<ResidentActors>());
    m_schemas.push_back(MakeSchema<MainFieldStatic>());
    m_schemas.push_back(MakeSchema<GameDataPack>());
    m_schemas.push_back(MakeSchema<ActorLink>());
    m_schemas.push_back(MakeSchema<AttClientList>());
    m_schemas.push_back(MakeSchema<DropTable>());
    m_schemas.push_back(MakeSchema<GeneralParamList>());
}

std::optional<std::string_view> ResourceRegistry::MatchSchema(std::string_view canonicalPath) const {
    for (const auto& schema : m_schemas) {
        if (schema.matches(canonicalPath)) {
            return schema.kind;
        }
    }
    return std::nullopt;
}

std::optional<core::Endian> ResourceRegistry::DetectEndian(std::span<const std::uint8_t> data) {
    if (formats::Byml::IsByml(data)) {
        return formats::Byml::DetectEndian(data);
    }
    if (formats::aamp::ParameterIO::IsParameterIO(data) && data.size() >= 12) {
        return (data[8] & 1) != 0 ? core::Endian::Little : core::Endian::Big;
    }
    if (formats::Sarc::IsSarc(data)) {
        return data[6] == 0xFE ? core::Endian::Big : core::Endian::Little;
    }
    return std::nullopt;
}

ResourceData ResourceRegistry::IdentifyAndParse(std::string_view path, std::vector<std::uint8_t> bytes) const {
    const std::string canonical = utils::CanonicalizePath(path);
    const bool compressed = formats::yaz0::IsCompressed(bytes);

    try {
        std::vector<std::uint8_t> data = compressed ? formats::yaz0::Decompress(bytes, canonical) : bytes;

        for (const auto& schema : m_schemas) {
            if (!schema.matches(canonical)) {
                continue;
            }
            core::Logger::Debug("[ResourceRegistry] '{}' matched schema {}", canonical, schema.kind);
            auto resource = schema.parse(data);
            std::optional<SourceBytes> source;
            if (const auto endian = DetectEndian(data)) {
                source = SourceBytes{std::move(bytes), *endian, compressed};
            }
            return ResourceData(std::move(resource), std::move(source));
        }

        if (formats::aamp::ParameterIO::IsParameterIO(data)) {
            if (m_options.mergeGenericFormats) {
                const auto endian = DetectEndian(data).value_or(core::Endian::Little);
                auto resource = MergeableResource(GenericParameters::FromBinary(data));
                return ResourceData(std::move(resource), SourceBytes{std::move(bytes), endian, compressed});
            }
            return ResourceData(BinaryResource(BinaryResource::Agnostic{std::move(bytes)}));
        }

        if (formats::Byml::IsByml(data)) {
            const auto endian = formats::Byml::DetectEndian(data);
            if (m_options.mergeGenericFormats) {
                auto resource = MergeableResource(GenericDocument::FromBinary(data));
                return ResourceData(std::move(resource), SourceBytes{std::move(bytes), endian, compressed});
            }
            return ResourceData(BinaryResource::ForPlatform(endian, std::move(bytes)));
        }
    } catch (const core::ParseError& e) {
        throw e.WithResource(canonical);
    }

    throw core::UnsupportedFormatError(canonical, "no schema matches the path and the data has no known magic");
}

} // namespace mm::content
