#include "mm/merge/ResourceLoader.hpp"

#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"
#include "mm/formats/Sarc.hpp"
#include "mm/formats/Yaz0.hpp"
#include "mm/utils/PathUtil.hpp"

namespace mm::merge {

std::string ResourceLoader::Load(content::ResourceTable& table,
                                 std::string_view path,
                                 std::vector<std::uint8_t> bytes) const {
    std::string key = utils::CanonicalizePath(path);
    LoadKey(table, key, std::move(bytes));
    return key;
}

void ResourceLoader::LoadKey(content::ResourceTable& table,
                             const std::string& key,
                             std::vector<std::uint8_t> bytes) const {
    if (m_registry.MatchSchema(key)) {
        table.insert_or_assign(key, m_registry.IdentifyAndParse(key, std::move(bytes)));
        return;
    }

    const bool compressed = formats::yaz0::IsCompressed(bytes);
    const std::vector<std::uint8_t> plain = compressed ? formats::yaz0::Decompress(bytes, key)
                                                       : std::vector<std::uint8_t>{};
    const auto& data = compressed ? plain : bytes;

    if (formats::Sarc::IsSarc(data)) {
        const auto sarc = formats::Sarc::FromBinary(data, key);
        collections::SortedDeleteMap<std::string, std::string> entries;
        for (const auto& [name, member] : sarc.Files()) {
            std::string memberKey = utils::JoinArchivePath(key, name);
            LoadKey(table, memberKey, member);
            entries.Insert(name, std::move(memberKey));
        }
        core::Logger::Debug("[ResourceLoader] Expanded archive '{}' ({} members)", key, sarc.Size());
        table.insert_or_assign(key, content::ResourceData(content::SarcMap(std::move(entries))));
        return;
    }

    try {
        table.insert_or_assign(key, m_registry.IdentifyAndParse(key, bytes));
    } catch (const core::UnsupportedFormatError& e) {
        core::Logger::Debug("[ResourceLoader] Keeping '{}' as opaque binary: {}", key, e.what());
        table.insert_or_assign(
            key, content::ResourceData(content::BinaryResource(content::BinaryResource::Agnostic{std::move(bytes)})));
    }
}

} // namespace mm::merge
