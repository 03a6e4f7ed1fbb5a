#include "mm/content/GameData.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"
#include "mm/formats/Sarc.hpp"

namespace mm::content {

using formats::Byml;

namespace {

constexpr std::array<std::string_view, GameDataPack::kTableCount> kTableNames{
    "bool_array_data",
    "bool_data",
    "f32_array_data",
    "f32_data",
    "revival_bool_data",
    "revival_s32_data",
    "s32_array_data",
    "s32_data",
    "string32_data",
    "string64_array_data",
    "string64_data",
    "string256_array_data",
    "string256_data",
    "vector2f_array_data",
    "vector2f_data",
    "vector3f_array_data",
    "vector3f_data",
    "vector4f_data",
};

// The data type key stored inside a shard for a given table name.
std::string DataTypeFor(std::string_view table) {
    if (table == "string32_data") {
        return "string_data";
    }
    constexpr std::string_view kRevival = "revival_";
    if (table.starts_with(kRevival)) {
        table.remove_prefix(kRevival.size());
    }
    return std::string(table);
}

void RequireSameType(std::string_view operation, const GameData& lhs, const GameData& rhs) {
    if (lhs.DataType() != rhs.DataType()) {
        core::Logger::Error("[GameData] Attempted to {} different game data types: {} and {}",
                            operation, lhs.DataType(), rhs.DataType());
        throw core::SchemaMismatchError(operation, lhs.DataType(), rhs.DataType());
    }
}

} // namespace

GameData GameData::FromByml(const Byml& byml) {
    const auto& hash = byml.AsHash();
    if (hash.empty()) {
        throw core::ParseError(core::ParseErrorKind::MissingField, {}, "data type",
                               "game data file has no data type key");
    }
    const auto& [dataType, flags] = *hash.begin();
    GameData data(dataType);
    for (const auto& flag : flags.AsArray()) {
        data.m_flags.Insert(static_cast<std::uint32_t>(flag.At("HashValue").AsInteger()), flag);
    }
    return data;
}

Byml GameData::ToByml() const {
    Byml::Array flags;
    m_flags.ForEachPresent([&](std::uint32_t, const Byml& flag) { flags.push_back(flag); });
    Byml::Hash root;
    root.emplace(m_dataType, Byml(std::move(flags)));
    return Byml(std::move(root));
}

std::vector<GameData> GameData::Divide() const {
    std::vector<GameData> shards;
    m_flags.ForEachPresent([&](std::uint32_t hash, const Byml& flag) {
        if (shards.empty() || shards.back().m_flags.Size() == kShardCapacity) {
            shards.emplace_back(m_dataType);
        }
        shards.back().m_flags.Insert(hash, flag);
    });
    return shards;
}

GameData GameData::Diff(const GameData& modified) const {
    RequireSameType("diff", *this, modified);
    GameData diff(m_dataType);
    diff.m_flags = m_flags.Diff(modified.m_flags);
    return diff;
}

GameData GameData::Merge(const GameData& diff) const {
    RequireSameType("merge", *this, diff);
    GameData merged(m_dataType);
    merged.m_flags = m_flags.Merge(diff.m_flags);
    return merged;
}

const std::array<std::string_view, GameDataPack::kTableCount>& GameDataPack::TableNames() {
    return kTableNames;
}

GameDataPack::GameDataPack() {
    for (std::size_t i = 0; i < kTableCount; ++i) {
        m_tables[i] = GameData(DataTypeFor(kTableNames[i]));
    }
}

bool GameDataPack::PathMatches(std::string_view canonicalPath) {
    return canonicalPath.ends_with("GameData/gamedata.sarc");
}

GameDataPack GameDataPack::FromBinary(std::span<const std::uint8_t> data) {
    const auto sarc = formats::Sarc::FromBinary(data, kKindName);
    GameDataPack pack;
    for (const auto& [fileName, bytes] : sarc.Files()) {
        std::string_view name(fileName);
        while (name.starts_with('/')) {
            name.remove_prefix(1);
        }
        const auto table = std::find_if(kTableNames.begin(), kTableNames.end(),
                                        [&](std::string_view prefix) { return name.starts_with(prefix); });
        if (table == kTableNames.end()) {
            core::Logger::Debug("[GameData] Ignoring unrecognised file '{}' in game data pack", fileName);
            continue;
        }
        auto& target = pack.m_tables[static_cast<std::size_t>(table - kTableNames.begin())];
        const auto shard = GameData::FromByml(Byml::FromBinary(bytes, fileName));
        target = target.Merge(shard);
    }
    return pack;
}

std::vector<std::uint8_t> GameDataPack::ToBinary(core::Endian endian) const {
    formats::Sarc sarc(endian);
    for (std::size_t i = 0; i < kTableCount; ++i) {
        const auto shards = m_tables[i].Divide();
        for (std::size_t shard = 0; shard < shards.size(); ++shard) {
            sarc.AddFile(fmt::format("/{}_{}.bgdata", kTableNames[i], shard), shards[shard].ToByml().ToBinary(endian));
        }
    }
    return sarc.ToBinary();
}

GameDataPack GameDataPack::Diff(const GameDataPack& modified) const {
    GameDataPack diff;
    for (std::size_t i = 0; i < kTableCount; ++i) {
        diff.m_tables[i] = m_tables[i].Diff(modified.m_tables[i]);
    }
    return diff;
}

GameDataPack GameDataPack::Merge(const GameDataPack& diff) const {
    GameDataPack merged;
    for (std::size_t i = 0; i < kTableCount; ++i) {
        merged.m_tables[i] = m_tables[i].Merge(diff.m_tables[i]);
    }
    return merged;
}

std::size_t GameDataPack::IndexOf(std::string_view name) const {
    const auto it = std::find(kTableNames.begin(), kTableNames.end(), name);
    if (it == kTableNames.end()) {
        throw core::Error(fmt::format("Unknown game data table '{}'", name));
    }
    return static_cast<std::size_t>(it - kTableNames.begin());
}

const GameData& GameDataPack::Table(std::string_view name) const {
    return m_tables[IndexOf(name)];
}

GameData& GameDataPack::Table(std::string_view name) {
    return m_tables[IndexOf(name)];
}

} // namespace mm::content
