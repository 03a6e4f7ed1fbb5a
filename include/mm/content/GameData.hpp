#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mm/collections/DeleteMap.hpp"
#include "mm/core/Endian.hpp"
#include "mm/formats/Byml.hpp"

namespace mm::content {

/**
 * @brief One logical game flag table.
 *
 * On disk a table is split into numbered .bgdata shards of at most
 * kShardCapacity flags each; in memory all shards of one kind are joined into
 * a single map keyed by the flag's HashValue.
 */
class GameData {
public:
    static constexpr std::size_t kShardCapacity = 4096;

    GameData() = default;
    explicit GameData(std::string dataType) : m_dataType(std::move(dataType)) {}

    // A single shard document: { <data type>: [ flag, ... ] }.
    static GameData FromByml(const formats::Byml& byml);
    formats::Byml ToByml() const;

    // Splits into ceil(count / kShardCapacity) tables; an empty table yields none.
    std::vector<GameData> Divide() const;

    GameData Diff(const GameData& modified) const;
    GameData Merge(const GameData& diff) const;

    const std::string& DataType() const { return m_dataType; }
    const collections::SortedDeleteMap<std::uint32_t, formats::Byml>& Flags() const { return m_flags; }
    collections::SortedDeleteMap<std::uint32_t, formats::Byml>& Flags() { return m_flags; }

    bool operator==(const GameData&) const = default;

private:
    std::string m_dataType;
    collections::SortedDeleteMap<std::uint32_t, formats::Byml> m_flags;
};

/**
 * @brief The game flag archive (GameData/gamedata.sarc) as one resource.
 *
 * Holds the eighteen flag tables defragmented; ToBinary re-shards them into a
 * fresh archive.
 */
class GameDataPack {
public:
    static constexpr std::string_view kKindName = "GameDataPack";
    static constexpr std::size_t kTableCount = 18;

    // Shard file name prefixes, in archive order.
    static const std::array<std::string_view, kTableCount>& TableNames();

    GameDataPack();

    static bool PathMatches(std::string_view canonicalPath);
    static GameDataPack FromBinary(std::span<const std::uint8_t> data);
    std::vector<std::uint8_t> ToBinary(core::Endian endian) const;

    GameDataPack Diff(const GameDataPack& modified) const;
    GameDataPack Merge(const GameDataPack& diff) const;

    const GameData& Table(std::string_view name) const;
    GameData& Table(std::string_view name);

    bool operator==(const GameDataPack&) const = default;

private:
    std::size_t IndexOf(std::string_view name) const;

    std::array<GameData, kTableCount> m_tables;
};

} // namespace mm::content
