#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mm/collections/DeleteMap.hpp"
#include "mm/collections/DeleteVec.hpp"
#include "mm/core/Endian.hpp"
#include "mm/formats/Byml.hpp"

namespace mm::content {

struct EntryPos {
    formats::Byml rotate;
    formats::Byml translate;
    std::optional<std::string> playerState;

    bool operator==(const EntryPos&) const = default;
};

/**
 * @brief Main field static map data (Map/MainField/Static.mubin).
 *
 * StartPos entries are grouped by map and then by position name. Every other
 * top-level array is treated as an unordered set of objects.
 */
class MainFieldStatic {
public:
    static constexpr std::string_view kKindName = "MainFieldStatic";

    using StartPositions = collections::DeleteMap<std::string, collections::DeleteMap<std::string, EntryPos>>;

    static bool PathMatches(std::string_view canonicalPath);
    static MainFieldStatic FromByml(const formats::Byml& byml);
    static MainFieldStatic FromBinary(std::span<const std::uint8_t> data);

    formats::Byml ToByml() const;
    std::vector<std::uint8_t> ToBinary(core::Endian endian) const { return ToByml().ToBinary(endian); }

    MainFieldStatic Diff(const MainFieldStatic& modified) const;
    MainFieldStatic Merge(const MainFieldStatic& diff) const;

    const std::map<std::string, collections::DeleteVec<formats::Byml>>& General() const { return m_general; }
    std::map<std::string, collections::DeleteVec<formats::Byml>>& General() { return m_general; }
    const StartPositions& StartPos() const { return m_startPos; }
    StartPositions& StartPos() { return m_startPos; }

    bool operator==(const MainFieldStatic&) const = default;

private:
    std::map<std::string, collections::DeleteVec<formats::Byml>> m_general;
    StartPositions m_startPos;
};

} // namespace mm::content
