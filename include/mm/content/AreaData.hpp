#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "mm/collections/DeleteMap.hpp"
#include "mm/core/Endian.hpp"
#include "mm/formats/Byml.hpp"

namespace mm::content {

// Ecosystem area table (Ecosystem/AreaData.byml), one whole entry per AreaNumber.
class AreaData {
public:
    static constexpr std::string_view kKindName = "AreaData";

    AreaData() = default;
    explicit AreaData(collections::SortedDeleteMap<std::int64_t, formats::Byml> areas) : m_areas(std::move(areas)) {}

    static bool PathMatches(std::string_view canonicalPath);
    static AreaData FromByml(const formats::Byml& byml);
    static AreaData FromBinary(std::span<const std::uint8_t> data);

    formats::Byml ToByml() const;
    std::vector<std::uint8_t> ToBinary(core::Endian endian) const { return ToByml().ToBinary(endian); }

    AreaData Diff(const AreaData& modified) const;
    AreaData Merge(const AreaData& diff) const;

    const collections::SortedDeleteMap<std::int64_t, formats::Byml>& Areas() const { return m_areas; }
    collections::SortedDeleteMap<std::int64_t, formats::Byml>& Areas() { return m_areas; }

    bool operator==(const AreaData&) const = default;

private:
    collections::SortedDeleteMap<std::int64_t, formats::Byml> m_areas;
};

} // namespace mm::content
