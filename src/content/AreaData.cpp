#include "mm/content/AreaData.hpp"

namespace mm::content {

using formats::Byml;

bool AreaData::PathMatches(std::string_view canonicalPath) {
    return canonicalPath.ends_with("Ecosystem/AreaData.byml");
}

AreaData AreaData::FromByml(const Byml& byml) {
    AreaData data;
    for (const auto& area : byml.AsArray()) {
        data.m_areas.Insert(area.At("AreaNumber").AsInteger(), area);
    }
    return data;
}

AreaData AreaData::FromBinary(std::span<const std::uint8_t> data) {
    return FromByml(Byml::FromBinary(data, kKindName));
}

Byml AreaData::ToByml() const {
    Byml::Array areas;
    m_areas.ForEachPresent([&](std::int64_t, const Byml& area) { areas.push_back(area); });
    return Byml(std::move(areas));
}

AreaData AreaData::Diff(const AreaData& modified) const {
    return AreaData(m_areas.Diff(modified.m_areas));
}

AreaData AreaData::Merge(const AreaData& diff) const {
    return AreaData(m_areas.Merge(diff.m_areas));
}

} // namespace mm::content
