#include "mm/content/MainFieldStatic.hpp"

#include "mm/core/Error.hpp"

namespace mm::content {

using formats::Byml;

namespace {

constexpr std::string_view kStartPosKey = "StartPos";

} // namespace

bool MainFieldStatic::PathMatches(std::string_view canonicalPath) {
    return canonicalPath.ends_with("Map/MainField/Static.mubin");
}

MainFieldStatic MainFieldStatic::FromByml(const Byml& byml) {
    MainFieldStatic result;
    for (const auto& entry : byml.At(kStartPosKey).AsArray()) {
        const auto& map = entry.At("Map").AsString();
        const Byml* posName = entry.Find("PosName");
        if (!posName) {
            continue;
        }
        EntryPos pos;
        pos.rotate = entry.At("Rotate");
        pos.translate = entry.At("Translate");
        if (const Byml* state = entry.Find("PlayerState")) {
            pos.playerState = state->AsString();
        }

        if (auto* positions = result.m_startPos.Get(map)) {
            positions->Insert(posName->AsString(), std::move(pos));
        } else {
            collections::DeleteMap<std::string, EntryPos> positionsForMap;
            positionsForMap.Insert(posName->AsString(), std::move(pos));
            result.m_startPos.Insert(map, std::move(positionsForMap));
        }
    }

    for (const auto& [key, value] : byml.AsHash()) {
        if (key == kStartPosKey) {
            continue;
        }
        collections::DeleteVec<Byml> entries;
        for (const auto& item : value.AsArray()) {
            entries.Insert(item);
        }
        result.m_general.emplace(key, std::move(entries));
    }
    return result;
}

MainFieldStatic MainFieldStatic::FromBinary(std::span<const std::uint8_t> data) {
    return FromByml(Byml::FromBinary(data, kKindName));
}

Byml MainFieldStatic::ToByml() const {
    Byml::Array startPos;
    m_startPos.ForEachPresent([&](const std::string& map, const collections::DeleteMap<std::string, EntryPos>& positions) {
        positions.ForEachPresent([&](const std::string& posName, const EntryPos& pos) {
            Byml::Hash entry;
            entry.emplace("Map", Byml(map));
            entry.emplace("PosName", Byml(posName));
            entry.emplace("Rotate", pos.rotate);
            entry.emplace("Translate", pos.translate);
            if (pos.playerState) {
                entry.emplace("PlayerState", Byml(*pos.playerState));
            }
            startPos.emplace_back(std::move(entry));
        });
    });

    Byml::Hash root;
    for (const auto& [key, entries] : m_general) {
        root.emplace(key, Byml(entries.Values()));
    }
    root.insert_or_assign(std::string(kStartPosKey), Byml(std::move(startPos)));
    return Byml(std::move(root));
}

MainFieldStatic MainFieldStatic::Diff(const MainFieldStatic& modified) const {
    MainFieldStatic diff;
    for (const auto& [key, entries] : modified.m_general) {
        const auto it = m_general.find(key);
        if (it == m_general.end()) {
            diff.m_general.emplace(key, entries);
        } else if (!(it->second == entries)) {
            diff.m_general.emplace(key, it->second.Diff(entries));
        }
    }
    diff.m_startPos = m_startPos.DeepDiff(modified.m_startPos);
    return diff;
}

MainFieldStatic MainFieldStatic::Merge(const MainFieldStatic& diff) const {
    MainFieldStatic merged;
    merged.m_general = m_general;
    for (const auto& [key, entries] : diff.m_general) {
        const auto it = m_general.find(key);
        if (it == m_general.end()) {
            merged.m_general.insert_or_assign(key, entries);
        } else {
            merged.m_general.insert_or_assign(key, it->second.Merge(entries));
        }
    }
    merged.m_startPos = m_startPos.DeepMerge(diff.m_startPos);
    return merged;
}

} // namespace mm::content
