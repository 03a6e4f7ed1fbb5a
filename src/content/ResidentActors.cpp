#include "mm/content/ResidentActors.hpp"

namespace mm::content {

using formats::Byml;

bool ResidentActors::PathMatches(std::string_view canonicalPath) {
    return canonicalPath.ends_with("Actor/ResidentActors.byml");
}

ResidentActors ResidentActors::FromByml(const Byml& byml) {
    ResidentActors residents;
    for (const auto& entry : byml.AsArray()) {
        residents.m_actors.Insert(entry.At("name").AsString(), entry.At("only_res").AsBool());
    }
    return residents;
}

ResidentActors ResidentActors::FromBinary(std::span<const std::uint8_t> data) {
    return FromByml(Byml::FromBinary(data, kKindName));
}

Byml ResidentActors::ToByml() const {
    Byml::Array entries;
    m_actors.ForEachPresent([&](const std::string& name, bool onlyRes) {
        Byml::Hash entry;
        entry.emplace("name", Byml(name));
        entry.emplace("only_res", Byml(onlyRes));
        entries.emplace_back(std::move(entry));
    });
    return Byml(std::move(entries));
}

ResidentActors ResidentActors::Diff(const ResidentActors& modified) const {
    ResidentActors diff;
    diff.m_actors = m_actors.Diff(modified.m_actors);
    return diff;
}

ResidentActors ResidentActors::Merge(const ResidentActors& diff) const {
    ResidentActors merged;
    merged.m_actors = m_actors.Merge(diff.m_actors);
    return merged;
}

} // namespace mm::content
